/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "imu/OrientationEstimator.h"
#include "measurement/MeasurementConfig.h"
#include "measurement/ResultAggregator.h"
#include "session/ContinuousSession.h"
#include "session/IScaleReadingSource.h"
#include "session/TareEstimator.h"

#include <memory>
#include <optional>
#include <string>

#include <rclcpp/node.hpp>
#include <rclcpp/publisher.hpp>
#include <rclcpp/service.hpp>
#include <rclcpp/subscription.hpp>
#include <sensor_msgs/msg/imu.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_msgs/msg/float64.hpp>
#include <std_srvs/srv/trigger.hpp>

namespace SEASCALE
{
namespace ROS
{

/*!
 * \brief Motion-compensated weighing on a moving platform
 *
 * Consumes the IMU stream and the latest scale value, publishes live
 * stability, and runs continuous weighing sessions on request.
 */
class WeighingNode : public rclcpp::Node, public Session::IScaleReadingSource
{
public:
  WeighingNode();
  ~WeighingNode() override;

  bool Initialize();
  void Deinitialize();

  // Implementation of IScaleReadingSource
  double GetCurrentScaleReading() override;

private:
  // ROS interface
  void OnImu(const sensor_msgs::msg::Imu::ConstSharedPtr& msg);
  void OnScaleReading(const std_msgs::msg::Float64::ConstSharedPtr& msg);
  void OnTareReading(const std_msgs::msg::Float64::ConstSharedPtr& msg);
  void OnStartSession(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                      std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void OnStopSession(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                     std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void OnReloadConfig(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                      std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  // Configuration
  Measurement::MeasurementConfig ReadConfigParameters(
      const Measurement::MeasurementConfig& defaults);
  void ApplyConfig(const Measurement::MeasurementConfig& cfg);

  void PublishDouble(const rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr& publisher,
                     double value);

  double NowMs() const;

  // Session start/stop stamps, in the timebase of the IMU samples
  double SessionStampMs() const;

  // ROS parameters
  std::string m_configFile;
  bool m_motionCorrection{true};

  // ROS publishers
  rclcpp::Publisher<std_msgs::msg::Bool>::SharedPtr m_stablePublisher;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr m_confidencePublisher;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr m_verticalAccelPublisher;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr m_fixedMassPublisher;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr m_errorBandPublisher;

  // ROS subscribers
  rclcpp::Subscription<sensor_msgs::msg::Imu>::SharedPtr m_imuSubscriber;
  rclcpp::Subscription<std_msgs::msg::Float64>::SharedPtr m_scaleSubscriber;
  rclcpp::Subscription<std_msgs::msg::Float64>::SharedPtr m_tareSubscriber;

  // ROS services
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr m_startService;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr m_stopService;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr m_reloadService;

  // Measurement state
  Measurement::MeasurementConfig m_config;
  std::unique_ptr<IMU::OrientationEstimator> m_estimator;
  std::unique_ptr<Session::ContinuousSession> m_session;
  std::unique_ptr<Measurement::ResultAggregator> m_aggregator;
  Session::TareEstimator m_tare;
  std::optional<double> m_latestScaleReading;
  std::optional<double> m_lastImuStampMs;
};

} // namespace ROS
} // namespace SEASCALE
