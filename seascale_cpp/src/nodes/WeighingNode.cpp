/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "WeighingNode.h"

#include "measurement/io/MeasurementConfigFile.h"
#include "utils/LogUtils.h"

#include <cmath>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include <rclcpp/rclcpp.hpp>

using namespace SEASCALE;
using namespace ROS;

using std::placeholders::_1;
using std::placeholders::_2;

namespace
{

// Default node name
constexpr const char* NODE_NAME = "seascale_weighing_node";

// ROS topics
constexpr const char* IMU_TOPIC = "imu";
constexpr const char* SCALE_READING_TOPIC = "scale_reading";
constexpr const char* TARE_READING_TOPIC = "tare_reading";
constexpr const char* STABLE_TOPIC = "measurement_stable";
constexpr const char* CONFIDENCE_TOPIC = "measurement_confidence";
constexpr const char* VERTICAL_ACCEL_TOPIC = "vertical_accel";
constexpr const char* FIXED_MASS_TOPIC = "fixed_mass";
constexpr const char* ERROR_BAND_TOPIC = "fixed_mass_error_band";

// ROS services
constexpr const char* START_SESSION_SERVICE = "start_session";
constexpr const char* STOP_SESSION_SERVICE = "stop_session";
constexpr const char* RELOAD_CONFIG_SERVICE = "reload_config";

// ROS parameters
constexpr const char* DEFAULT_LOG_LEVEL = "info";
constexpr bool DEFAULT_MOTION_CORRECTION = true;

// Units: degrees per radian
constexpr double DEG_PER_RAD = 180.0 / M_PI;

// Units: nanoseconds per millisecond
constexpr double NS_PER_MS = 1e6;
} // namespace

WeighingNode::WeighingNode() : rclcpp::Node(NODE_NAME)
{
  declare_parameter("config_file", std::string());
  declare_parameter("motion_correction", DEFAULT_MOTION_CORRECTION);
  declare_parameter("log_level", std::string(DEFAULT_LOG_LEVEL));

  m_configFile = get_parameter("config_file").as_string();
  m_motionCorrection = get_parameter("motion_correction").as_bool();
}

WeighingNode::~WeighingNode() = default;

bool WeighingNode::Initialize()
{
  UTILS::LogUtils::InitializeLogging(*this, get_parameter("log_level").as_string());

  // File values become the parameter defaults, explicit parameters win
  Measurement::MeasurementConfig fileConfig;
  if (!m_configFile.empty())
  {
    Measurement::MeasurementConfigFile file;
    if (file.Load(m_configFile, fileConfig))
    {
      RCLCPP_INFO(get_logger(), "Loaded measurement config: %s", m_configFile.c_str());
    }
    else
    {
      RCLCPP_ERROR(get_logger(), "Failed to load measurement config: %s", m_configFile.c_str());
      return false;
    }
  }

  const Measurement::MeasurementConfig cfg = ReadConfigParameters(fileConfig);

  const char* reason = nullptr;
  if (!Measurement::IsValid(cfg, &reason))
  {
    RCLCPP_ERROR(get_logger(), "Invalid measurement parameter: %s", reason);
    return false;
  }

  m_config = cfg;
  m_estimator = std::make_unique<IMU::OrientationEstimator>(m_config);
  m_session = std::make_unique<Session::ContinuousSession>(m_config, *this);
  m_aggregator = std::make_unique<Measurement::ResultAggregator>(m_config);

  RCLCPP_INFO(get_logger(), "Motion correction: %s", m_motionCorrection ? "on" : "off");
  RCLCPP_INFO(get_logger(), "Gravity filter alpha: %.3f", m_config.gravity_filter_alpha);
  RCLCPP_INFO(get_logger(), "Live window: %.1f s, scale rate: %.1f Hz",
              m_config.live_window_duration_s, m_config.scale_sample_rate_hz);

  // Initialize publishers
  m_stablePublisher = create_publisher<std_msgs::msg::Bool>(STABLE_TOPIC, rclcpp::QoS{1});
  m_confidencePublisher =
      create_publisher<std_msgs::msg::Float64>(CONFIDENCE_TOPIC, rclcpp::QoS{1});
  m_verticalAccelPublisher =
      create_publisher<std_msgs::msg::Float64>(VERTICAL_ACCEL_TOPIC, rclcpp::QoS{1});
  m_fixedMassPublisher = create_publisher<std_msgs::msg::Float64>(FIXED_MASS_TOPIC, rclcpp::QoS{1});
  m_errorBandPublisher = create_publisher<std_msgs::msg::Float64>(ERROR_BAND_TOPIC, rclcpp::QoS{1});

  // Initialize subscribers
  m_imuSubscriber = create_subscription<sensor_msgs::msg::Imu>(
      IMU_TOPIC, {10}, [this](const sensor_msgs::msg::Imu::ConstSharedPtr& msg) { OnImu(msg); });
  m_scaleSubscriber = create_subscription<std_msgs::msg::Float64>(
      SCALE_READING_TOPIC, {1},
      [this](const std_msgs::msg::Float64::ConstSharedPtr& msg) { OnScaleReading(msg); });
  m_tareSubscriber = create_subscription<std_msgs::msg::Float64>(
      TARE_READING_TOPIC, {10},
      [this](const std_msgs::msg::Float64::ConstSharedPtr& msg) { OnTareReading(msg); });

  // Initialize services
  m_startService = create_service<std_srvs::srv::Trigger>(
      START_SESSION_SERVICE, std::bind(&WeighingNode::OnStartSession, this, _1, _2));
  m_stopService = create_service<std_srvs::srv::Trigger>(
      STOP_SESSION_SERVICE, std::bind(&WeighingNode::OnStopSession, this, _1, _2));
  m_reloadService = create_service<std_srvs::srv::Trigger>(
      RELOAD_CONFIG_SERVICE, std::bind(&WeighingNode::OnReloadConfig, this, _1, _2));

  return true;
}

void WeighingNode::Deinitialize()
{
  m_reloadService.reset();
  m_stopService.reset();
  m_startService.reset();
  m_tareSubscriber.reset();
  m_scaleSubscriber.reset();
  m_imuSubscriber.reset();

  m_session.reset();
  m_estimator.reset();
  m_aggregator.reset();
  m_latestScaleReading.reset();
  m_lastImuStampMs.reset();
}

double WeighingNode::GetCurrentScaleReading()
{
  return m_latestScaleReading.value_or(0.0);
}

void WeighingNode::OnImu(const sensor_msgs::msg::Imu::ConstSharedPtr& msg)
{
  if (!m_estimator)
    return;

  const rclcpp::Time stamp(msg->header.stamp, get_clock()->get_clock_type());
  const double stampMs = stamp.nanoseconds() != 0
                             ? static_cast<double>(stamp.nanoseconds()) / NS_PER_MS
                             : NowMs();

  const geometry_msgs::msg::Vector3& accel = msg->linear_acceleration;
  const geometry_msgs::msg::Vector3& gyro = msg->angular_velocity;

  IMU::RawInertialSample raw;
  raw.accel_incl_gravity_mps2 = IMU::Vector3{accel.x, accel.y, accel.z};
  raw.rotation_rate_dps =
      IMU::Vector3{gyro.x * DEG_PER_RAD, gyro.y * DEG_PER_RAD, gyro.z * DEG_PER_RAD};
  if (m_lastImuStampMs)
    raw.interval_ms = stampMs - *m_lastImuStampMs;
  raw.stamp_ms = stampMs;
  m_lastImuStampMs = stampMs;

  const IMU::OrientationEstimator::Output output = m_estimator->Process(raw);
  if (!output.has_sample)
    return;

  std_msgs::msg::Bool stableMsg;
  stableMsg.data = output.metrics.is_stable;
  m_stablePublisher->publish(stableMsg);

  PublishDouble(m_confidencePublisher, output.metrics.confidence);
  PublishDouble(m_verticalAccelPublisher, output.sample.a_z_mps2);

  if (!output.metrics.is_stable)
  {
    RCLCPP_DEBUG_THROTTLE(get_logger(), *get_clock(), 5000,
                          "Platform unstable (rms a_z=%.3f m/s^2, roll=%.2f deg, pitch=%.2f deg)",
                          output.metrics.rms_az_mps2, output.metrics.rms_roll_deg,
                          output.metrics.rms_pitch_deg);
  }

  if (m_session->IsActive())
  {
    if (!m_latestScaleReading)
    {
      RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000,
                           "No scale reading received on %s", SCALE_READING_TOPIC);
    }

    m_session->AddSample(output.sample);
  }
}

void WeighingNode::OnScaleReading(const std_msgs::msg::Float64::ConstSharedPtr& msg)
{
  m_latestScaleReading = msg->data;
}

void WeighingNode::OnTareReading(const std_msgs::msg::Float64::ConstSharedPtr& msg)
{
  try
  {
    m_tare.AddTareSample(msg->data, NowMs());
  }
  catch (const std::invalid_argument& e)
  {
    RCLCPP_WARN(get_logger(), "Ignoring tare reading %f: %s", msg->data, e.what());
    return;
  }

  const Session::TareEstimate estimate = m_tare.Estimate();

  RCLCPP_INFO(get_logger(), "Tare estimate from %zu readings: bias=%.2f g, T95=%.2f g",
              estimate.count, estimate.bias_g, estimate.uncertainty_95_g);
}

void WeighingNode::OnStartSession(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  if (m_session->IsActive())
  {
    response->success = false;
    response->message = "Session already active";
    return;
  }

  m_session->Start(SessionStampMs());

  RCLCPP_INFO(get_logger(), "ROS: Session started");

  response->success = true;
  response->message = "Session started";
}

void WeighingNode::OnStopSession(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                 std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  if (!m_session->IsActive())
  {
    response->success = false;
    response->message = "No active session";
    return;
  }

  const Session::SessionData data = m_session->Stop(SessionStampMs());
  const double bias = m_tare.Estimate().bias_g;

  const Measurement::SessionResult result =
      m_aggregator->ComputeContinuous(data, bias, m_motionCorrection);

  RCLCPP_INFO(get_logger(),
              "ROS: Session stopped after %.1f s: %.2f +/- %.2f g (confidence %.2f, %s)",
              data.duration_s, result.fixed_value_g, result.error_band_95_g, result.confidence,
              result.is_reliable ? "reliable" : "unreliable");

  for (const std::string& note : result.notes)
    RCLCPP_INFO(get_logger(), "  %s", note.c_str());

  if (result.n_total > 0)
  {
    PublishDouble(m_fixedMassPublisher, result.fixed_value_g);
    PublishDouble(m_errorBandPublisher, result.error_band_95_g);
  }

  response->success = result.n_total > 0;
  response->message = result.n_total > 0
                          ? std::to_string(result.fixed_value_g) + " +/- " +
                                std::to_string(result.error_band_95_g) + " g"
                          : result.notes.front();
}

void WeighingNode::OnReloadConfig(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                                  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  if (m_configFile.empty())
  {
    response->success = false;
    response->message = "No config_file parameter set";
    return;
  }

  if (m_session->IsActive())
  {
    response->success = false;
    response->message = "Cannot reload configuration during a session";
    return;
  }

  Measurement::MeasurementConfig cfg = m_config;

  Measurement::MeasurementConfigFile file;
  if (!file.Load(m_configFile, cfg))
  {
    RCLCPP_ERROR(get_logger(), "Failed to reload measurement config: %s", m_configFile.c_str());
    response->success = false;
    response->message = "Failed to load " + m_configFile;
    return;
  }

  ApplyConfig(cfg);

  RCLCPP_INFO(get_logger(), "Reloaded measurement config: %s", m_configFile.c_str());

  response->success = true;
  response->message = "Reloaded " + m_configFile;
}

Measurement::MeasurementConfig WeighingNode::ReadConfigParameters(
    const Measurement::MeasurementConfig& defaults)
{
  Measurement::MeasurementConfig cfg;

  cfg.t_az_rms_mps2 = declare_parameter("T_az_rms", defaults.t_az_rms_mps2);
  cfg.t_roll_rms_deg = declare_parameter("T_roll_rms", defaults.t_roll_rms_deg);
  cfg.t_pitch_rms_deg = declare_parameter("T_pitch_rms", defaults.t_pitch_rms_deg);
  cfg.t_az_instant_mps2 = declare_parameter("T_az_instant", defaults.t_az_instant_mps2);
  cfg.t_roll_instant_deg = declare_parameter("T_roll_instant", defaults.t_roll_instant_deg);
  cfg.t_pitch_instant_deg = declare_parameter("T_pitch_instant", defaults.t_pitch_instant_deg);
  cfg.gravity_filter_alpha =
      declare_parameter("gravity_filter_alpha", defaults.gravity_filter_alpha);
  cfg.sample_mass_default_g =
      declare_parameter("sample_mass_default", defaults.sample_mass_default_g);
  cfg.scale_sample_rate_hz = declare_parameter("scale_sample_rate", defaults.scale_sample_rate_hz);
  cfg.live_window_duration_s =
      declare_parameter("live_window_duration", defaults.live_window_duration_s);
  cfg.uncertainty_k = declare_parameter("uncertainty_k", defaults.uncertainty_k);
  cfg.g_standard_mps2 = declare_parameter("g_standard", defaults.g_standard_mps2);
  cfg.trim_fraction = declare_parameter("trim_fraction", defaults.trim_fraction);
  cfg.max_sample_rate_hz = declare_parameter("max_sample_rate_hz", defaults.max_sample_rate_hz);

  const std::int64_t historySize = declare_parameter(
      "rate_history_size", static_cast<std::int64_t>(defaults.rate_history_size));
  cfg.rate_history_size = historySize > 0 ? static_cast<std::size_t>(historySize) : 0;

  return cfg;
}

void WeighingNode::ApplyConfig(const Measurement::MeasurementConfig& cfg)
{
  m_config = cfg;
  m_estimator->UpdateConfig(m_config);
  m_session->UpdateConfig(m_config);
  m_aggregator->UpdateConfig(m_config);
}

void WeighingNode::PublishDouble(
    const rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr& publisher, double value)
{
  std_msgs::msg::Float64 msg;
  msg.data = value;
  publisher->publish(msg);
}

double WeighingNode::NowMs() const
{
  return static_cast<double>(get_clock()->now().nanoseconds()) / NS_PER_MS;
}

double WeighingNode::SessionStampMs() const
{
  if (m_lastImuStampMs)
    return *m_lastImuStampMs;

  return NowMs();
}
