/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <string>

#include <rclcpp/logger.hpp>

namespace rclcpp
{
class Node;
}

namespace SEASCALE
{
namespace UTILS
{

class LogUtils
{
public:
  /*!
   * \brief Set the severity threshold of the node's logger
   *
   * \param node The node whose logger is configured
   * \param severity One of "debug", "info", "warn", "error" or "fatal"
   *
   * \return The node's logger. An unknown severity is reported and the
   *         current threshold is kept.
   */
  static rclcpp::Logger InitializeLogging(rclcpp::Node& node, const std::string& severity);
};

} // namespace UTILS
} // namespace SEASCALE
