/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "LogUtils.h"

#include <rclcpp/logging.hpp>
#include <rclcpp/node.hpp>
#include <rcutils/allocator.h>
#include <rcutils/error_handling.h>
#include <rcutils/logging.h>

using namespace SEASCALE;
using namespace UTILS;

rclcpp::Logger LogUtils::InitializeLogging(rclcpp::Node& node, const std::string& severity)
{
  rclcpp::Logger logger = node.get_logger();

  int level = RCUTILS_LOG_SEVERITY_INFO;
  auto ret = rcutils_logging_severity_level_from_string(severity.c_str(),
                                                        rcutils_get_default_allocator(), &level);
  if (ret != RCUTILS_RET_OK)
  {
    RCLCPP_ERROR(logger, "Unknown log severity \"%s\"", severity.c_str());
    rcutils_reset_error();
    return logger;
  }

  RCLCPP_INFO(logger, "Setting log severity threshold to %s", severity.c_str());

  ret = rcutils_logging_set_logger_level(logger.get_name(), level);
  if (ret != RCUTILS_RET_OK)
  {
    RCLCPP_ERROR(logger, "Error setting severity: %s", rcutils_get_error_string().str);
    rcutils_reset_error();
  }

  return logger;
}
