/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "nodes/WeighingNode.h"

#include <memory>

#include <rclcpp/rclcpp.hpp>

int main(int argc, char* argv[])
{
  rclcpp::init(argc, argv);

  std::shared_ptr<SEASCALE::ROS::WeighingNode> node =
      std::make_shared<SEASCALE::ROS::WeighingNode>();

  if (!node->Initialize())
    return -1;

  rclcpp::spin(node);

  node->Deinitialize();

  rclcpp::shutdown();

  return 0;
}
