/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "measurement/MeasurementConfig.h"

#include <filesystem>
#include <string>

namespace YAML
{
class Node;
}

namespace SEASCALE::Measurement
{
/*!
 * \brief Loads and saves the measurement configuration as YAML
 *
 * Every key is optional on load. Keys that are present overwrite the
 * matching field, keys that are absent keep the caller's value. A file that
 * fails to parse, holds a non-scalar or non-numeric value, or produces an
 * invalid configuration leaves the caller's configuration untouched.
 *
 * File I/O is kept ROS-free so nodes can stay thin.
 */
class MeasurementConfigFile
{
public:
  bool Load(const std::filesystem::path& path, MeasurementConfig& inOut) const;
  bool Save(const std::filesystem::path& path, const MeasurementConfig& cfg) const;

  /*!
   * \brief Apply an already-parsed YAML map, with the same rules as Load()
   */
  static bool ApplyNode(const YAML::Node& root, MeasurementConfig& inOut);

  static std::string DefaultFilename();
  static int Version() { return 1; }
};
} // namespace SEASCALE::Measurement
