/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "measurement/io/MeasurementConfigFile.h"

#include <fstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace SEASCALE::Measurement
{
namespace
{
bool RequireScalar(const YAML::Node& node)
{
  return node && node.IsScalar();
}

template<typename T>
bool ReadOptional(const YAML::Node& root, const char* key, T& out)
{
  const YAML::Node node = root[key];
  if (!node)
    return true;

  if (!RequireScalar(node))
    return false;

  out = node.as<T>();
  return true;
}
} // namespace

bool MeasurementConfigFile::Load(const std::filesystem::path& path,
                                 MeasurementConfig& inOut) const
{
  if (!std::filesystem::exists(path))
    return false;

  YAML::Node root;
  try
  {
    root = YAML::LoadFile(path.string());
  }
  catch (const YAML::Exception&)
  {
    return false;
  }

  return ApplyNode(root, inOut);
}

bool MeasurementConfigFile::ApplyNode(const YAML::Node& root, MeasurementConfig& inOut)
{
  // An empty document keeps every default
  if (root.IsNull())
    return true;

  if (!root.IsMap())
    return false;

  MeasurementConfig cfg = inOut;

  try
  {
    const YAML::Node version = root["version"];
    if (version)
    {
      if (!RequireScalar(version) || version.as<int>() != Version())
        return false;
    }

    if (!ReadOptional(root, "T_az_rms", cfg.t_az_rms_mps2))
      return false;
    if (!ReadOptional(root, "T_roll_rms", cfg.t_roll_rms_deg))
      return false;
    if (!ReadOptional(root, "T_pitch_rms", cfg.t_pitch_rms_deg))
      return false;
    if (!ReadOptional(root, "T_az_instant", cfg.t_az_instant_mps2))
      return false;
    if (!ReadOptional(root, "T_roll_instant", cfg.t_roll_instant_deg))
      return false;
    if (!ReadOptional(root, "T_pitch_instant", cfg.t_pitch_instant_deg))
      return false;
    if (!ReadOptional(root, "gravity_filter_alpha", cfg.gravity_filter_alpha))
      return false;
    if (!ReadOptional(root, "sample_mass_default", cfg.sample_mass_default_g))
      return false;
    if (!ReadOptional(root, "scale_sample_rate", cfg.scale_sample_rate_hz))
      return false;
    if (!ReadOptional(root, "live_window_duration", cfg.live_window_duration_s))
      return false;
    if (!ReadOptional(root, "uncertainty_k", cfg.uncertainty_k))
      return false;
    if (!ReadOptional(root, "g_standard", cfg.g_standard_mps2))
      return false;
    if (!ReadOptional(root, "trim_fraction", cfg.trim_fraction))
      return false;
    if (!ReadOptional(root, "max_sample_rate_hz", cfg.max_sample_rate_hz))
      return false;
    if (!ReadOptional(root, "rate_history_size", cfg.rate_history_size))
      return false;
  }
  catch (const YAML::Exception&)
  {
    // Non-numeric value
    return false;
  }

  if (!IsValid(cfg))
    return false;

  inOut = cfg;
  return true;
}

bool MeasurementConfigFile::Save(const std::filesystem::path& path,
                                 const MeasurementConfig& cfg) const
{
  if (path.has_parent_path())
  {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
      return false;
  }

  YAML::Node root;
  root["version"] = Version();
  root["T_az_rms"] = cfg.t_az_rms_mps2;
  root["T_roll_rms"] = cfg.t_roll_rms_deg;
  root["T_pitch_rms"] = cfg.t_pitch_rms_deg;
  root["T_az_instant"] = cfg.t_az_instant_mps2;
  root["T_roll_instant"] = cfg.t_roll_instant_deg;
  root["T_pitch_instant"] = cfg.t_pitch_instant_deg;
  root["gravity_filter_alpha"] = cfg.gravity_filter_alpha;
  root["sample_mass_default"] = cfg.sample_mass_default_g;
  root["scale_sample_rate"] = cfg.scale_sample_rate_hz;
  root["live_window_duration"] = cfg.live_window_duration_s;
  root["uncertainty_k"] = cfg.uncertainty_k;
  root["g_standard"] = cfg.g_standard_mps2;
  root["trim_fraction"] = cfg.trim_fraction;
  root["max_sample_rate_hz"] = cfg.max_sample_rate_hz;
  root["rate_history_size"] = cfg.rate_history_size;

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open())
    return false;

  f << root;
  f << "\n";
  return static_cast<bool>(f);
}

std::string MeasurementConfigFile::DefaultFilename()
{
  return "seascale_config.yaml";
}
} // namespace SEASCALE::Measurement
