/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of SEASCALE
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "measurement/io/MeasurementConfigFile.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace SEASCALE::Measurement;

namespace
{
class MeasurementConfigFileTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    m_dir = std::filesystem::temp_directory_path() / "seascale_tests" / info->name();
    std::filesystem::remove_all(m_dir);
    std::filesystem::create_directories(m_dir);
  }

  void TearDown() override { std::filesystem::remove_all(m_dir); }

  std::filesystem::path WriteFile(const std::string& contents) const
  {
    const std::filesystem::path path = m_dir / MeasurementConfigFile::DefaultFilename();
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    f << contents;
    return path;
  }

  std::filesystem::path m_dir;
};
} // namespace

TEST_F(MeasurementConfigFileTest, MissingFileFails)
{
  MeasurementConfig cfg;
  cfg.uncertainty_k = 3.0;

  MeasurementConfigFile file;
  EXPECT_FALSE(file.Load(m_dir / "missing.yaml", cfg));
  EXPECT_DOUBLE_EQ(cfg.uncertainty_k, 3.0);
}

TEST_F(MeasurementConfigFileTest, PartialFileKeepsOtherValues)
{
  MeasurementConfig cfg;
  cfg.uncertainty_k = 3.0;

  MeasurementConfigFile file;
  ASSERT_TRUE(file.Load(WriteFile("T_az_rms: 0.5\nrate_history_size: 20\n"), cfg));

  EXPECT_DOUBLE_EQ(cfg.t_az_rms_mps2, 0.5);
  EXPECT_EQ(cfg.rate_history_size, 20u);
  EXPECT_DOUBLE_EQ(cfg.uncertainty_k, 3.0);
  EXPECT_DOUBLE_EQ(cfg.gravity_filter_alpha, 0.92);
  EXPECT_DOUBLE_EQ(cfg.g_standard_mps2, 9.80665);
}

TEST_F(MeasurementConfigFileTest, NonNumericValueLeavesConfigUntouched)
{
  MeasurementConfig cfg;

  MeasurementConfigFile file;
  EXPECT_FALSE(file.Load(WriteFile("T_az_rms: 0.5\nT_roll_rms: steep\n"), cfg));

  EXPECT_DOUBLE_EQ(cfg.t_az_rms_mps2, 0.35);
  EXPECT_DOUBLE_EQ(cfg.t_roll_rms_deg, 2.5);
}

TEST_F(MeasurementConfigFileTest, OutOfRangeValueFails)
{
  MeasurementConfig cfg;

  MeasurementConfigFile file;
  EXPECT_FALSE(file.Load(WriteFile("gravity_filter_alpha: 1.5\n"), cfg));
  EXPECT_DOUBLE_EQ(cfg.gravity_filter_alpha, 0.92);
}

TEST_F(MeasurementConfigFileTest, MalformedYamlFails)
{
  MeasurementConfig cfg;

  MeasurementConfigFile file;
  EXPECT_FALSE(file.Load(WriteFile("T_az_rms: [0.5\n"), cfg));
  EXPECT_FALSE(file.Load(WriteFile("version: 99\n"), cfg));
  EXPECT_DOUBLE_EQ(cfg.t_az_rms_mps2, 0.35);
}

TEST_F(MeasurementConfigFileTest, SaveThenLoad)
{
  MeasurementConfig saved;
  saved.t_pitch_instant_deg = 4.0;
  saved.scale_sample_rate_hz = 10.0;
  saved.trim_fraction = 0.2;

  MeasurementConfigFile file;
  const std::filesystem::path path = m_dir / "nested" / MeasurementConfigFile::DefaultFilename();
  ASSERT_TRUE(file.Save(path, saved));

  MeasurementConfig loaded;
  ASSERT_TRUE(file.Load(path, loaded));

  EXPECT_DOUBLE_EQ(loaded.t_pitch_instant_deg, 4.0);
  EXPECT_DOUBLE_EQ(loaded.scale_sample_rate_hz, 10.0);
  EXPECT_DOUBLE_EQ(loaded.trim_fraction, 0.2);
}

TEST(MeasurementConfigApplyNodeTest, EmptyDocumentKeepsDefaults)
{
  MeasurementConfig cfg;

  EXPECT_TRUE(MeasurementConfigFile::ApplyNode(YAML::Load(""), cfg));
  EXPECT_DOUBLE_EQ(cfg.t_az_rms_mps2, 0.35);
  EXPECT_FALSE(MeasurementConfigFile::ApplyNode(YAML::Load("- 1\n- 2\n"), cfg));
}

TEST(MeasurementConfigValidityTest, DefaultsAreValid)
{
  const char* reason = nullptr;

  EXPECT_TRUE(IsValid(MeasurementConfig{}, &reason));
  EXPECT_EQ(reason, nullptr);

  MeasurementConfig cfg;
  cfg.scale_sample_rate_hz = 0.0;
  EXPECT_FALSE(IsValid(cfg, &reason));
  EXPECT_STREQ(reason, "scale_sample_rate");
}
