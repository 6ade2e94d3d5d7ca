/**
 * @file test_configuration.cpp
 * @brief Unit tests for the YAML configuration layer and GeneratorConfig
 */

#include <gtest/gtest.h>
#include <wojak/api/WojakGenerator.hpp>
#include <wojak/core/Configuration.hpp>
#include <filesystem>
#include <fstream>

using namespace wojak;

TEST(ConfigurationTest, DottedKeysResolveNestedMaps) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString(
        "validator:\n"
        "  max_yaw_deg: 25.5\n"
        "  high_resolution_min_side: 512\n"
        "logging:\n"
        "  level: debug\n"
        "  console: false\n"));

    EXPECT_TRUE(config.has("validator.max_yaw_deg"));
    EXPECT_FALSE(config.has("validator.missing"));
    EXPECT_DOUBLE_EQ(config.getDouble("validator.max_yaw_deg"), 25.5);
    EXPECT_EQ(config.getInt("validator.high_resolution_min_side"), 512);
    EXPECT_EQ(config.getString("logging.level"), "debug");
    EXPECT_FALSE(config.getBool("logging.console", true));
}

TEST(ConfigurationTest, MissingOrMistypedKeysUseDefaults) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString("detector:\n  min_image_side: big\n"));

    EXPECT_EQ(config.getInt("detector.min_image_side", 64), 64);
    EXPECT_EQ(config.getInt("detector.min_image_side.deeper", 7), 7);
    EXPECT_EQ(config.getString("nothing.here", "fallback"), "fallback");
}

TEST(ConfigurationTest, InvalidYamlKeepsPreviousDocument) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString("a: 1\n"));
    EXPECT_FALSE(config.loadFromString("a: [unterminated\n"));
    EXPECT_EQ(config.getInt("a"), 1);
}

TEST(ConfigurationTest, SetCreatesIntermediateMaps) {
    core::Configuration config;
    config.set("generator.defaults.eye_blend_strength", 0.25);
    config.set("generator.output_format", std::string(".jpg"));

    EXPECT_DOUBLE_EQ(config.getDouble("generator.defaults.eye_blend_strength"), 0.25);
    EXPECT_EQ(config.getString("generator.output_format"), ".jpg");
}

TEST(ConfigurationTest, SaveAndReload) {
    auto path = std::filesystem::temp_directory_path() / "wojak_config_roundtrip.yaml";
    {
        core::Configuration config;
        config.set("blender.feather_radius_px", 6.0);
        ASSERT_TRUE(config.save(path.string()));
    }

    core::Configuration loaded;
    ASSERT_TRUE(loaded.load(path.string()));
    EXPECT_DOUBLE_EQ(loaded.getDouble("blender.feather_radius_px"), 6.0);
    EXPECT_EQ(loaded.getFilename(), path.string());

    {
        std::ofstream out(path);
        out << "blender:\n  feather_radius_px: 2.5\n";
    }
    ASSERT_TRUE(loaded.reload());
    EXPECT_DOUBLE_EQ(loaded.getDouble("blender.feather_radius_px"), 2.5);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(GeneratorConfigTest, BuildsTypedConfigFromYaml) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString(
        "detector:\n"
        "  lbf_model_path: /models/lbf.yaml\n"
        "  min_image_side: 96\n"
        "validator:\n"
        "  max_roll_deg: 15\n"
        "aligner:\n"
        "  weight_by_confidence: true\n"
        "blender:\n"
        "  feather_radius_px: 8\n"
        "generator:\n"
        "  template_directory: /srv/templates\n"
        "  output_format: .jpg\n"
        "  defaults:\n"
        "    mouth_blend_strength: 0.9\n"
        "logging:\n"
        "  level: warning\n"));

    api::GeneratorConfig generator = api::GeneratorConfig::fromConfiguration(config);
    EXPECT_EQ(generator.detector.lbf_model_path, "/models/lbf.yaml");
    EXPECT_EQ(generator.detector.min_image_side, 96);
    EXPECT_FLOAT_EQ(generator.validator.max_roll_deg, 15.0f);
    EXPECT_FLOAT_EQ(generator.validator.max_yaw_deg, 35.0f);
    EXPECT_TRUE(generator.aligner.weight_by_confidence);
    EXPECT_FLOAT_EQ(generator.blender.feather_radius_px, 8.0f);
    EXPECT_EQ(generator.template_directory, "/srv/templates");
    EXPECT_EQ(generator.output_format, ".jpg");
    EXPECT_FLOAT_EQ(generator.defaults.mouth_blend_strength, 0.9f);
    EXPECT_FLOAT_EQ(generator.defaults.face_blend_strength, 0.6f);
    EXPECT_EQ(generator.logging.level, "warning");
    EXPECT_TRUE(generator.validate());
}

TEST(GeneratorConfigTest, EmptyConfigurationGivesDefaults) {
    core::Configuration config;
    api::GeneratorConfig generator = api::GeneratorConfig::fromConfiguration(config);

    EXPECT_EQ(generator.detector.min_image_side, 64);
    EXPECT_EQ(generator.template_directory, "assets/templates");
    EXPECT_EQ(generator.output_format, ".png");
    EXPECT_FLOAT_EQ(generator.defaults.contrast_enhancement, 1.1f);
    EXPECT_FLOAT_EQ(generator.blender.feather_radius_px, 4.0f);
}

TEST(GeneratorConfigTest, RejectsBadOutputFormat) {
    api::GeneratorConfig generator;
    generator.output_format = "png";
    EXPECT_FALSE(generator.validate());
}
