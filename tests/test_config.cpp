#include <gtest/gtest.h>
#include <toml++/toml.h>
#include "config.h"

TEST(Config, EmptyDocumentKeepsDefaults) {
    const toml::table tbl = toml::parse("");
    AppConfig cfg;
    ASSERT_TRUE(load_app_config(tbl, cfg));
    EXPECT_FLOAT_EQ(cfg.tracker.distance_gate_px, 50.0f);
    EXPECT_EQ(cfg.tracker.max_age_frames, 30);
    EXPECT_EQ(cfg.speed.min_samples, 3);
    EXPECT_DOUBLE_EQ(cfg.zone.speed_limit_kmh, 80.0);
    EXPECT_EQ(cfg.intake.vehicle_classes, (std::vector<int>{2, 3, 5, 7}));
}

TEST(Config, ReadsPresentKeys) {
    const toml::table tbl = toml::parse(R"(
        [tracker]
        distance_gate_px = 40
        max_age_frames = 12

        [zone]
        speed_limit_kmh = 60.0

        [intake]
        vehicle_classes = [2, 7]

        [output]
        codecs = ["MJPG"]
        csv_separator = ";"

        [logging]
        tracker_level_logger = true
        speed_level_logger = false
        plate_level_logger = false
        pipeline_level_logger = false
        detector_level_logger = true
    )");
    AppConfig cfg;
    ASSERT_TRUE(load_app_config(tbl, cfg));
    EXPECT_FLOAT_EQ(cfg.tracker.distance_gate_px, 40.0f);
    EXPECT_EQ(cfg.tracker.max_age_frames, 12);
    EXPECT_DOUBLE_EQ(cfg.zone.speed_limit_kmh, 60.0);
    EXPECT_EQ(cfg.intake.vehicle_classes, (std::vector<int>{2, 7}));
    EXPECT_EQ(cfg.output.codecs, (std::vector<std::string>{"MJPG"}));
    EXPECT_EQ(cfg.output.csv_separator, ';');
    EXPECT_TRUE(cfg.logging.tracker_level_logger);
    EXPECT_TRUE(cfg.logging.detector_level_logger);
    EXPECT_FALSE(cfg.logging.plate_level_logger);
}

TEST(Config, WrongTypeIsReported) {
    const toml::table tbl = toml::parse(R"(
        [speed]
        min_samples = "three"
    )");
    SpeedConfig cfg;
    EXPECT_FALSE(load_speed_config(tbl, cfg));
    EXPECT_EQ(cfg.min_samples, 3);
}

TEST(Config, IncompleteLoggingTableIsReported) {
    const toml::table tbl = toml::parse(R"(
        [logging]
        tracker_level_logger = true
    )");
    LoggingConfig cfg;
    EXPECT_FALSE(load_logging_config(tbl, cfg));
}

TEST(Config, BadSeparatorIsReported) {
    const toml::table tbl = toml::parse(R"(
        [output]
        csv_separator = ";;"
    )");
    OutputConfig cfg;
    EXPECT_FALSE(load_output_config(tbl, cfg));
}
