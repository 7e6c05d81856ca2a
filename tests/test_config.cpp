#include "xrd_match/config/configuration.hpp"
#include "xrd_match/core/errors.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace xrd_match;

TEST_CASE("default_config_is_valid") {
    config::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.detection.height == Catch::Approx(100.0));
    REQUIRE(cfg.detection.distance == 15);
    REQUIRE(cfg.detection.prominence == Catch::Approx(50.0));
    REQUIRE(cfg.detection.width == Catch::Approx(2.0));
    REQUIRE(cfg.matching.tolerance == Catch::Approx(0.2));
    REQUIRE(cfg.symbol_pool().size() == 20);
    REQUIRE(cfg.symbol_pool().front() == "①");
    REQUIRE(cfg.symbol_pool().back() == "⑳");
}

TEST_CASE("sections_and_flat_keys_are_read") {
    const auto node = YAML::Load(
        "detection:\n"
        "  height: 80\n"
        "  distance: 10\n"
        "  adaptive: {sigma_factor: 3.0}\n"
        "matching: {tolerance: 0.3, policy: peak-first}\n"
        "reference: {format: extracted, symbols: [A, B]}\n"
        "peak_height: 60\n"
        "match_tolerance: 0.25\n"
        "smooth_window: 5\n");

    const auto cfg = config::Config::from_yaml(node);
    REQUIRE(cfg.detection.height == Catch::Approx(60.0));
    REQUIRE(cfg.detection.distance == 10);
    REQUIRE(cfg.detection.adaptive.sigma_factor == Catch::Approx(3.0));
    REQUIRE(cfg.matching.tolerance == Catch::Approx(0.25));
    REQUIRE(cfg.cleaning.smooth_window == 5);
    REQUIRE(cfg.symbol_pool() == std::vector<std::string>{"A", "B"});
    REQUIRE(string_to_match_policy(cfg.matching.policy) == MatchPolicy::PEAK_FIRST);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("validation_rejects_out_of_range_values") {
    config::Config cfg;
    cfg.matching.tolerance = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.detection.distance = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.cleaning.angle_min = 70.0;
    cfg.cleaning.angle_max = 10.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.matching.policy = "nearest";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.reference.format = "pdf";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("malformed_values_raise_config_error") {
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("detection: {distance: many}")),
                      ConfigError);
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("- a\n- b\n")), ConfigError);
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/xrd_match.yaml"), ConfigError);
}

TEST_CASE("save_and_load_preserve_settings") {
    testing::TempDir dir;
    config::Config cfg;
    cfg.detection.prominence = 35.0;
    cfg.matching.policy = "peak_first";
    cfg.cleaning.angle_min = 10.0;
    cfg.cleaning.angle_max = 70.0;
    cfg.reference.symbols = {"◆", "■"};
    cfg.output.write_peaks_csv = false;

    const auto path = dir.path() / "xrd_match.yaml";
    cfg.save(path);
    const auto loaded = config::Config::load(path);

    REQUIRE(loaded.detection.prominence == Catch::Approx(35.0));
    REQUIRE(loaded.matching.policy == "peak_first");
    REQUIRE(loaded.cleaning.angle_min == Catch::Approx(10.0));
    REQUIRE(loaded.cleaning.angle_max == Catch::Approx(70.0));
    REQUIRE(loaded.reference.symbols == cfg.reference.symbols);
    REQUIRE_FALSE(loaded.output.write_peaks_csv);
}

TEST_CASE("cleaning_floor_is_not_configurable") {
    const auto cfg = config::Config::from_yaml(YAML::Load("cleaning: {min_points: 5}\n"));
    REQUIRE_NOTHROW(cfg.validate());
    const YAML::Node saved = cfg.to_yaml();
    REQUIRE_FALSE(saved["cleaning"]["min_points"].IsDefined());

    const auto schema = nlohmann::json::parse(config::get_schema_json());
    REQUIRE_FALSE(schema["properties"]["cleaning"]["properties"].contains("min_points"));
}

TEST_CASE("schema_is_json") {
    const auto schema = nlohmann::json::parse(config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("detection"));
    REQUIRE(schema["properties"].contains("matching"));
}
