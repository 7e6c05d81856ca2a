#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/events.hpp"
#include "xrd_match/core/utils.hpp"
#include "test_support.hpp"

#include <cmath>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace xrd_match;

TEST_CASE("split_keeps_empty_fields") {
    const auto parts = core::split("10.5,,3,", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == "10.5");
    REQUIRE(parts[1].empty());
    REQUIRE(parts[3].empty());
}

TEST_CASE("split_whitespace_collapses_runs") {
    const auto parts = core::split_whitespace("  10.5 \t 200   3 ");
    REQUIRE(parts == std::vector<std::string>{"10.5", "200", "3"});
}

TEST_CASE("parse_double_requires_whole_field") {
    REQUIRE(core::parse_double(" 12.5 ").value() == Catch::Approx(12.5));
    REQUIRE(core::parse_double("1e3").value() == Catch::Approx(1000.0));
    REQUIRE_FALSE(core::parse_double("2theta").has_value());
    REQUIRE_FALSE(core::parse_double("").has_value());
    REQUIRE_FALSE(core::parse_double("12.5;3").has_value());
}

TEST_CASE("glob_matches_reference_pattern") {
    REQUIRE(core::glob_match("reference_*.txt", "reference_Quartz.txt"));
    REQUIRE_FALSE(core::glob_match("reference_*.txt", "reference_Quartz.csv"));
    REQUIRE_FALSE(core::glob_match("reference_*.txt", "sample.txt"));
    REQUIRE(core::glob_match("REFERENCE_*.TXT", "reference_Quartz.txt"));
    REQUIRE(core::glob_match("card_?.txt", "card_7.txt"));
    REQUIRE(core::glob_match("*(1).txt", "Quartz(1).txt"));
    REQUIRE_FALSE(core::glob_match("card_?.txt", "card_12.txt"));
}

TEST_CASE("glob_lists_sorted_matches") {
    testing::TempDir dir;
    dir.write("reference_b.txt", "");
    dir.write("reference_a.txt", "");
    dir.write("pattern.xy", "");

    const auto files = core::glob(dir.path(), "reference_*.txt");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "reference_a.txt");
    REQUIRE(files[1].filename() == "reference_b.txt");
}

TEST_CASE("sha256_of_known_input") {
    const std::string text = "abc";
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    REQUIRE(core::sha256_bytes(bytes) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_file_matches_in_memory_digest") {
    testing::TempDir dir;
    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += std::to_string(10.0 + i * 0.01) + " " + std::to_string(i % 97) + "\n";
    }
    const auto path = dir.write("pattern.xy", text);
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    REQUIRE(core::sha256_file(path) == core::sha256_bytes(bytes));
    REQUIRE_THROWS_AS(core::sha256_file(dir.path() / "missing.xy"), IOError);
}

TEST_CASE("run_id_carries_sanitised_label") {
    const std::string id = core::get_run_id("Fe2O3 sample.1");
    REQUIRE(id.find("_Fe2O3_sample_1_") != std::string::npos);
    REQUIRE(id.size() == 15 + 1 + std::string("Fe2O3_sample_1").size() + 1 + 8);
    REQUIRE(core::get_run_id().size() == 15 + 1 + 8);
}

TEST_CASE("population_stddev") {
    VectorXd v(4);
    v << 2.0, 4.0, 4.0, 6.0;
    REQUIRE(core::mean_of(v) == Catch::Approx(4.0));
    REQUIRE(core::stddev_of(v) == Catch::Approx(std::sqrt(2.0)));
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    std::ostringstream out;
    core::EventEmitter emitter;
    emitter.stage_start("run1", Stage::DETECT, out);
    emitter.stage_end("run1", Stage::DETECT, "ok", {{"peaks", 3}}, out);

    std::istringstream lines(out.str());
    std::string first, second;
    std::getline(lines, first);
    std::getline(lines, second);

    const auto a = nlohmann::json::parse(first);
    const auto b = nlohmann::json::parse(second);
    REQUIRE(a["type"] == "stage_start");
    REQUIRE(a["stage_name"] == "DETECT");
    REQUIRE(b["type"] == "stage_end");
    REQUIRE(b["status"] == "ok");
    REQUIRE(b["peaks"] == 3);
    REQUIRE(b["run_id"] == "run1");
    REQUIRE(b.contains("ts"));
}

TEST_CASE("event_extra_fields_cannot_replace_envelope") {
    std::ostringstream out;
    core::EventEmitter emitter;
    emitter.warning("run2", Stage::REFERENCES, "card skipped",
                    {{"type", "spoofed"}, {"file", "a.txt"}}, out);

    const auto e = nlohmann::json::parse(out.str());
    REQUIRE(e["type"] == "warning");
    REQUIRE(e["run_id"] == "run2");
    REQUIRE(e["stage_name"] == "REFERENCES");
    REQUIRE(e["file"] == "a.txt");
}
