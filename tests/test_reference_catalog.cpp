#include "xrd_match/core/errors.hpp"
#include "xrd_match/reference/card_extractor.hpp"
#include "xrd_match/reference/catalog.hpp"
#include "xrd_match/core/utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace xrd_match;

namespace {

const char* kQuartzRaw = "# Quartz SiO2\n26.64 100\n20.86 22\n190.0 5\n50.14 13\n";
const char* kCalciteRaw = "29.41,100\n39.40,18\n";
const char* kBroken = "no numbers here\nat all\n";

const char* kCard =
    "PDF#46-1045\n"
    "Quartz low\n"
    "Radiation: CuKa1\n"
    "    2-Theta    d(A)     I(f)   ( h k l )\n"
    "  20.860   4.2550    22.0   ( 1 0 0 )\n"
    "  26.640   3.3435   100.0   ( 1 0 1 )\n"
    "  36.544   2.4569     8.0   ( 1 1 0 )\n"
    "  50.140   1.8180    40.0   ( 1 1 2 )\n";

} // namespace

TEST_CASE("build_catalog_stamps_phase_and_positional_symbol") {
    testing::TempDir dir;
    const auto quartz = dir.write("quartz.card.txt", kQuartzRaw);
    const auto broken = dir.write("broken.txt", kBroken);
    const auto calcite = dir.write("calcite.txt", kCalciteRaw);

    const auto r = reference::build_catalog({quartz, broken, calcite}, {"①", "②", "③"});

    REQUIRE(r.loaded_phases == std::vector<std::string>{"quartz", "calcite"});
    REQUIRE(r.catalog.size() == 5);

    // Out-of-range row dropped, rows sorted by angle.
    REQUIRE(r.catalog[0].phase_id == "quartz");
    REQUIRE(r.catalog[0].angle == Catch::Approx(20.86));
    REQUIRE(r.catalog[0].intensity == Catch::Approx(22.0));
    REQUIRE(r.catalog[2].angle == Catch::Approx(50.14));
    REQUIRE(r.catalog[0].symbol == "①");

    // The rejected file still consumed its symbol.
    REQUIRE(r.catalog[3].phase_id == "calcite");
    REQUIRE(r.catalog[3].symbol == "③");

    REQUIRE(r.issues.size() == 1);
    REQUIRE(r.issues[0].severity == "error");
    REQUIRE(r.issues[0].file == broken);
}

TEST_CASE("build_catalog_skips_files_beyond_symbol_pool") {
    testing::TempDir dir;
    const auto a = dir.write("a.txt", kQuartzRaw);
    const auto b = dir.write("b.txt", kCalciteRaw);

    const auto r = reference::build_catalog({a, b}, {"①"});
    REQUIRE(r.loaded_phases == std::vector<std::string>{"a"});
    REQUIRE(r.issues.size() == 1);
    REQUIRE(r.issues[0].severity == "warning");
}

TEST_CASE("build_catalog_without_usable_files_raises") {
    testing::TempDir dir;
    const auto broken = dir.write("broken.txt", kBroken);

    REQUIRE_THROWS_AS(reference::build_catalog({}, {"①"}), NoReferenceDataError);
    REQUIRE_THROWS_AS(reference::build_catalog({broken}, {"①"}), NoReferenceDataError);
}

TEST_CASE("extracted_files_take_phase_from_name_then_header") {
    testing::TempDir dir;
    const auto quartz = dir.write("reference_Quartz.txt",
                                  "# Phase: Ignored\n"
                                  "# Symbol: ①\n"
                                  "# Format: 2-Theta,PhaseName,Symbol\n"
                                  "26.64,Quartz,①\n"
                                  "20.86,,\n"
                                  "200.0,Quartz,①\n"
                                  "not,a,number\n");
    const auto calcite = dir.write("mine.txt", "# Phase: Calcite\n# Symbol: ★\n29.41,,\n");

    const auto r = reference::load_extracted_references({quartz, calcite});
    REQUIRE(r.catalog.size() == 3);
    REQUIRE(r.catalog[1].phase_id == "Quartz");
    REQUIRE(r.catalog[1].symbol == "①");
    REQUIRE(r.catalog[1].intensity == 0.0);
    REQUIRE(r.catalog[2].phase_id == "Calcite");
    REQUIRE(r.catalog[2].symbol == "★");
    REQUIRE(r.loaded_phases == std::vector<std::string>{"Quartz", "Calcite"});
    REQUIRE(r.issues.size() == 1);  // the 200 degree line
}

TEST_CASE("extracted_loader_raises_when_nothing_was_read") {
    testing::TempDir dir;
    const auto empty = dir.write("reference_Empty.txt", "# Phase: Empty\n");
    REQUIRE_THROWS_AS(reference::load_extracted_references({empty}), NoReferenceDataError);
    REQUIRE_THROWS_AS(reference::load_extracted_references({dir.path() / "missing.txt"}),
                      NoReferenceDataError);
}

TEST_CASE("auto_format_mixes_extracted_and_raw_files") {
    testing::TempDir dir;
    const auto extracted = dir.write("reference_Quartz.txt", "# Phase: Quartz\n26.64,Quartz,①\n");
    const auto raw = dir.write("calcite.txt", kCalciteRaw);

    REQUIRE(reference::is_extracted_format(extracted));
    REQUIRE_FALSE(reference::is_extracted_format(raw));

    const auto r = reference::load_references({extracted, raw}, reference::ReferenceFormat::AUTO,
                                              {"★"});
    REQUIRE(r.loaded_phases == std::vector<std::string>{"Quartz", "calcite"});
    REQUIRE(r.catalog.size() == 3);
    REQUIRE(r.catalog[1].symbol == "★");
    REQUIRE(reference::string_to_reference_format(" Extracted ") == reference::ReferenceFormat::EXTRACTED);
    REQUIRE_THROWS_AS(reference::string_to_reference_format("pdf"), ValidationError);
}

TEST_CASE("card_peaks_filtered_by_relative_intensity") {
    testing::TempDir dir;
    const auto card = dir.write("quartz.txt", kCard);

    const auto angles = reference::extract_card_peaks(card, 40.0);
    REQUIRE(angles.size() == 2);
    REQUIRE(angles[0] == Catch::Approx(26.64));
    REQUIRE(angles[1] == Catch::Approx(50.14));

    REQUIRE(reference::extract_card_peaks(card, 0.0).size() == 4);
    REQUIRE_THROWS_AS(reference::extract_card_peaks(dir.path() / "missing.txt"), IOError);
}

TEST_CASE("phase_names_are_cleaned") {
    REQUIRE(reference::clean_phase_name("Quartz (low).txt") == "Quartzlow");
    REQUIRE(reference::clean_phase_name("/data/cards/alpha-Fe2O3.dat") == "alpha-Fe2O3");
    REQUIRE(reference::clean_phase_name("石英.txt") == "石英");
    REQUIRE(reference::clean_phase_name("") == "UnknownPhase");
    REQUIRE(reference::clean_phase_name(" ( ) ") == "UnknownPhase");
}

TEST_CASE("placeholder_card_name_falls_back_to_line_after_pdf_number") {
    testing::TempDir dir;
    const auto untitled = dir.write("untitled.txt", kCard);
    const auto named = dir.write("Hematite.txt", kCard);

    REQUIRE(reference::phase_name_for_card(untitled) == "Quartzlow");
    REQUIRE(reference::phase_name_for_card(named) == "Hematite");
}

TEST_CASE("angles_formatted_like_shortest_decimal") {
    REQUIRE(reference::format_angle(26.64) == "26.64");
    REQUIRE(reference::format_angle(40.0) == "40.0");
    REQUIRE(reference::format_angle(0.5) == "0.5");
    REQUIRE(reference::format_angle(36.544) == "36.544");
    REQUIRE(reference::format_angle(0.1 + 0.2) == "0.30000000000000004");
}

TEST_CASE("extracted_card_file_layout_and_reload") {
    testing::TempDir dir;
    const auto card = dir.write("untitled.txt", kCard);

    const auto out = reference::extract_card(card, "♠", 40.0, dir.path());
    REQUIRE(out.phase == "Quartzlow");
    REQUIRE(out.output == dir.path() / "reference_Quartzlow.txt");

    REQUIRE(core::read_text(out.output) ==
            "# Phase: Quartzlow\n"
            "# Symbol: ♠\n"
            "# Intensity Threshold: >= 40.0\n"
            "# Format: 2-Theta,PhaseName,Symbol\n"
            "# ----------------------------------\n"
            "26.64,Quartzlow,♠\n"
            "50.14,Quartzlow,♠\n");

    const auto loaded = reference::load_extracted_references({out.output});
    REQUIRE(loaded.catalog.size() == 2);
    REQUIRE(loaded.catalog[0].phase_id == "Quartzlow");
    REQUIRE(loaded.catalog[0].symbol == "♠");
}

TEST_CASE("extract_card_without_strong_peaks_is_rejected") {
    testing::TempDir dir;
    const auto card = dir.write("quartz.txt", kCard);
    REQUIRE_THROWS_AS(reference::extract_card(card, "♠", 101.0, dir.path()), ValidationError);
    REQUIRE_FALSE(fs::exists(dir.path() / "reference_quartz.txt"));
}
