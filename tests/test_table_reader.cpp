#include "xrd_match/core/errors.hpp"
#include "xrd_match/io/table_reader.hpp"
#include "test_support.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace xrd_match;

TEST_CASE("detect_format_skips_metadata_and_header_line") {
    testing::TempDir dir;
    const auto p = dir.write("pattern.csv",
                             "# instrument: D8\n"
                             "PDF 46-1045\n"
                             "angle,intensity\n"
                             "10.0,5\n"
                             "10.1,7\n");

    const auto hint = io::detect_format(p);
    REQUIRE(hint.detected);
    REQUIRE(hint.skip_rows == 3);
    REQUIRE(hint.delimiter == ',');
    REQUIRE(hint.columns[0] == 0);
    REQUIRE(hint.columns[1] == 1);
    REQUIRE(hint.encoding == "utf-8");
}

TEST_CASE("detect_format_prefers_tab_and_falls_back_to_third_column") {
    testing::TempDir dir;
    const auto tabbed = dir.write("tab.txt", "Strong lines\n20.5\t100\n");
    const auto hkl = dir.write("hkl.txt", "26.64 (101) 100\n");

    const auto t = io::detect_format(tabbed);
    REQUIRE(t.skip_rows == 1);
    REQUIRE(t.delimiter == '\t');

    const auto h = io::detect_format(hkl);
    REQUIRE(h.detected);
    REQUIRE_FALSE(h.delimiter.has_value());
    REQUIRE(h.columns[0] == 0);
    REQUIRE(h.columns[1] == 2);
}

TEST_CASE("detect_format_defaults_for_missing_file") {
    const auto hint = io::detect_format("/nonexistent/xrd_match/pattern.xy");
    REQUIRE_FALSE(hint.detected);
    REQUIRE(hint.skip_rows == io::kDefaultSkipRows);
    REQUIRE(hint.columns[1] == 1);
    REQUIRE_FALSE(hint.delimiter.has_value());
    REQUIRE(hint.encoding == "utf-8");
}

TEST_CASE("detect_format_reports_latin1_for_degree_sign") {
    testing::TempDir dir;
    // 0xB0 is the latin-1 degree sign; followed by a space it is neither UTF-8 nor GBK.
    const auto p = dir.write("latin1.txt", std::string("# 2\xB0 theta\n10.0 5\n"));
    const auto hint = io::detect_format(p);
    REQUIRE(hint.encoding == "latin1");
    REQUIRE(hint.skip_rows == 1);
}

TEST_CASE("encoding_validation") {
    REQUIRE(io::is_valid_encoding("plain", "ascii"));
    REQUIRE(io::is_valid_encoding("\xE2\x91\xA0", "utf-8"));
    REQUIRE_FALSE(io::is_valid_encoding("\xE2\x91", "utf-8"));
    REQUIRE_FALSE(io::is_valid_encoding("\xE2\x91\xA0", "ascii"));
    REQUIRE(io::is_valid_encoding("\xC4\xE3", "gbk"));
    REQUIRE(io::is_valid_encoding("\xFF\x80", "latin1"));
}

TEST_CASE("read_table_missing_cells_become_nan") {
    testing::TempDir dir;
    const auto p = dir.write("gaps.csv", "10.0,5\n10.1,\n# comment only\n\n10.2,7 # trailing\n");

    io::ReadOptions opts;
    opts.delimiter = ',';
    const auto t = io::read_table(p, opts);
    REQUIRE(t.size() == 3);
    REQUIRE(std::isnan(t.y[1]));
    REQUIRE(t.y[2] == Catch::Approx(7.0));
}

TEST_CASE("read_table_rejects_non_numeric_cells_and_empty_tables") {
    testing::TempDir dir;
    const auto bad = dir.write("bad.csv", "10.0,abc\n");
    const auto empty = dir.write("empty.csv", "# nothing here\n");

    io::ReadOptions opts;
    opts.delimiter = ',';
    REQUIRE_THROWS_AS(io::read_table(bad, opts), IngestFormatError);
    REQUIRE_THROWS_AS(io::read_table(empty, opts), IngestFormatError);
}

TEST_CASE("read_series_falls_back_to_sniffed_delimiter") {
    testing::TempDir dir;
    const auto p = dir.write("semi.txt", "10.0;5\n10.1;6\n10.2;9\n");

    REQUIRE(io::sniff_delimiter(p) == ';');

    const auto r = io::read_series(p);
    REQUIRE(r.table.size() == 3);
    REQUIRE(r.options.delimiter == ';');
    REQUIRE(r.options.label == "sniffed");
    REQUIRE_FALSE(r.failures.empty());
    REQUIRE(r.table.x[2] == Catch::Approx(10.2));
    REQUIRE(r.table.y[2] == Catch::Approx(9.0));
}

TEST_CASE("read_series_uses_primary_hint_for_headed_file") {
    testing::TempDir dir;
    const auto p = dir.write("headed.txt", "Radiation: CuKa\nRef: test\n10.0\t5\n10.1\t6\n");

    const auto r = io::read_series(p);
    REQUIRE(r.options.label == "primary");
    REQUIRE(r.failures.empty());
    REQUIRE(r.table.size() == 2);
    REQUIRE(r.hint.skip_rows == 2);
}

TEST_CASE("read_series_reports_last_failure") {
    testing::TempDir dir;
    const auto p = dir.write("words.txt", "alpha beta\ngamma delta\n");
    REQUIRE_THROWS_AS(io::read_series(p), IngestFormatError);
}

TEST_CASE("reference_chain_reduces_skip_last") {
    io::FormatHint hint;
    hint.skip_rows = 14;
    const auto chain = io::reference_read_chain(hint);
    REQUIRE(chain.size() == 5);
    REQUIRE(chain[1].skip_rows == 14);
    REQUIRE(chain[2].delimiter == ',');
    REQUIRE(chain[3].delimiter == '\t');
    REQUIRE(chain[4].skip_rows == 4);
    REQUIRE_FALSE(chain[4].delimiter.has_value());
}
