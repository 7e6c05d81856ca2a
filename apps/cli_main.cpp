#include "xrd_match/config/configuration.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/types.hpp"
#include "xrd_match/core/utils.hpp"
#include "xrd_match/io/table_reader.hpp"
#include "xrd_match/reference/card_extractor.hpp"
#include "xrd_match/reference/catalog.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_file_text(const fs::path& p) {
    std::ifstream ifs(p);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static json delimiter_json(const std::optional<char>& d) {
    if (!d) return "whitespace";
    if (*d == '\t') return "tab";
    return std::string(1, *d);
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << xrd_match::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    std::string yaml_text;
    if (!path.empty()) {
        yaml_text = read_file_text(path);
    } else if (use_stdin) {
        yaml_text = read_stdin();
    } else {
        yaml_text = yaml_arg;
    }

    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    if (!path.empty() && !fs::is_regular_file(path)) {
        result["errors"].push_back("config file not found: " + path);
        print_json(result);
        return strict_exit ? 1 : 0;
    }

    try {
        YAML::Node node = YAML::Load(yaml_text);
        xrd_match::config::Config cfg = xrd_match::config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;
        if (cfg.cleaning.smooth_window > 1 && cfg.cleaning.smooth_window % 2 == 0) {
            result["warnings"].push_back("cleaning.smooth_window is even; " +
                                         std::to_string(cfg.cleaning.smooth_window + 1) + " will be used");
        }
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(e.what());
    } catch (const xrd_match::XrdMatchError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// detect-format <file>
// ============================================================================
int cmd_detect_format(const std::string& path) {
    namespace io = xrd_match::io;

    const io::FormatHint hint = io::detect_format(path);
    json result = {
        {"path", path},
        {"exists", fs::exists(path)},
        {"detected", hint.detected},
        {"skip_rows", hint.skip_rows},
        {"columns", {hint.columns[0], hint.columns[1]}},
        {"delimiter", delimiter_json(hint.delimiter)},
        {"encoding", hint.encoding},
    };

    try {
        const io::ReadResult read = io::read_series(path);
        result["readable"] = true;
        result["rows"] = read.table.size();
        result["strategy"] = io::describe_read_options(read.options);
        result["failed_attempts"] = read.failures;
    } catch (const xrd_match::IngestFormatError& e) {
        result["readable"] = false;
        result["error"] = e.what();
    }

    print_json(result);
    return result["readable"].get<bool>() ? 0 : 1;
}

// ============================================================================
// extract-card <file> [--symbol S] [--threshold T] [--output-dir D]
// ============================================================================
int cmd_extract_card(const std::string& card, const std::string& symbol, double threshold,
                     const std::string& output_dir) {
    json result;
    result["card"] = card;
    result["symbol"] = symbol;
    result["intensity_threshold"] = threshold;

    try {
        const auto out = xrd_match::reference::extract_card(card, symbol, threshold,
                                                             output_dir.empty() ? fs::current_path()
                                                                                : fs::path(output_dir));
        result["success"] = true;
        result["phase"] = out.phase;
        result["peaks"] = out.angles.size();
        result["angles"] = out.angles;
        result["output"] = out.output.string();
    } catch (const xrd_match::XrdMatchError& e) {
        result["success"] = false;
        result["error"] = e.what();
    }

    print_json(result);
    return result["success"].get<bool>() ? 0 : 1;
}

// ============================================================================
// list-references <dir> [--pattern G]
// ============================================================================
int cmd_list_references(const std::string& dir, const std::string& pattern) {
    namespace ref = xrd_match::reference;

    json result;
    result["dir"] = dir;
    result["pattern"] = pattern;
    result["files"] = json::array();

    if (!fs::is_directory(dir)) {
        result["error"] = "directory not found";
        print_json(result);
        return 1;
    }

    const auto& pool = xrd_match::config::default_symbol_pool();
    for (const auto& path : xrd_match::core::glob(dir, pattern)) {
        json entry;
        entry["path"] = path.string();
        const bool extracted = ref::is_extracted_format(path);
        entry["format"] = extracted ? "extracted" : "raw";
        try {
            const auto loaded = ref::load_references(
                {path}, extracted ? ref::ReferenceFormat::EXTRACTED : ref::ReferenceFormat::RAW, pool);
            entry["phases"] = loaded.loaded_phases;
            entry["peaks"] = loaded.catalog.size();
        } catch (const xrd_match::NoReferenceDataError& e) {
            entry["phases"] = json::array();
            entry["peaks"] = 0;
            entry["error"] = e.what();
        }
        result["files"].push_back(entry);
    }

    print_json(result);
    return 0;
}

void print_usage() {
    std::cerr << "Usage: xrd_match_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  get-schema                      Print config JSON schema\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]  Validate config\n"
              << "  detect-format <file>            Show how a data file would be read\n"
              << "  extract-card <file> [--symbol S] [--threshold T] [--output-dir D]  Write reference_<phase>.txt\n"
              << "  list-references <dir> [--pattern G]  List reference files and their phases\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");
        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "Error: validate-config requires --path, --yaml or --stdin" << std::endl;
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "detect-format") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "Error: detect-format requires <file>" << std::endl;
            return 1;
        }
        return cmd_detect_format(path);
    }

    if (command == "extract-card") {
        std::string card = get_positional(0);
        if (card.empty()) {
            std::cerr << "Error: extract-card requires <file>" << std::endl;
            return 1;
        }
        std::string symbol = get_arg("--symbol");
        if (symbol.empty()) symbol = xrd_match::config::ReferenceConfig{}.card_symbol;
        double threshold = xrd_match::reference::kDefaultCardIntensityThreshold;
        std::string threshold_str = get_arg("--threshold");
        if (!threshold_str.empty()) {
            const auto parsed = xrd_match::core::parse_double(threshold_str);
            if (!parsed) {
                std::cerr << "Error: invalid --threshold: " << threshold_str << std::endl;
                return 1;
            }
            threshold = *parsed;
        }
        return cmd_extract_card(card, symbol, threshold, get_arg("--output-dir"));
    }

    if (command == "list-references") {
        std::string dir = get_positional(0);
        if (dir.empty()) {
            std::cerr << "Error: list-references requires <dir>" << std::endl;
            return 1;
        }
        std::string pattern = get_arg("--pattern");
        if (pattern.empty()) pattern = xrd_match::config::ReferenceConfig{}.pattern;
        return cmd_list_references(dir, pattern);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
