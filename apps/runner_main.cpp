#include "xrd_match/config/configuration.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/events.hpp"
#include "xrd_match/core/types.hpp"
#include "xrd_match/core/utils.hpp"
#include "xrd_match/pipeline/analysis.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

namespace core = xrd_match::core;
namespace config = xrd_match::config;
namespace pipeline = xrd_match::pipeline;

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

struct RunArgs {
  std::string config_path;
  std::string input;
  std::vector<std::string> references;
  std::string reference_dir;
  std::string runs_dir;
  std::string policy;
  std::optional<double> tolerance;
  bool dry_run = false;
  bool config_from_stdin = false;
};

} // namespace

void print_usage() {
  std::cout << "Usage: xrd_match_runner <command> [options]\n\n"
            << "Commands:\n"
            << "  run      Detect peaks and identify phases in one pattern\n"
            << "\nOptions:\n"
            << "  --config <path>         Path to config.yaml ('-' with --stdin)\n"
            << "  --input <path>          Diffraction pattern (2theta, intensity)\n"
            << "  --reference <path>      Reference file (repeatable)\n"
            << "  --reference-dir <path>  Directory searched with reference.pattern\n"
            << "  --runs-dir <path>       Directory for run outputs\n"
            << "  --policy <name>         phase_first | peak_first\n"
            << "  --tolerance <deg>       Match tolerance override\n"
            << "  --dry-run               Validate inputs only\n"
            << "  --stdin                 Read config YAML from stdin\n"
            << std::endl;
}

int run_command(const RunArgs &args) {
  using namespace xrd_match;

  const bool use_stdin_config =
      args.config_from_stdin || (args.config_path == "-");

  fs::path input(args.input);
  if (!fs::exists(input)) {
    std::cerr << "Error: Input file not found: " << args.input << std::endl;
    return 1;
  }

  config::Config cfg;
  std::string cfg_text;
  try {
    if (use_stdin_config) {
      std::ostringstream ss;
      ss << std::cin.rdbuf();
      cfg_text = ss.str();
      if (cfg_text.empty()) {
        std::cerr << "Error: --stdin provided but no config YAML received"
                  << std::endl;
        return 1;
      }
      cfg = config::Config::from_yaml(YAML::Load(cfg_text));
    } else {
      if (!fs::exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path
                  << std::endl;
        return 1;
      }
      cfg = config::Config::load(args.config_path);
    }

    if (!args.policy.empty())
      cfg.matching.policy = args.policy;
    if (args.tolerance)
      cfg.matching.tolerance = *args.tolerance;
    cfg.validate();
  } catch (const YAML::Exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const XrdMatchError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::vector<fs::path> references;
  for (const auto &r : args.references) {
    references.emplace_back(r);
  }
  if (!args.reference_dir.empty()) {
    if (!fs::is_directory(args.reference_dir)) {
      std::cerr << "Error: Reference directory not found: "
                << args.reference_dir << std::endl;
      return 1;
    }
    for (const auto &p : core::glob(args.reference_dir, cfg.reference.pattern)) {
      references.push_back(p);
    }
  }

  std::string run_id = core::get_run_id(input.stem().string());
  fs::path run_dir = fs::path(args.runs_dir) / run_id;
  fs::create_directories(run_dir / "logs");
  fs::create_directories(run_dir / "outputs");

  if (use_stdin_config) {
    core::write_text(run_dir / "config.yaml", cfg_text);
  } else {
    core::copy_config(args.config_path, run_dir / "config.yaml");
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  std::vector<std::string> reference_names;
  for (const auto &r : references) {
    reference_names.push_back(r.string());
  }

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", use_stdin_config ? "-" : args.config_path},
                     {"input", args.input},
                     {"references", reference_names},
                     {"run_dir", run_dir.string()},
                     {"policy", cfg.matching.policy},
                     {"tolerance", cfg.matching.tolerance},
                     {"dry_run", args.dry_run}},
                    log_file);

  if (references.empty()) {
    emitter.warning(run_id, "No reference files given; phase identification disabled",
                    log_file);
  }

  if (args.dry_run) {
    emitter.stage_start(run_id, Stage::INGEST, log_file);
    emitter.stage_end(run_id, Stage::INGEST, "skipped",
                      {{"reason", "dry_run"}, {"input", args.input}}, log_file);
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  const auto result = pipeline::run_analysis(input, references, cfg, run_id,
                                             run_dir / "outputs", log_file);
  emitter.run_end(run_id, result.success, result.status, log_file);

  if (!result.success) {
    std::cerr << "Error during " << stage_to_string(result.last_stage) << ": "
              << result.error << std::endl;
    return 1;
  }
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  RunArgs args;

  try {
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc)
        args.config_path = argv[++i];
      else if (arg == "--input" && i + 1 < argc)
        args.input = argv[++i];
      else if (arg == "--reference" && i + 1 < argc)
        args.references.push_back(argv[++i]);
      else if (arg == "--reference-dir" && i + 1 < argc)
        args.reference_dir = argv[++i];
      else if (arg == "--runs-dir" && i + 1 < argc)
        args.runs_dir = argv[++i];
      else if (arg == "--policy" && i + 1 < argc)
        args.policy = argv[++i];
      else if (arg == "--tolerance" && i + 1 < argc)
        args.tolerance = std::stod(argv[++i]);
      else if (arg == "--dry-run")
        args.dry_run = true;
      else if (arg == "--stdin")
        args.config_from_stdin = true;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: invalid argument: " << e.what() << std::endl;
    return 1;
  }

  if (command == "run") {
    if ((args.config_path.empty() && !args.config_from_stdin) ||
        args.input.empty() || args.runs_dir.empty()) {
      std::cerr << "Error: --config, --input, and --runs-dir are required"
                << std::endl;
      return 1;
    }
    return run_command(args);
  }

  print_usage();
  return 1;
}
