#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/events.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/parallel/collectives.hpp"
#include "insar_rate/parallel/mpi_context.hpp"
#include "insar_rate/pipeline/process.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

namespace config = insar_rate::config;
namespace core = insar_rate::core;
namespace parallel = insar_rate::parallel;
namespace pipeline = insar_rate::pipeline;

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

struct RunOptions {
  std::string config_path;
  std::string ifg_list;
  int rows = 0;
  int cols = 0;
  bool dry_run = false;
};

std::vector<fs::path> find_interferograms(const config::Config &cfg) {
  std::vector<fs::path> paths;
  if (!cfg.input.ifg_list.empty()) {
    paths = core::read_path_list(cfg.input.ifg_list);
  } else if (!cfg.input.ifg_dir.empty()) {
    paths = core::discover_files(cfg.input.ifg_dir, cfg.input.pattern);
  } else {
    throw insar_rate::ConfigError(
        "Neither input.ifg_list nor input.ifg_dir is set");
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

fs::path rank_log_path(const config::Config &cfg, int rank) {
  const std::string stem = core::file_stem(cfg.output.log_file);
  return fs::path(cfg.output.tmpdir) /
         (stem + "_rank" + std::to_string(rank) + ".jsonl");
}

int run_command(const RunOptions &opts, parallel::ExecutionContext &ctx) {
  config::Config cfg = config::Config::load(opts.config_path);
  if (!opts.ifg_list.empty()) {
    cfg.input.ifg_list = opts.ifg_list;
  }
  if (opts.rows > 0) {
    cfg.tiles.rows = opts.rows;
  }
  if (opts.cols > 0) {
    cfg.tiles.cols = opts.cols;
  }
  cfg.validate();

  if (ctx.is_leader()) {
    fs::create_directories(cfg.output.tmpdir);
  }
  ctx.barrier();

  const std::string run_id =
      parallel::broadcast_value(ctx, core::get_run_id());

  std::ofstream event_log_file(rank_log_path(cfg, ctx.rank()), std::ios::app);
  if (!event_log_file) {
    throw insar_rate::IOError("Cannot open event log " +
                              rank_log_path(cfg, ctx.rank()).string());
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream leader_out(&tee_buf);
  std::ostream *out = ctx.is_leader() ? &leader_out
                                      : static_cast<std::ostream *>(
                                            &event_log_file);
  core::EventEmitter events(run_id, ctx.rank(), out);

  try {
    const std::vector<fs::path> paths = find_interferograms(cfg);

    core::json start;
    start["config"] = fs::absolute(opts.config_path).string();
    start["tmpdir"] = cfg.output.tmpdir;
    start["num_ifgs"] = static_cast<int>(paths.size());
    start["ranks"] = ctx.size();
    start["tiles"] = {cfg.tiles.rows, cfg.tiles.cols};
    events.run_start(start);

    if (ctx.is_leader()) {
      std::cout << "Run ID: " << run_id << std::endl;
      std::cout << "Interferograms: " << paths.size() << std::endl;
      std::cout << "Output: " << cfg.output.tmpdir << std::endl;
    }

    if (opts.dry_run) {
      if (ctx.is_leader()) {
        for (const auto &p : paths) {
          std::cout << "  " << p.string() << std::endl;
        }
        std::cout << "Dry run - no processing" << std::endl;
      }
      events.run_end(true, "dry_run");
      return 0;
    }

    const pipeline::ProcessResult result = pipeline::process_ifgs(
        ctx, paths, cfg, cfg.tiles.rows, cfg.tiles.cols, events);

    if (ctx.is_leader()) {
      core::json summary = pipeline::result_to_json(result);
      summary["run_id"] = run_id;
      summary["ranks"] = ctx.size();
      core::write_text(fs::path(cfg.output.tmpdir) / "run_summary.json",
                       summary.dump(2));
      std::cout << "Reference pixel: (" << result.ref_pixel.x << ", "
                << result.ref_pixel.y << ")" << std::endl;
    }
    events.run_end(true, "ok");
    return 0;
  } catch (const std::exception &e) {
    events.error(e.what());
    events.run_end(false, "error");
    throw;
  }
}

int validate_config_command(const std::string &config_path) {
  const config::Config cfg = config::Config::load(config_path);
  cfg.validate();
  std::cout << "Config OK: " << config_path << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"insar_rate - InSAR correction and rate estimation"};
  app.require_subcommand(1);

  RunOptions run_opts;
  auto run_cmd = app.add_subcommand("run", "Run the pipeline");
  run_cmd->add_option("--config", run_opts.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--rows", run_opts.rows,
                      "Tile rows (overrides tiles.rows)");
  run_cmd->add_option("--cols", run_opts.cols,
                      "Tile columns (overrides tiles.cols)");
  run_cmd->add_option("--ifg-list", run_opts.ifg_list,
                      "File listing one interferogram per line");
  run_cmd->add_flag("--dry-run", run_opts.dry_run, "Dry run");

  std::string validate_path;
  auto validate_cmd =
      app.add_subcommand("validate-config", "Parse and validate a config");
  validate_cmd->add_option("--config", validate_path, "Path to config.yaml")
      ->required();

  CLI11_PARSE(app, argc, argv);

  if (validate_cmd->parsed()) {
    try {
      return validate_config_command(validate_path);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  }

  parallel::MpiSession session(argc, argv);
  parallel::MpiContext ctx;
  try {
    return run_command(run_opts, ctx);
  } catch (const std::exception &e) {
    std::cerr << "[rank " << ctx.rank() << "] Error: " << e.what()
              << std::endl;
    if (ctx.size() > 1) {
      parallel::MpiSession::abort(1);
    }
    return 1;
  }
}
