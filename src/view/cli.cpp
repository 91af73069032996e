#include "view/cli.hpp"
#include "errors.hpp"
#include "kernel/batch_runner.hpp"
#include "sim/simulation.hpp"
#include "trace/trace.hpp"
#include "util.hpp"
#include "view/reporter.hpp"

#include <utility>

CLI::CLI(std::vector<std::string> args, std::ostream &out, std::ostream &err)
    : args_(std::move(args)), out_(out), err_(err) {}

void CLI::print_usage() const {
  err_ << "usage:\n"
       << "  pagesim [--config <path>] <frames> <lru|fifo|random> <quiet|debug> <tracefile>\n"
       << "  pagesim [--config <path>] memory [faults|writes]\n"
       << "  pagesim [--config <path>] data [lru|fifo|random]\n"
       << "data mode writes per-trace sweep CSVs only when the config sets sweep-step > 0\n";
}

int CLI::run() {
  std::vector<std::string> args = args_;
  std::string config_path = "config.txt";

  try {
    if (args.size() >= 2 && args[0] == "--config") {
      config_path = args[1];
      args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
      print_usage();
      return args.empty() ? 2 : 0;
    }

    cfg_ = load_config(config_path);

    const std::string mode = to_lower(args[0]);
    if (mode == "memory") return run_memory(args);
    if (mode == "data") return run_data(args);
    return run_single(args);

  } catch (const ConfigurationError &e) {
    err_ << "Configuration error: " << e.what() << "\n";
    print_usage();
    return 2;
  } catch (const TraceError &e) {
    err_ << "Trace error: " << e.what() << "\n";
    return 1;
  } catch (const InvariantViolation &e) {
    err_ << "Internal error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    err_ << "Error: " << e.what() << "\n";
    return 1;
  }
}

int CLI::run_single(const std::vector<std::string> &args) {
  if (args.size() != 4)
    throw ConfigurationError("expected <frames> <lru|fifo|random> <quiet|debug> <tracefile>");

  cfg_.frames = parse_frame_count(args[0]);
  cfg_.policy = parse_policy(args[1]);
  cfg_.verbosity = parse_verbosity(args[2]);
  validate_config(cfg_);

  Trace trace = load_trace(args[3], cfg_.page_shift);
  std::ostream *step_log = cfg_.verbosity == Verbosity::DEBUG ? &out_ : nullptr;
  SimulationResult r = simulate(trace, cfg_.policy, cfg_.frames, cfg_.seed, step_log);

  Reporter reporter(cfg_);
  out_ << reporter.format_result(r);
  return 0;
}

int CLI::run_memory(const std::vector<std::string> &args) {
  if (args.size() > 2)
    throw ConfigurationError("expected memory [faults|writes]");
  if (args.size() == 2)
    cfg_.criterion = parse_criterion(args[1]);
  validate_config(cfg_);

  BatchRunner runner(cfg_, load_traces(cfg_.traces, cfg_.page_shift));
  out_ << "searching minimum memory (" << criterion_name(cfg_.criterion) << ") on "
       << cfg_.traces.size() << " traces with " << cfg_.workers << " workers\n";
  auto outcomes = runner.run_memory(all_policies(), cfg_.criterion);

  Reporter reporter(cfg_);
  std::string report = reporter.build_memory_report(outcomes);
  out_ << report;
  reporter.write_log("memory", report);

  for (const auto &o : outcomes)
    if (!o.ok()) return 1;
  return 0;
}

int CLI::run_data(const std::vector<std::string> &args) {
  if (args.size() > 2)
    throw ConfigurationError("expected data [lru|fifo|random]");

  std::vector<PolicyKind> policies = all_policies();
  if (args.size() == 2)
    policies = {parse_policy(args[1])};
  validate_config(cfg_);

  BatchRunner runner(cfg_, load_traces(cfg_.traces, cfg_.page_shift));
  out_ << "running " << policies.size() << " policies on " << cfg_.traces.size()
       << " traces at " << cfg_.frames << " frames\n";
  auto outcomes = runner.run_data(policies);

  Reporter reporter(cfg_);
  std::string report = reporter.build_data_report(outcomes);
  out_ << report;
  reporter.write_log("data", report);

  if (cfg_.sweep_step > 0) {
    for (const auto &path : reporter.write_sweep_csvs(outcomes))
      out_ << "  stored sweep to " << path << "\n";
  }

  for (const auto &o : outcomes)
    if (!o.ok()) return 1;
  return 0;
}
