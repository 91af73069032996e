#pragma once
#include "config.hpp"
#include "kernel/batch_runner.hpp"
#include "sim/simulation.hpp"
#include <string>
#include <vector>

class Reporter {
public:
  Reporter(const Config &cfg);
  std::string format_result(const SimulationResult &r) const; // single-run summary
  std::string build_data_report(const std::vector<DataOutcome> &outcomes) const;
  std::string build_memory_report(const std::vector<MemoryOutcome> &outcomes) const;
  std::string sweep_csv(const std::vector<SimulationResult> &series) const;

  // Writes <out-dir>/<trace>-<policy>.csv for every swept outcome. Returns the paths written.
  std::vector<std::string> write_sweep_csvs(const std::vector<DataOutcome> &outcomes) const;
  void write_log(const std::string &title, const std::string &report) const;

private:
  Config cfg_;
};
