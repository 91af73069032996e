#include "view/reporter.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

Reporter::Reporter(const Config &cfg) : cfg_(cfg) {}

static std::string percent(double rate) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << rate * 100.0 << "%";
  return oss.str();
}

std::string Reporter::format_result(const SimulationResult &r) const {
  std::ostringstream oss;
  oss << "policy:              " << policy_name(r.policy) << "\n"
      << "trace:               " << r.trace_id << "\n"
      << "total memory frames: " << r.frames << "\n"
      << "events in trace:     " << r.total_references << "\n"
      << "total disk reads:    " << r.faults << "\n"
      << "total disk writes:   " << r.write_backs << "\n"
      << "hits:                " << r.hits << "\n"
      << "fault rate:          " << percent(r.fault_rate()) << "\n";
  return oss.str();
}

std::string Reporter::build_data_report(const std::vector<DataOutcome> &outcomes) const {
  std::ostringstream oss;
  oss << "----------------------------------------------------------------------------------\n";
  oss << "| Trace      | Policy | Frames | Faults     | Hits       | Fault Rate | Writes     |\n";
  oss << "----------------------------------------------------------------------------------\n";

  for (const auto &o : outcomes) {
    oss << "| " << std::left << std::setw(11) << o.trace_id
        << "| " << std::setw(7) << policy_name(o.policy);
    if (o.ok() && o.result) {
      const auto &r = *o.result;
      oss << "| " << std::setw(7) << r.frames
          << "| " << std::setw(11) << r.faults
          << "| " << std::setw(11) << r.hits
          << "| " << std::setw(11) << percent(r.fault_rate())
          << "| " << std::setw(11) << r.write_backs << "|\n";
    } else {
      oss << "| ERROR: " << o.error << "\n";
    }
  }
  oss << "----------------------------------------------------------------------------------\n";
  return oss.str();
}

std::string Reporter::build_memory_report(const std::vector<MemoryOutcome> &outcomes) const {
  std::ostringstream oss;
  oss << "---------------------------------------------------------------------------\n";
  oss << "| Trace      | Policy | Min Frames | Distinct   | Search | Runs   | Check  |\n";
  oss << "---------------------------------------------------------------------------\n";

  for (const auto &o : outcomes) {
    oss << "| " << std::left << std::setw(11) << o.trace_id
        << "| " << std::setw(7) << policy_name(o.policy);
    if (o.ok() && o.result) {
      const auto &r = *o.result;
      oss << "| " << std::setw(11) << r.frames
          << "| " << std::setw(11) << r.distinct_pages
          << "| " << std::setw(7) << search_kind_name(r.search)
          << "| " << std::setw(7) << r.simulations
          << "| " << std::setw(7) << criterion_name(r.criterion) << "|\n";
    } else {
      oss << "| ERROR: " << o.error << "\n";
    }
  }
  oss << "---------------------------------------------------------------------------\n";
  return oss.str();
}

std::string Reporter::sweep_csv(const std::vector<SimulationResult> &series) const {
  std::ostringstream oss;
  oss << "\"frames\",\"faults\",\"hits\",\"writes\",\"fault_rate\"\n";
  for (const auto &r : series) {
    oss << r.frames << "," << r.faults << "," << r.hits << "," << r.write_backs << ","
        << std::fixed << std::setprecision(6) << r.fault_rate() << "\n";
  }
  return oss.str();
}

std::vector<std::string> Reporter::write_sweep_csvs(const std::vector<DataOutcome> &outcomes) const {
  std::vector<std::string> written;
  std::filesystem::path dir = cfg_.out_dir;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "Error: could not create " << dir.string() << ": " << ec.message() << "\n";
    return written;
  }

  for (const auto &o : outcomes) {
    if (!o.ok() || o.sweep.empty()) continue;
    std::filesystem::path path = dir / (o.trace_id + "-" + policy_name(o.policy) + ".csv");
    std::ofstream out(path);
    if (!out) {
      std::cerr << "Error: could not write " << path.string() << "\n";
      continue;
    }
    out << sweep_csv(o.sweep);
    written.push_back(path.string());
  }
  return written;
}

void Reporter::write_log(const std::string &title, const std::string &report) const {
  std::ofstream out(cfg_.log_file, std::ios::app);
  if (!out) {
    std::cerr << "Warning: could not append to " << cfg_.log_file << "\n";
    return;
  }
  out << "===== " << title << " at " << now_string() << " =====\n"
      << report
      << "============================================\n\n";
}
