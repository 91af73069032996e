#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class PolicyKind {
  LRU,
  FIFO,
  RANDOM
};

enum class Verbosity {
  QUIET,
  DEBUG
};

// Predicate used by the minimum-memory search.
enum class MemoryCriterion {
  NO_CAPACITY_FAULTS, // every page faults exactly once
  NO_WRITE_BACKS      // no dirty page is ever evicted
};

struct Config {
  uint32_t frames = 64;
  PolicyKind policy = PolicyKind::LRU;
  Verbosity verbosity = Verbosity::QUIET;
  uint32_t seed = 1;
  uint32_t page_shift = 12;         // 4 KiB pages
  uint32_t workers = 4;             // batch worker threads
  std::string out_dir = "out";
  uint32_t sweep_step = 0;          // 0 = no frame sweep in data mode
  std::string log_file = "pagesim-log.txt";
  MemoryCriterion criterion = MemoryCriterion::NO_CAPACITY_FAULTS;

  std::vector<std::string> traces = {
    "traces/gcc.trace",
    "traces/sixpack.trace",
    "traces/swim.trace",
  };
};

// Missing file keeps defaults. Throws ConfigurationError on bad values.
Config load_config(const std::string &path);
void validate_config(const Config &cfg);

PolicyKind parse_policy(const std::string &name);
Verbosity parse_verbosity(const std::string &name);
MemoryCriterion parse_criterion(const std::string &name);
uint32_t parse_frame_count(const std::string &value);

std::string policy_name(PolicyKind policy);
std::string criterion_name(MemoryCriterion criterion);

inline const std::vector<PolicyKind> &all_policies() {
  static const std::vector<PolicyKind> policies = {
    PolicyKind::LRU, PolicyKind::FIFO, PolicyKind::RANDOM
  };
  return policies;
}
