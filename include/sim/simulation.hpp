#pragma once
#include "config.hpp"
#include "paging/frame_table.hpp"
#include "paging/page_replacement_policy.hpp"
#include "trace/trace.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <random>
#include <string>

enum class SimState { READY, RUNNING, DONE };

// Outcome of one run of one trace through one policy at one frame count.
struct SimulationResult {
  uint64_t faults = 0;             // disk reads
  uint64_t hits = 0;
  uint64_t total_references = 0;
  uint32_t frames = 0;
  PolicyKind policy = PolicyKind::LRU;
  std::string trace_id;
  uint64_t evictions = 0;
  uint64_t write_backs = 0;        // dirty evictions, i.e. disk writes

  double fault_rate() const {
    return total_references ? static_cast<double>(faults) / total_references : 0.0;
  }
  bool operator==(const SimulationResult &) const = default;
};

// What happened on a single reference.
struct StepRecord {
  uint64_t index;
  PageReference ref;
  bool hit;
  std::optional<uint32_t> evicted;
  bool wrote_back = false;
};

// Drives one trace through one policy over a fixed frame count.
// READY -> RUNNING on the first step, DONE once the trace is exhausted.
// The trace must outlive the engine.
class SimulationEngine {
public:
  SimulationEngine(const Trace &trace, PolicyKind policy, uint32_t frames,
                   std::mt19937 rng = std::mt19937{}, std::ostream *step_log = nullptr);

  // Processes the next reference. Empty once the trace is exhausted.
  std::optional<StepRecord> step();
  SimulationResult run();

  // Requires DONE.
  SimulationResult result() const;
  SimulationResult counters() const; // snapshot, any state

  uint64_t faults() const { return faults_; }
  uint64_t write_backs() const { return write_backs_; }
  SimState state() const { return state_; }
  const FrameTable &frame_table() const { return table_; }

private:
  void log_step(const StepRecord &rec) const;

  const Trace &trace_;
  size_t next_{0};
  SimState state_{SimState::READY};
  FrameTable table_;
  ReplacementPolicy policy_;
  std::ostream *step_log_;

  uint64_t faults_{0};
  uint64_t hits_{0};
  uint64_t evictions_{0};
  uint64_t write_backs_{0};
};

// Convenience: fresh engine, run to completion. The Random policy is seeded with `seed`.
SimulationResult simulate(const Trace &trace, PolicyKind policy, uint32_t frames,
                          uint32_t seed = 1, std::ostream *step_log = nullptr);
