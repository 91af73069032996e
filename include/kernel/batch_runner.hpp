#pragma once

#include "config.hpp"
#include "data_structures/channel.hpp"
#include "sim/memory_finder.hpp"
#include "sim/simulation.hpp"
#include "trace/trace.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// A trace as seen by a batch: either loaded, or the reason it could not be.
struct TraceSlot {
  std::string path;
  std::optional<Trace> trace;
  std::string error;
};

// Loads every path; a failing trace is recorded, never thrown.
std::vector<TraceSlot> load_traces(const std::vector<std::string> &paths, uint32_t page_shift);

// One (trace, policy) combination.
struct BatchJob {
  size_t trace_index;
  size_t policy_index;
  PolicyKind policy;
};

struct DataOutcome {
  size_t trace_index = 0;
  size_t policy_index = 0;
  PolicyKind policy = PolicyKind::LRU;
  std::string trace_id;
  std::optional<SimulationResult> result;
  std::vector<SimulationResult> sweep; // only filled when sweeping
  std::string error;

  bool ok() const { return error.empty(); }
};

struct MemoryOutcome {
  size_t trace_index = 0;
  size_t policy_index = 0;
  PolicyKind policy = PolicyKind::LRU;
  std::string trace_id;
  std::optional<MinimumMemoryResult> result;
  std::string error;

  bool ok() const { return error.empty(); }
};

// Pulls jobs off the shared channel until it is closed and drained.
class BatchWorker {
public:
  using JobFn = std::function<void(const BatchJob &)>;

  BatchWorker(uint32_t id, Channel<BatchJob> &jobs, JobFn fn);
  void start();
  void join();
  uint32_t id() const { return id_; }
  uint32_t completed() const { return completed_.load(); }

private:
  void loop();
  uint32_t id_;
  Channel<BatchJob> &jobs_;
  JobFn fn_;
  std::thread thread_;
  std::atomic<uint32_t> completed_{0};
};

// Runs the Cartesian product of traces x policies on `workers` threads.
// Every job builds its own engine; outcomes come back in (trace, policy) order.
class BatchRunner {
public:
  BatchRunner(const Config &cfg, std::vector<TraceSlot> traces);

  std::vector<DataOutcome> run_data(const std::vector<PolicyKind> &policies);
  std::vector<MemoryOutcome> run_memory(const std::vector<PolicyKind> &policies,
                                        MemoryCriterion criterion);

private:
  void dispatch(const std::vector<PolicyKind> &policies, const BatchWorker::JobFn &fn);
  const Trace &trace_for(const BatchJob &job) const;

  Config cfg_;
  std::vector<TraceSlot> traces_;
};

// Frame counts step, 2*step, ... until a run has no write-backs.
std::vector<SimulationResult> sweep_frames(const Trace &trace, PolicyKind policy,
                                           uint32_t step, uint32_t seed);
