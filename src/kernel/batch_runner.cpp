#include "kernel/batch_runner.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <memory>
#include <tuple>
#include <utility>
#include <iostream>
#include <random>
#include <syncstream>

std::vector<TraceSlot> load_traces(const std::vector<std::string> &paths, uint32_t page_shift) {
  std::vector<TraceSlot> slots;
  slots.reserve(paths.size());
  for (const auto &path : paths) {
    TraceSlot slot{path, std::nullopt, ""};
    try {
      slot.trace = load_trace(path, page_shift);
    } catch (const TraceError &e) {
      slot.error = e.what();
      std::cerr << "Warning: skipping trace " << path << ": " << e.what() << "\n";
    }
    slots.push_back(std::move(slot));
  }
  return slots;
}

std::vector<SimulationResult> sweep_frames(const Trace &trace, PolicyKind policy,
                                           uint32_t step, uint32_t seed) {
  if (step == 0)
    throw ConfigurationError("sweep step must be positive");

  const uint64_t distinct = distinct_page_count(trace);
  std::vector<SimulationResult> series;
  for (uint64_t k = step; ; k += step) {
    auto r = simulate(trace, policy, static_cast<uint32_t>(k), seed);
    series.push_back(r);
    // Past the working-set size nothing is ever evicted.
    if (r.write_backs == 0 || k >= distinct) break;
  }
  return series;
}

/**************** BatchWorker ****************/

BatchWorker::BatchWorker(uint32_t id, Channel<BatchJob> &jobs, JobFn fn)
    : id_(id), jobs_(jobs), fn_(std::move(fn)) {}

void BatchWorker::start() {
  thread_ = std::thread(&BatchWorker::loop, this);
}

void BatchWorker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void BatchWorker::loop() {
  while (auto job = jobs_.receive()) {
    DEBUG_PRINT(DEBUG_BATCH, "worker %u takes trace %zu policy %zu", id_, job->trace_index, job->policy_index);
    fn_(*job);
    completed_++;
  }
}

/**************** BatchRunner ****************/

BatchRunner::BatchRunner(const Config &cfg, std::vector<TraceSlot> traces)
    : cfg_(cfg), traces_(std::move(traces)) {
  validate_config(cfg_);
}

const Trace &BatchRunner::trace_for(const BatchJob &job) const {
  const TraceSlot &slot = traces_.at(job.trace_index);
  if (!slot.trace)
    throw TraceError(slot.error.empty() ? "trace " + slot.path + " is not loaded" : slot.error);
  return *slot.trace;
}

void BatchRunner::dispatch(const std::vector<PolicyKind> &policies, const BatchWorker::JobFn &fn) {
  Channel<BatchJob> jobs;
  for (size_t t = 0; t < traces_.size(); ++t)
    for (size_t p = 0; p < policies.size(); ++p)
      jobs.send(BatchJob{t, p, policies[p]});
  jobs.close();

  const size_t total = traces_.size() * policies.size();
  const uint32_t n = static_cast<uint32_t>(std::min<size_t>(cfg_.workers, std::max<size_t>(total, 1)));

  std::vector<std::unique_ptr<BatchWorker>> workers;
  workers.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    workers.push_back(std::make_unique<BatchWorker>(i, jobs, fn));
    workers.back()->start();
  }
  for (auto &w : workers) w->join();
}

std::vector<DataOutcome> BatchRunner::run_data(const std::vector<PolicyKind> &policies) {
  std::vector<DataOutcome> outcomes;
  std::mutex outcomes_mtx;

  dispatch(policies, [&](const BatchJob &job) {
    DataOutcome out;
    out.trace_index = job.trace_index;
    out.policy_index = job.policy_index;
    out.policy = job.policy;
    out.trace_id = file_stem(traces_[job.trace_index].path);

    try {
      const Trace &trace = trace_for(job);
      out.trace_id = trace.id;
      out.result = simulate(trace, job.policy, cfg_.frames, cfg_.seed);
      if (cfg_.sweep_step > 0)
        out.sweep = sweep_frames(trace, job.policy, cfg_.sweep_step, cfg_.seed);
      std::osyncstream(std::cout) << "  finished " << policy_name(job.policy)
                                  << " on " << out.trace_id << "\n";
    } catch (const std::exception &e) {
      out.error = e.what();
      std::osyncstream(std::cerr) << "  " << policy_name(job.policy) << " on "
                                  << out.trace_id << " failed: " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(outcomes_mtx);
    outcomes.push_back(std::move(out));
  });

  std::sort(outcomes.begin(), outcomes.end(), [](const DataOutcome &a, const DataOutcome &b) {
    return std::tie(a.trace_index, a.policy_index) < std::tie(b.trace_index, b.policy_index);
  });
  return outcomes;
}

std::vector<MemoryOutcome> BatchRunner::run_memory(const std::vector<PolicyKind> &policies,
                                                   MemoryCriterion criterion) {
  std::vector<MemoryOutcome> outcomes;
  std::mutex outcomes_mtx;

  dispatch(policies, [&](const BatchJob &job) {
    MemoryOutcome out;
    out.trace_index = job.trace_index;
    out.policy_index = job.policy_index;
    out.policy = job.policy;
    out.trace_id = file_stem(traces_[job.trace_index].path);

    try {
      const Trace &trace = trace_for(job);
      out.trace_id = trace.id;
      out.result = find_minimum_memory(trace, job.policy, criterion, cfg_.seed);
      std::osyncstream(std::cout) << "  optimal memory for " << out.trace_id << " with "
                                  << policy_name(job.policy) << " is "
                                  << out.result->frames << " frames\n";
    } catch (const std::exception &e) {
      out.error = e.what();
      std::osyncstream(std::cerr) << "  " << policy_name(job.policy) << " on "
                                  << out.trace_id << " failed: " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(outcomes_mtx);
    outcomes.push_back(std::move(out));
  });

  std::sort(outcomes.begin(), outcomes.end(), [](const MemoryOutcome &a, const MemoryOutcome &b) {
    return std::tie(a.trace_index, a.policy_index) < std::tie(b.trace_index, b.policy_index);
  });
  return outcomes;
}
