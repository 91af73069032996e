#include "sim/memory_finder.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <optional>
#include <random>

bool criterion_is_monotone(PolicyKind policy, MemoryCriterion criterion) {
  switch (criterion) {
    // LRU keeps the k-frame resident set inside the (k+1)-frame one. FIFO
    // without capacity faults keeps the last k first-loaded pages, which
    // also nest. Random guarantees neither.
    case MemoryCriterion::NO_CAPACITY_FAULTS:
      return policy == PolicyKind::LRU || policy == PolicyKind::FIFO;
    // Only the LRU inclusion property carries over to dirty evictions.
    case MemoryCriterion::NO_WRITE_BACKS:
      return policy == PolicyKind::LRU;
  }
  return false;
}

static bool broken(const SimulationEngine &engine, MemoryCriterion criterion, uint64_t baseline) {
  if (criterion == MemoryCriterion::NO_CAPACITY_FAULTS)
    return engine.faults() > baseline;
  return engine.write_backs() > 0;
}

bool meets_criterion(const Trace &trace, PolicyKind policy, uint32_t frames,
                     MemoryCriterion criterion, uint64_t baseline, uint32_t seed) {
  SimulationEngine engine(trace, policy, frames, std::mt19937{seed});
  while (engine.step()) {
    if (broken(engine, criterion, baseline)) return false;
  }
  return !broken(engine, criterion, baseline);
}

MinimumMemoryResult find_minimum_memory(const Trace &trace, PolicyKind policy,
                                        MemoryCriterion criterion, uint32_t seed) {
  if (trace.empty())
    throw TraceError("trace '" + trace.id + "' contains no references");

  MinimumMemoryResult res;
  res.policy = policy;
  res.trace_id = trace.id;
  res.criterion = criterion;
  res.distinct_pages = distinct_page_count(trace);
  res.search = criterion_is_monotone(policy, criterion) ? SearchKind::BINARY : SearchKind::LINEAR;

  const uint32_t upper = static_cast<uint32_t>(res.distinct_pages);
  auto probe = [&](uint32_t k) {
    res.simulations++;
    bool ok = meets_criterion(trace, policy, k, criterion, res.distinct_pages, seed);
    DEBUG_PRINT(DEBUG_SIMULATION, "probe %s k=%u -> %s", trace.id.c_str(), k, ok ? "pass" : "fail");
    return ok;
  };

  std::optional<uint32_t> best;
  if (res.search == SearchKind::BINARY) {
    uint32_t lo = 1, hi = upper;
    while (lo <= hi) {
      uint32_t mid = lo + (hi - lo) / 2;
      if (probe(mid)) {
        best = mid;
        if (mid == 1) break;
        hi = mid - 1;
      } else {
        lo = mid + 1;
      }
    }
  } else {
    for (uint32_t k = 1; k <= upper; k++) {
      if (probe(k)) { best = k; break; }
    }
  }

  if (!best)
    throw InvariantViolation("no frame count up to " + std::to_string(upper) + " meets the " +
                             criterion_name(criterion) + " criterion for " + policy_name(policy) +
                             " on " + trace.id);

  res.frames = *best;
  res.faults = simulate(trace, policy, res.frames, seed).faults;
  return res;
}

std::string search_kind_name(SearchKind kind) {
  return kind == SearchKind::BINARY ? "binary" : "linear";
}
