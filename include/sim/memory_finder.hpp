#pragma once
#include "config.hpp"
#include "sim/simulation.hpp"
#include "trace/trace.hpp"

#include <cstdint>
#include <string>

enum class SearchKind { BINARY, LINEAR };

struct MinimumMemoryResult {
  PolicyKind policy = PolicyKind::LRU;
  std::string trace_id;
  MemoryCriterion criterion = MemoryCriterion::NO_CAPACITY_FAULTS;
  uint32_t frames = 0;           // smallest frame count meeting the criterion
  uint64_t distinct_pages = 0;   // working-set size, the fault baseline
  uint64_t faults = 0;           // faults of the run at `frames`
  uint32_t simulations = 0;      // runs (complete or cut short) the search needed
  SearchKind search = SearchKind::LINEAR;
};

// True where the criterion only ever goes from failing to passing as the
// frame count grows, which is what makes bisection valid.
bool criterion_is_monotone(PolicyKind policy, MemoryCriterion criterion);

// One probe at `frames`. Stops as soon as the criterion is already broken.
bool meets_criterion(const Trace &trace, PolicyKind policy, uint32_t frames,
                     MemoryCriterion criterion, uint64_t baseline, uint32_t seed);

// Searches k in [1, distinct pages]. Throws TraceError on an empty trace and
// InvariantViolation if no k qualifies.
MinimumMemoryResult find_minimum_memory(const Trace &trace, PolicyKind policy,
                                        MemoryCriterion criterion = MemoryCriterion::NO_CAPACITY_FAULTS,
                                        uint32_t seed = 1);

std::string search_kind_name(SearchKind kind);
