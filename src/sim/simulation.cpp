#include "sim/simulation.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <format>
#include <string>

SimulationEngine::SimulationEngine(const Trace &trace, PolicyKind policy, uint32_t frames,
                                   std::mt19937 rng, std::ostream *step_log)
    : trace_(trace),
      table_(frames),
      policy_(make_policy(policy, rng)),
      step_log_(step_log)
{
  if (trace_.empty())
    throw TraceError("trace '" + trace_.id + "' contains no references");
}

std::optional<StepRecord> SimulationEngine::step() {
  if (state_ == SimState::DONE) return std::nullopt;

  if (next_ >= trace_.size()) {
    state_ = SimState::DONE;
    return std::nullopt;
  }
  state_ = SimState::RUNNING;

  const uint64_t i = next_;
  const PageReference &ref = trace_.references[next_++];
  StepRecord rec{i, ref, false, std::nullopt, false};

  if (table_.lookup(ref.page)) {
    hits_++;
    rec.hit = true;
    table_.touch(ref.page, i);
    notify_access(policy_, ref.page, i);
  } else {
    faults_++;
    if (table_.is_full()) {
      uint32_t victim = select_victim(policy_, table_);
      Frame old = table_.evict(victim);
      notify_evict(policy_, victim);
      evictions_++;
      rec.evicted = victim;
      if (old.dirty) {
        write_backs_++;
        rec.wrote_back = true;
      }
    }
    table_.install(ref.page, i);
    notify_load(policy_, ref.page, i);
  }

  if (ref.mode == AccessMode::WRITE)
    table_.mark_dirty(ref.page);

  DEBUG_PRINT(DEBUG_SIMULATION, "step %llu page %u %s", (unsigned long long)i, ref.page, rec.hit ? "hit" : "fault");
  if (step_log_) log_step(rec);

  if (next_ >= trace_.size())
    state_ = SimState::DONE;
  return rec;
}

SimulationResult SimulationEngine::run() {
  while (step()) {}
  return result();
}

SimulationResult SimulationEngine::result() const {
  if (state_ != SimState::DONE)
    throw InvariantViolation("result requested before the run finished");
  return counters();
}

SimulationResult SimulationEngine::counters() const {
  SimulationResult r;
  r.faults = faults_;
  r.hits = hits_;
  r.total_references = faults_ + hits_;
  r.frames = table_.capacity();
  r.policy = policy_kind(policy_);
  r.trace_id = trace_.id;
  r.evictions = evictions_;
  r.write_backs = write_backs_;
  return r;
}

void SimulationEngine::log_step(const StepRecord &rec) const {
  std::string line = std::format("[{:>8}] {:<5} page {:#07x} addr {:#010x} {}",
                                 rec.index, access_mode_name(rec.ref.mode), rec.ref.page,
                                 rec.ref.address, rec.hit ? "hit" : "FAULT");
  if (rec.evicted)
    line += std::format(", evict page {:#07x}{}", *rec.evicted, rec.wrote_back ? " (write back)" : "");
  *step_log_ << line << "\n";
}

SimulationResult simulate(const Trace &trace, PolicyKind policy, uint32_t frames,
                          uint32_t seed, std::ostream *step_log) {
  SimulationEngine engine(trace, policy, frames, std::mt19937{seed}, step_log);
  return engine.run();
}
