#include "paging/page_replacement_policy.hpp"
#include "errors.hpp"

#include <string>
#include <type_traits>

/**************** LRU ****************/

void LruPolicy::on_load(uint32_t page, uint64_t) {
  position_[page] = usage_list_.insert(usage_list_.end(), page);
}

void LruPolicy::on_access(uint32_t page, uint64_t) {
  auto it = position_.find(page);
  if (it == position_.end())
    throw InvariantViolation("lru: access to untracked page " + std::to_string(page));
  usage_list_.splice(usage_list_.end(), usage_list_, it->second);
}

void LruPolicy::on_evict(uint32_t page) {
  auto it = position_.find(page);
  if (it == position_.end())
    throw InvariantViolation("lru: eviction of untracked page " + std::to_string(page));
  usage_list_.erase(it->second);
  position_.erase(it);
}

uint32_t LruPolicy::select_victim(const FrameTable &) const {
  if (usage_list_.empty())
    throw InvariantViolation("lru: no resident pages to evict");
  return usage_list_.front();
}

/**************** FIFO ****************/

void FifoPolicy::on_load(uint32_t page, uint64_t) {
  load_queue_.push_back(page);
}

void FifoPolicy::on_access(uint32_t, uint64_t) {}

void FifoPolicy::on_evict(uint32_t page) {
  // The victim is normally the front; anything else is a linear erase.
  if (!load_queue_.empty() && load_queue_.front() == page) {
    load_queue_.pop_front();
    return;
  }
  for (auto it = load_queue_.begin(); it != load_queue_.end(); ++it) {
    if (*it == page) {
      load_queue_.erase(it);
      return;
    }
  }
  throw InvariantViolation("fifo: eviction of untracked page " + std::to_string(page));
}

uint32_t FifoPolicy::select_victim(const FrameTable &) const {
  if (load_queue_.empty())
    throw InvariantViolation("fifo: no resident pages to evict");
  return load_queue_.front();
}

/**************** Random ****************/

RandomPolicy::RandomPolicy(std::mt19937 rng) : rng_(rng) {}

uint32_t RandomPolicy::select_victim(const FrameTable &table) {
  // Every frame is occupied when this is called, so a uniform frame is a
  // uniform resident page.
  const auto &frames = table.frames();
  std::uniform_int_distribution<size_t> pick(0, frames.size() - 1);
  const Frame &frame = frames[pick(rng_)];
  if (frame.free())
    throw InvariantViolation("random: picked free frame " + std::to_string(frame.id));
  return *frame.occupant;
}

/**************** Dispatch ****************/

ReplacementPolicy make_policy(PolicyKind kind, std::mt19937 rng) {
  switch (kind) {
    case PolicyKind::LRU:    return LruPolicy{};
    case PolicyKind::FIFO:   return FifoPolicy{};
    case PolicyKind::RANDOM: return RandomPolicy{rng};
  }
  throw ConfigurationError("unknown replacement policy");
}

PolicyKind policy_kind(const ReplacementPolicy &policy) {
  return std::visit([](const auto &p) -> PolicyKind {
    using T = std::decay_t<decltype(p)>;
    if constexpr (std::is_same_v<T, LruPolicy>) return PolicyKind::LRU;
    else if constexpr (std::is_same_v<T, FifoPolicy>) return PolicyKind::FIFO;
    else return PolicyKind::RANDOM;
  }, policy);
}

uint32_t select_victim(ReplacementPolicy &policy, const FrameTable &table) {
  if (table.is_empty())
    throw InvariantViolation("select_victim on an empty frame table");
  if (!table.is_full())
    throw InvariantViolation("select_victim while free frames remain");

  uint32_t victim = std::visit([&table](auto &p) { return p.select_victim(table); }, policy);

  if (!table.lookup(victim))
    throw InvariantViolation(policy_name(policy_kind(policy)) + " chose non-resident page " +
                             std::to_string(victim));
  return victim;
}

void notify_load(ReplacementPolicy &policy, uint32_t page, uint64_t step) {
  std::visit([=](auto &p) { p.on_load(page, step); }, policy);
}

void notify_access(ReplacementPolicy &policy, uint32_t page, uint64_t step) {
  std::visit([=](auto &p) { p.on_access(page, step); }, policy);
}

void notify_evict(ReplacementPolicy &policy, uint32_t page) {
  std::visit([=](auto &p) { p.on_evict(page); }, policy);
}
