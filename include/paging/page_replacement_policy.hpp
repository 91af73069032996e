#pragma once
#include "config.hpp"
#include "paging/frame_table.hpp"
#include <cstdint>
#include <deque>
#include <list>
#include <random>
#include <unordered_map>
#include <variant>

// Evicts the least recently referenced page.
class LruPolicy {
public:
  void on_load(uint32_t page, uint64_t step);
  void on_access(uint32_t page, uint64_t step);
  void on_evict(uint32_t page);
  uint32_t select_victim(const FrameTable &table) const;

private:
  std::list<uint32_t> usage_list_; // front = least recently used
  std::unordered_map<uint32_t, std::list<uint32_t>::iterator> position_;
};

// Evicts the page loaded earliest; hits do not reorder.
class FifoPolicy {
public:
  void on_load(uint32_t page, uint64_t step);
  void on_access(uint32_t page, uint64_t step);
  void on_evict(uint32_t page);
  uint32_t select_victim(const FrameTable &table) const;

private:
  std::deque<uint32_t> load_queue_; // front = oldest load
};

// Evicts a uniformly chosen resident page. The generator is injected so
// a fixed seed reproduces the same run.
class RandomPolicy {
public:
  explicit RandomPolicy(std::mt19937 rng);

  void on_load(uint32_t, uint64_t) {}
  void on_access(uint32_t, uint64_t) {}
  void on_evict(uint32_t) {}
  uint32_t select_victim(const FrameTable &table);

private:
  std::mt19937 rng_;
};

using ReplacementPolicy = std::variant<LruPolicy, FifoPolicy, RandomPolicy>;

ReplacementPolicy make_policy(PolicyKind kind, std::mt19937 rng = std::mt19937{});
PolicyKind policy_kind(const ReplacementPolicy &policy);

// Only valid on a full table. Throws InvariantViolation if the table is not
// full or the chosen page is not resident.
uint32_t select_victim(ReplacementPolicy &policy, const FrameTable &table);

void notify_load(ReplacementPolicy &policy, uint32_t page, uint64_t step);
void notify_access(ReplacementPolicy &policy, uint32_t page, uint64_t step);
void notify_evict(ReplacementPolicy &policy, uint32_t page);
