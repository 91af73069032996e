#include "paging/frame_table.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <string>

FrameTable::FrameTable(uint32_t capacity) : capacity_(capacity) {
  if (capacity == 0)
    throw ConfigurationError("frame table needs at least one frame");
}

bool FrameTable::lookup(uint32_t page) const {
  return page_to_frame_.contains(page);
}

bool FrameTable::is_full() const {
  return free_frames_.empty() && frames_.size() == capacity_;
}

bool FrameTable::is_empty() const {
  return page_to_frame_.empty();
}

uint32_t FrameTable::install(uint32_t page, uint64_t step) {
  if (is_full())
    throw InvariantViolation("install of page " + std::to_string(page) + " into a full frame table");
  if (lookup(page))
    throw InvariantViolation("page " + std::to_string(page) + " is already resident");

  // Reuse a freed frame before bringing a new one into use.
  uint32_t idx;
  if (!free_frames_.empty()) {
    idx = free_frames_.back();
    free_frames_.pop_back();
  } else {
    idx = static_cast<uint32_t>(frames_.size());
    frames_.push_back(Frame{.id = idx, .occupant = std::nullopt, .load_order = 0,
                            .last_used = 0, .dirty = false});
  }

  Frame &frame = frames_[idx];
  frame.occupant = page;
  frame.load_order = step;
  frame.last_used = step;
  frame.dirty = false;

  page_to_frame_[page] = idx;
  DEBUG_PRINT(DEBUG_SIMULATION, "page %u -> frame %u", page, idx);
  return idx;
}

void FrameTable::touch(uint32_t page, uint64_t step) {
  resident_frame(page, "touch").last_used = step;
}

void FrameTable::mark_dirty(uint32_t page) {
  resident_frame(page, "mark_dirty").dirty = true;
}

Frame FrameTable::evict(uint32_t page) {
  Frame &frame = resident_frame(page, "evict");
  Frame before = frame;

  frame.occupant.reset();
  frame.dirty = false;
  page_to_frame_.erase(page);

  // Keep the lowest free id at the back so installs fill frames in order.
  auto pos = std::lower_bound(free_frames_.begin(), free_frames_.end(), frame.id,
                              [](uint32_t a, uint32_t b) { return a > b; });
  free_frames_.insert(pos, frame.id);
  return before;
}

uint32_t FrameTable::capacity() const {
  return capacity_;
}

uint32_t FrameTable::occupied() const {
  return static_cast<uint32_t>(page_to_frame_.size());
}

const Frame &FrameTable::frame_of(uint32_t page) const {
  auto it = page_to_frame_.find(page);
  if (it == page_to_frame_.end())
    throw InvariantViolation("frame_of: page " + std::to_string(page) + " is not resident");
  return frames_[it->second];
}

const std::vector<Frame> &FrameTable::frames() const {
  return frames_;
}

std::vector<uint32_t> FrameTable::resident_pages() const {
  std::vector<uint32_t> pages;
  pages.reserve(page_to_frame_.size());
  for (const auto &[page, idx] : page_to_frame_)
    pages.push_back(page);
  std::sort(pages.begin(), pages.end());
  return pages;
}

Frame &FrameTable::resident_frame(uint32_t page, const char *op) {
  auto it = page_to_frame_.find(page);
  if (it == page_to_frame_.end())
    throw InvariantViolation(std::string(op) + ": page " + std::to_string(page) + " is not resident");
  return frames_[it->second];
}
