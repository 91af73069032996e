#pragma once
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

// One physical memory slot.
struct Frame {
  uint32_t id;
  std::optional<uint32_t> occupant; // resident page, empty when free
  uint64_t load_order = 0;          // step the occupant was installed at
  uint64_t last_used = 0;           // step of the occupant's latest reference
  bool dirty = false;

  bool free() const { return !occupant.has_value(); }
};

// Resident-page state of one simulation run: up to capacity frames and the
// reverse mapping page -> frame. A page occupies at most one frame. Frames
// are brought into use on first install, so a capacity larger than the
// working set costs nothing.
class FrameTable {
public:
  explicit FrameTable(uint32_t capacity);

  bool lookup(uint32_t page) const;
  bool is_full() const;
  bool is_empty() const;

  // Requires a free frame. Returns the frame id the page landed in.
  uint32_t install(uint32_t page, uint64_t step);
  void touch(uint32_t page, uint64_t step);
  void mark_dirty(uint32_t page);
  // Frees the page's frame and returns its metadata as it was before eviction.
  Frame evict(uint32_t page);

  uint32_t capacity() const;
  uint32_t occupied() const;
  const Frame &frame_of(uint32_t page) const;
  const std::vector<Frame> &frames() const; // frames brought into use so far
  std::vector<uint32_t> resident_pages() const; // ascending

private:
  Frame &resident_frame(uint32_t page, const char *op);

  uint32_t capacity_;
  std::vector<Frame> frames_;
  std::unordered_map<uint32_t, uint32_t> page_to_frame_;
  std::vector<uint32_t> free_frames_; // evicted frames, back() is the lowest id
};
