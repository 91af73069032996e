#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

enum class AccessMode { READ, WRITE };

// One trace event. `address` is the raw virtual address when the
// reference was parsed from a trace file, 0 otherwise.
struct PageReference {
  uint32_t page;
  AccessMode mode = AccessMode::READ;
  uint32_t address = 0;
};

// A fully materialized trace. The engine reads it forward exactly once per run.
struct Trace {
  std::string id;
  std::vector<PageReference> references;

  size_t size() const { return references.size(); }
  bool empty() const { return references.empty(); }
};

// Builds an all-read trace from bare page numbers.
Trace make_trace(const std::string &id, const std::vector<uint32_t> &pages);

// Parses `<hex address> [R|W]`. Throws TraceError on malformed input.
PageReference parse_reference(const std::string &line, uint32_t page_shift);

// Skips blank and '#' lines. Throws TraceError naming the offending line,
// or when no reference was read at all.
Trace parse_trace(std::istream &in, const std::string &id, uint32_t page_shift);

// Trace id is the file stem (traces/gcc.trace -> gcc).
Trace load_trace(const std::string &path, uint32_t page_shift);

size_t distinct_page_count(const Trace &trace);

std::string access_mode_name(AccessMode mode);
