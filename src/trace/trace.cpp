#include "trace/trace.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <unordered_set>

Trace make_trace(const std::string &id, const std::vector<uint32_t> &pages) {
  Trace trace{id, {}};
  trace.references.reserve(pages.size());
  for (uint32_t page : pages)
    trace.references.push_back(PageReference{page, AccessMode::READ, 0});
  return trace;
}

static uint32_t parse_address(const std::string &token) {
  std::string hex = token;
  if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    hex = hex.substr(2);
  if (hex.empty() || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
    throw TraceError("invalid hex address '" + token + "'");

  unsigned long long value = 0;
  try {
    value = std::stoull(hex, nullptr, 16);
  } catch (const std::out_of_range &) {
    throw TraceError("address out of range '" + token + "'");
  }
  if (value > UINT32_MAX)
    throw TraceError("address wider than 32 bits '" + token + "'");
  return static_cast<uint32_t>(value);
}

PageReference parse_reference(const std::string &line, uint32_t page_shift) {
  auto tokens = split(line);
  if (tokens.empty() || tokens.size() > 2)
    throw TraceError("expected '<address> [R|W]', got '" + line + "'");

  PageReference ref{};
  ref.address = parse_address(tokens[0]);
  ref.page = ref.address >> page_shift;

  if (tokens.size() == 2) {
    std::string op = to_lower(tokens[1]);
    if (op == "r")      ref.mode = AccessMode::READ;
    else if (op == "w") ref.mode = AccessMode::WRITE;
    else throw TraceError("unknown access mode '" + tokens[1] + "'");
  }
  return ref;
}

Trace parse_trace(std::istream &in, const std::string &id, uint32_t page_shift) {
  Trace trace{id, {}};
  std::string line;
  size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string t = trim(line);
    if (t.empty() || t.front() == '#') continue;

    try {
      trace.references.push_back(parse_reference(t, page_shift));
    } catch (const TraceError &e) {
      throw TraceError(id + ":" + std::to_string(line_no) + ": " + e.what());
    }
  }

  if (in.bad())
    throw TraceError(id + ": read error after line " + std::to_string(line_no));
  if (trace.empty())
    throw TraceError(id + ": trace contains no references");
  return trace;
}

Trace load_trace(const std::string &path, uint32_t page_shift) {
  std::ifstream in(path);
  if (!in)
    throw TraceError("could not open trace file " + path);
  return parse_trace(in, file_stem(path), page_shift);
}

size_t distinct_page_count(const Trace &trace) {
  std::unordered_set<uint32_t> pages;
  for (const auto &ref : trace.references)
    pages.insert(ref.page);
  return pages.size();
}

std::string access_mode_name(AccessMode mode) {
  return mode == AccessMode::WRITE ? "Write" : "Read";
}
