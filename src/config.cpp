#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>

static uint32_t parse_uint(const std::string &key, const std::string &value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c){ return std::isdigit(c) != 0; }))
    throw ConfigurationError("'" + key + "' expects an unsigned integer, got '" + value + "'");
  try {
    unsigned long v = std::stoul(value);
    if (v > UINT32_MAX) throw std::out_of_range(value);
    return static_cast<uint32_t>(v);
  } catch (const std::out_of_range &) {
    throw ConfigurationError("'" + key + "' is out of range: " + value);
  }
}

PolicyKind parse_policy(const std::string &name) {
  std::string v = to_lower(trim(name));
  if (v == "lru")    return PolicyKind::LRU;
  if (v == "fifo")   return PolicyKind::FIFO;
  if (v == "random") return PolicyKind::RANDOM;
  throw ConfigurationError("unknown replacement policy '" + name + "' (expected lru|fifo|random)");
}

Verbosity parse_verbosity(const std::string &name) {
  std::string v = to_lower(trim(name));
  if (v == "quiet") return Verbosity::QUIET;
  if (v == "debug") return Verbosity::DEBUG;
  throw ConfigurationError("unknown verbosity '" + name + "' (expected quiet|debug)");
}

MemoryCriterion parse_criterion(const std::string &name) {
  std::string v = to_lower(trim(name));
  if (v == "faults") return MemoryCriterion::NO_CAPACITY_FAULTS;
  if (v == "writes") return MemoryCriterion::NO_WRITE_BACKS;
  throw ConfigurationError("unknown memory criterion '" + name + "' (expected faults|writes)");
}

uint32_t parse_frame_count(const std::string &value) {
  std::string v = trim(value);
  if (!v.empty() && v.front() == '-')
    throw ConfigurationError("frame count must be positive, got " + v);
  uint32_t frames = parse_uint("frames", v);
  if (frames == 0)
    throw ConfigurationError("frame count must be positive, got 0");
  return frames;
}

std::string policy_name(PolicyKind policy) {
  switch (policy) {
    case PolicyKind::LRU:    return "lru";
    case PolicyKind::FIFO:   return "fifo";
    case PolicyKind::RANDOM: return "random";
  }
  return "unknown";
}

std::string criterion_name(MemoryCriterion criterion) {
  switch (criterion) {
    case MemoryCriterion::NO_CAPACITY_FAULTS: return "faults";
    case MemoryCriterion::NO_WRITE_BACKS:     return "writes";
  }
  return "unknown";
}

void validate_config(const Config &cfg) {
  if (cfg.frames == 0)
    throw ConfigurationError("frames must be positive");
  if (cfg.workers == 0)
    throw ConfigurationError("workers must be positive");
  if (cfg.page_shift > 31)
    throw ConfigurationError("page-shift must be at most 31, got " + std::to_string(cfg.page_shift));
  if (cfg.traces.empty())
    throw ConfigurationError("no traces configured");
}

Config load_config(const std::string &path) {

  Config cfg{};
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return cfg;
  }

  bool traces_overridden = false;
  std::string key, value;

  while (in >> key >> value)
  {
    key = trim(key), value = trim(value);

    if (key == "frames") cfg.frames = parse_frame_count(value);
    else if (key == "policy") cfg.policy = parse_policy(value);
    else if (key == "verbosity") cfg.verbosity = parse_verbosity(value);
    else if (key == "criterion") cfg.criterion = parse_criterion(value);
    else if (key == "seed") cfg.seed = parse_uint(key, value);
    else if (key == "page-shift") cfg.page_shift = parse_uint(key, value);
    else if (key == "workers") cfg.workers = parse_uint(key, value);
    else if (key == "sweep-step") cfg.sweep_step = parse_uint(key, value);
    else if (key == "out-dir") cfg.out_dir = value;
    else if (key == "log-file") cfg.log_file = value;

    // Each `trace` line replaces the default list on first use, then appends.
    else if (key == "trace") {
      if (!traces_overridden) { cfg.traces.clear(); traces_overridden = true; }
      cfg.traces.push_back(value);
    }

    else {
      std::cerr << "Warning: unknown config key '" << key << "' in " << path << " ignored.\n";
    }
  }

  validate_config(cfg);
  return cfg;
}
