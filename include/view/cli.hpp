#pragma once
#include "config.hpp"
#include <iostream>
#include <string>
#include <vector>

// Command line front end:
//   pagesim [--config <path>] <frames> <lru|fifo|random> <quiet|debug> <tracefile>
//   pagesim [--config <path>] memory [faults|writes]
//   pagesim [--config <path>] data [lru|fifo|random]
class CLI {
public:
  CLI(std::vector<std::string> args, std::ostream &out = std::cout, std::ostream &err = std::cerr);
  int run(); // returns exit code

private:
  int run_single(const std::vector<std::string> &args);
  int run_memory(const std::vector<std::string> &args);
  int run_data(const std::vector<std::string> &args);
  void print_usage() const;

  std::vector<std::string> args_;
  std::ostream &out_;
  std::ostream &err_;
  Config cfg_;
};
