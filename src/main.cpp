#include "view/cli.hpp"
#include <string>
#include <utility>
#include <vector>

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  CLI cli(std::move(args));
  return cli.run();
}
