#include <iostream>
#include <string>
#include <vector>

#include "cli/Cli.hpp"

int main(int argc, char** argv) {
  return wapi::cli::run(std::vector<std::string>(argv + 1, argv + argc), std::cout, std::cerr);
}
