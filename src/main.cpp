#include "app/options.hpp"
#include "app/runner.hpp"
#include <iostream>

int main(int argc, char **argv) {
  auto opt = app::ParseArgs(argc, argv);
  if (!opt) {
    std::cerr << app::Usage();
    return app::kExitUsage;
  }
  return app::Run(*opt);
}
