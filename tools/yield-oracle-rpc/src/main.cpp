#include <cstdlib>
#include <iostream>
#include <string>

#include "rpc/server.hpp"

int main(int argc, char** argv) {
  std::string state_path = "/var/lib/yield-oracle/state.json";
  if (const auto* value = std::getenv("YIELD_ORACLE_STATE"); value != nullptr) {
    state_path = value;
  }
  if (argc > 1) {
    state_path = argv[1];
  }

  yield_oracle::rpc::Server server(state_path);
  return server.run(std::cin, std::cout, std::cerr);
}
