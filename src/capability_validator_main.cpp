#include <iostream>
#include <lab-instruments/config/CapabilityValidator.hpp>
using namespace labinst;

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <table.yaml> [table.yaml...]\n";
    return 1;
  }

  int status = 0;
  for (int i = 1; i < argc; ++i) {
    auto result = CapabilityValidator::validate_file(argv[i]);
    if (result.valid) {
      std::cout << argv[i] << ": validation succeeded.\n";
      continue;
    }
    std::cout << argv[i] << ": validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path << ": " << err.message << "\n";
    }
    status = 2;
  }
  return status;
}
