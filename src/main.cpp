// All comments are in English.
#include <exception>
#include <iostream>
#include <string>

#include "runner/simulation.hpp"

int main(int argc, char** argv) {
  // Usage: ./rrflow_sim <config.json>
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.json>\n";
    return 1;
  }

  const std::string json_path = argv[1];

  try {
    // (1) Parse config
    const auto cfg = rf::ParseConfig(json_path);

    // (2) Drive the pipeline with the harness attached
    const auto stats = rf::RunSimulation(cfg);

    // (3) Report
    rf::PrintRunSummary(cfg, stats);
    std::cout << "[Simulation] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[Simulation] Error: " << ex.what() << "\n";
    return 2;
  }
}
