// All comments are in English.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "common/pipeline_config.hpp"
#include "runner/stimulus.hpp"
#include "stats/sim_stats.hpp"

namespace rf {

// Traffic applied to the pipeline by the built-in producer/consumer models.
struct StimulusSpec {
  std::uint64_t num_blocks          = 1000;
  std::uint64_t max_ticks           = 1000000;
  std::uint32_t seed                = 1;
  double        producer_valid_rate = 1.0;
  double        consumer_ready_rate = 1.0;
  std::vector<TickWindow>    consumer_stall_windows;
  std::vector<std::uint64_t> reset_at_ticks;   // synchronous resets, run-tick index
};

struct OutputSpec {
  bool        trace = false;     // per-tick lines on stdout
  std::string summary_csv;       // empty: no CSV
};

struct SimConfig {
  std::string    name = "run";
  PipelineConfig pipeline;
  StimulusSpec   stimulus;
  OutputSpec     output;
};

// Parse a config document; throws std::invalid_argument on bad content.
SimConfig ParseConfigJson(const nlohmann::json& j);
SimConfig ParseConfigText(const std::string& text);
SimConfig ParseConfig(const std::string& json_path);

// Drive one pipeline with the models in 'cfg' and the verification harness
// attached. Throws std::runtime_error if any check fails.
RunStats RunSimulation(const SimConfig& cfg);

void PrintRunSummary(const SimConfig& cfg, const RunStats& S);

} // namespace rf
