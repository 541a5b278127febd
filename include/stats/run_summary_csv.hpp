// All comments are in English.
#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <stdexcept>
#include <iomanip>
#include "common/pipeline_config.hpp"
#include "stats/sim_stats.hpp"

namespace rf {

// Writes one row per run with the configuration and aggregated statistics.
class RunSummaryCsvLogger {
public:
  explicit RunSummaryCsvLogger(const std::string& path, bool append = true)
  : path_(path)
  {
    std::ios_base::openmode mode = std::ios::out;
    mode |= (append ? std::ios::app : std::ios::trunc);
    file_.open(path_, mode);
    if (!file_.is_open()) {
      throw std::runtime_error("RunSummaryCsvLogger: failed to open file: " + path_);
    }
    if (!append) {
      WriteHeader_();
    } else {
      file_.seekp(0, std::ios::end);
      if (file_.tellp() == 0) {
        WriteHeader_();
      }
    }
    file_ << std::fixed << std::setprecision(4);
  }

  void AppendRow(const std::string& run_name,
                 const PipelineConfig& cfg,
                 const RunStats& S)
  {
    const double throughput =
        S.ticks > 0 ? static_cast<double>(S.released) / static_cast<double>(S.ticks) : 0.0;

    file_
      << run_name << ','
      << cfg.num_lanes << ','
      << cfg.lane_latency << ','
      << cfg.payload_bits << ','
      << cfg.seq_bits << ','
      << S.ticks << ','
      << S.admitted << ','
      << S.released << ','
      << S.discarded << ','
      << S.producer_stall_ticks << ','
      << S.consumer_stall_ticks << ','
      << S.max_reasm_occupancy << ','
      << S.latency.min << ','
      << S.latency.mean() << ','
      << S.latency.max << ','
      << throughput
      << '\n';

    file_.flush();
  }

private:
  void WriteHeader_() {
    file_ <<
      "run,num_lanes,lane_latency,payload_bits,seq_bits,ticks,admitted,released,discarded,"
      "producer_stall_ticks,consumer_stall_ticks,max_reasm_occupancy,"
      "latency_min,latency_mean,latency_max,throughput\n";
  }

  std::string path_;
  std::ofstream file_;
};

} // namespace rf
