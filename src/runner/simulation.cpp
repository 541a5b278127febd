// All comments are in English.
#include "runner/simulation.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>

#include "common/bit_width.hpp"
#include "core/clock.hpp"
#include "harness/link_monitor.hpp"
#include "harness/scoreboard.hpp"
#include "stats/run_summary_csv.hpp"

using nlohmann::json;

namespace rf {

namespace {

// Accepts a JSON number or a string such as "0xdeadbeef".
std::uint64_t ParseU64_(const json& v, const char* what) {
  if (v.is_number_unsigned()) return v.get<std::uint64_t>();
  if (v.is_number_integer()) {
    const auto s = v.get<std::int64_t>();
    if (s < 0) throw std::invalid_argument(std::string("ParseConfig: negative value for ") + what);
    return static_cast<std::uint64_t>(s);
  }
  if (v.is_string()) {
    const std::string txt = v.get<std::string>();
    std::size_t used = 0;
    std::uint64_t out = 0;
    try {
      out = std::stoull(txt, &used, 0);
    } catch (const std::exception&) {
      throw std::invalid_argument(std::string("ParseConfig: bad integer for ") + what + ": " + txt);
    }
    if (used != txt.size()) {
      throw std::invalid_argument(std::string("ParseConfig: bad integer for ") + what + ": " + txt);
    }
    return out;
  }
  throw std::invalid_argument(std::string("ParseConfig: expected integer for ") + what);
}

PipelineConfig ParsePipeline_(const json& jp) {
  PipelineConfig p;
  p.payload_bits = jp.value("payload_bits", kDefaultPayloadBits);
  p.num_lanes    = jp.value("num_lanes",    kDefaultNumLanes);
  p.lane_latency = jp.value("lane_latency", kDefaultLaneLatency);
  p.seq_bits     = jp.value("seq_bits",     kDefaultSeqBits);
  p.counter_bits = jp.value("counter_bits", kDefaultCounterBits);

  if (jp.contains("stage_keys")) {
    const auto& keys = jp.at("stage_keys");
    if (!keys.is_array()) {
      throw std::invalid_argument("ParseConfig: 'pipeline.stage_keys' must be an array");
    }
    for (const auto& k : keys) {
      p.stage_keys.push_back(ParseU64_(k, "pipeline.stage_keys[]"));
    }
  }
  p.Validate();
  return p;
}

StimulusSpec ParseStimulus_(const json& js) {
  StimulusSpec s;
  s.num_blocks          = js.value("num_blocks", s.num_blocks);
  s.max_ticks           = js.value("max_ticks", s.max_ticks);
  s.seed                = js.value("seed", s.seed);
  s.producer_valid_rate = js.value("producer_valid_rate", s.producer_valid_rate);
  s.consumer_ready_rate = js.value("consumer_ready_rate", s.consumer_ready_rate);

  if (js.contains("consumer_stall_windows")) {
    for (const auto& jw : js.at("consumer_stall_windows")) {
      TickWindow w;
      w.start  = jw.at("start").get<std::uint64_t>();
      w.length = jw.at("length").get<std::uint64_t>();
      s.consumer_stall_windows.push_back(w);
    }
  }
  if (js.contains("reset_at_ticks")) {
    for (const auto& jt : js.at("reset_at_ticks")) {
      s.reset_at_ticks.push_back(jt.get<std::uint64_t>());
    }
  }

  if (s.max_ticks == 0) {
    throw std::invalid_argument("ParseConfig: 'stimulus.max_ticks' must be positive");
  }
  if (!(s.producer_valid_rate >= 0.0 && s.producer_valid_rate <= 1.0)) {
    throw std::invalid_argument("ParseConfig: 'stimulus.producer_valid_rate' must be in [0, 1]");
  }
  if (!(s.consumer_ready_rate >= 0.0 && s.consumer_ready_rate <= 1.0)) {
    throw std::invalid_argument("ParseConfig: 'stimulus.consumer_ready_rate' must be in [0, 1]");
  }
  if (s.consumer_ready_rate == 0.0) {
    std::cerr << "[ParseConfig][Warn] consumer_ready_rate is 0; the pipeline will back up "
                 "until max_ticks.\n";
  }
  return s;
}

void PrintTraceLine_(std::uint64_t t, const TickOutputs& o, const ClockCore& core) {
  std::cout << "[Tick " << t << "]"
            << " in_rdy=" << o.in_ready;
  if (o.admitted.has_value()) {
    std::cout << " adm(seq=" << o.admitted->block.seq
              << ",lane=" << o.admitted->lane << ")";
  }
  std::cout << " out_vld=" << o.out_valid;
  if (o.released) {
    std::cout << " rel(seq=" << o.out_block.seq
              << ",lane=" << *o.released_lane
              << ",payload=0x" << std::hex << o.out_block.payload << std::dec << ")";
  }
  std::cout << " next_exp=" << core.reassembler().next_expected()
            << " reasm_occ=" << core.reassembler().occupancy()
            << " in_flight=" << core.InFlight() << "\n";
}

} // namespace

SimConfig ParseConfigJson(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("ParseConfig: top level must be an object");
  }
  if (!j.contains("pipeline") || !j["pipeline"].is_object()) {
    throw std::invalid_argument("ParseConfig: missing 'pipeline' object");
  }

  SimConfig cfg;
  cfg.name     = j.value("name", std::string("run"));
  cfg.pipeline = ParsePipeline_(j.at("pipeline"));
  if (j.contains("stimulus")) {
    cfg.stimulus = ParseStimulus_(j.at("stimulus"));
  }
  if (j.contains("output")) {
    const auto& jo = j.at("output");
    cfg.output.trace       = jo.value("trace", false);
    cfg.output.summary_csv = jo.value("summary_csv", std::string());
  }
  return cfg;
}

SimConfig ParseConfigText(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument(std::string("ParseConfig: malformed json: ") + e.what());
  }
  try {
    return ParseConfigJson(j);
  } catch (const json::exception& e) {
    // Wrong types and missing keys inside nested objects.
    throw std::invalid_argument(std::string("ParseConfig: ") + e.what());
  }
}

SimConfig ParseConfig(const std::string& json_path) {
  std::ifstream ifs(json_path);
  if (!ifs) throw std::runtime_error("ParseConfig: cannot open json file: " + json_path);
  std::string jtxt((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return ParseConfigText(jtxt);
}

RunStats RunSimulation(const SimConfig& cfg) {
  const PipelineConfig& pc = cfg.pipeline;
  const StimulusSpec&   st = cfg.stimulus;

  ClockCore     core(pc);
  PatternSource src(st.num_blocks, st.producer_valid_rate, pc.payload_bits, st.seed);
  PatternSink   sink(st.consumer_ready_rate, st.consumer_stall_windows, st.seed ^ 0x5A5A5A5Au);

  Scoreboard  sb(core.transform(), pc.num_lanes, pc.seq_bits);
  LinkMonitor in_mon("input");
  LinkMonitor out_mon("output");

  const std::set<std::uint64_t> resets(st.reset_at_ticks.begin(), st.reset_at_ticks.end());

  RunStats S;
  std::uint64_t released_since_reset = 0;

  std::uint64_t t = 0;
  for (; t < st.max_ticks; ++t) {
    if (resets.count(t)) {
      S.discarded += core.InFlight();
      ++S.resets;
      core.Reset();
      src.Reset();
      sink.Reset();
      sb.OnReset();
      in_mon.Reset();
      out_mon.Reset();
      released_since_reset = 0;
      if (cfg.output.trace) std::cout << "[Tick " << t << "] reset\n";
    }

    if (src.exhausted() && core.InFlight() == 0) break;

    // Ready is sampled before the producer drives data.
    const bool in_ready_probe = core.in_ready();
    const std::optional<std::uint64_t> offer = src.Offer(t);
    const bool out_ready = sink.Ready(t);

    TickInputs in;
    in.in_valid   = offer.has_value();
    in.in_payload = offer.value_or(0);
    in.out_ready  = out_ready;
    const TickOutputs o = core.Tick(in);

    in_mon.ObserveReadyProbe(t, in_ready_probe, o.in_ready);
    in_mon.Observe(t, in.in_valid, o.in_ready, Block{in.in_payload, 0});
    out_mon.Observe(t, o.out_valid, out_ready, o.out_block);

    if (o.admitted.has_value()) {
      src.OnAccepted(t);
      sb.OnAdmit(*o.admitted, t);
      ++S.admitted;
      ++S.lanes.admissions[o.admitted->lane];
    }
    if (o.released) {
      sink.OnReceive(o.out_block, t);
      sb.OnRelease(o.out_block, t);
      ++S.released;
      ++released_since_reset;
    }
    if (!o.out_valid) ++S.idle_output_ticks;

    for (std::size_t i = 0; i < pc.num_lanes; ++i) {
      if (core.lane(i).last_stalled()) ++S.lanes.stall_ticks[i];
    }
    sb.OnOccupancy(core.reassembler().occupancy(), t);
    S.max_in_flight = std::max(S.max_in_flight, core.InFlight());

    if (cfg.output.trace) PrintTraceLine_(t, o, core);
  }
  S.ticks = t;

  if (!(src.exhausted() && core.InFlight() == 0)) {
    std::cerr << "[Simulation][Warn] max_ticks=" << st.max_ticks << " reached with "
              << core.InFlight() << " block(s) in flight and "
              << (st.num_blocks - src.accepted()) << " not yet admitted.\n";
  }

  S.producer_stall_ticks = in_mon.stall_ticks();
  S.consumer_stall_ticks = out_mon.stall_ticks();
  S.max_reasm_occupancy  = sb.max_occupancy();
  S.latency              = sb.latency();
  S.hw_blocks_processed  = core.counter().blocks_processed();
  S.hw_cycles_elapsed    = core.counter().cycles_elapsed();

  // ---- Verification ----
  std::vector<std::string> failures = sb.errors();
  for (const LinkMonitor* m : {&in_mon, &out_mon}) {
    for (const auto& v : m->violations()) {
      failures.push_back(std::string(LinkViolationKindToString(v.kind)) + ": " + v.detail);
    }
  }
  if (S.hw_blocks_processed != Truncate(released_since_reset, pc.counter_bits)) {
    failures.push_back("blocks_processed=" + std::to_string(S.hw_blocks_processed) +
                       " but " + std::to_string(released_since_reset) +
                       " releases were observed since the last reset");
  }
  if (S.hw_cycles_elapsed != Truncate(core.tick(), pc.counter_bits)) {
    failures.push_back("cycles_elapsed=" + std::to_string(S.hw_cycles_elapsed) +
                       " but the core ran " + std::to_string(core.tick()) + " ticks");
  }

  if (!failures.empty()) {
    for (const auto& f : failures) {
      std::cerr << "[Simulation][Check] " << f << "\n";
    }
    throw std::runtime_error("RunSimulation: " + std::to_string(failures.size()) +
                             " check(s) failed; first: " + failures.front());
  }

  if (!cfg.output.summary_csv.empty()) {
    const std::filesystem::path csv_path(cfg.output.summary_csv);
    if (csv_path.has_parent_path()) {
      std::filesystem::create_directories(csv_path.parent_path());
    }
    RunSummaryCsvLogger logger(cfg.output.summary_csv);
    logger.AppendRow(cfg.name, pc, S);
    std::cout << "[Simulation] Run summary CSV written to " << csv_path << "\n";
  }
  return S;
}

void PrintRunSummary(const SimConfig& cfg, const RunStats& S) {
  const PipelineConfig& pc = cfg.pipeline;
  std::cout << "[Simulation] " << cfg.name
            << ": N=" << pc.num_lanes << " K=" << pc.lane_latency
            << " payload_bits=" << pc.payload_bits
            << " seq_bits=" << pc.seq_bits
            << " counter_bits=" << pc.counter_bits << "\n";
  std::cout << "  ticks=" << S.ticks
            << " admitted=" << S.admitted
            << " released=" << S.released
            << " resets=" << S.resets
            << " discarded=" << S.discarded << "\n";
  std::cout << "  producer_stall_ticks=" << S.producer_stall_ticks
            << " consumer_stall_ticks=" << S.consumer_stall_ticks
            << " idle_output_ticks=" << S.idle_output_ticks << "\n";
  std::cout << "  max_reasm_occupancy=" << S.max_reasm_occupancy
            << " max_in_flight=" << S.max_in_flight << "\n";
  std::cout << "  latency min/mean/max=" << S.latency.min << "/"
            << S.latency.mean() << "/" << S.latency.max << "\n";
  std::cout << "  hw blocks_processed=" << S.hw_blocks_processed
            << " cycles_elapsed=" << S.hw_cycles_elapsed << "\n";
  for (std::size_t i = 0; i < pc.num_lanes; ++i) {
    std::cout << "  lane " << i
              << ": admissions=" << S.lanes.admissions[i]
              << " stall_ticks=" << S.lanes.stall_ticks[i] << "\n";
  }
}

} // namespace rf
