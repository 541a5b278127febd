// tests/test_pipeline_integration.cpp
// Integration test for: Dispatcher (round-robin) + N Lanes (fixed latency)
// + Reassembler (in-order release) + StatsCounter, wired by ClockCore.
// All comments in English as requested.

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/block.hpp"
#include "common/pipeline_config.hpp"
#include "core/clock.hpp"
#include "arch/dispatcher.hpp"
#include "arch/lane.hpp"
#include "arch/reassembler.hpp"
#include "arch/stage_transform.hpp"
#include "arch/stats_counter.hpp"
#include "harness/link_monitor.hpp"
#include "harness/scoreboard.hpp"
#include "runner/stimulus.hpp"
using namespace rf;

namespace {
int g_failures = 0;

void CHECK(bool cond, const std::string& msg) {
    if (!cond) {
        ++g_failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

PipelineConfig Cfg(std::size_t n, std::size_t k, int seq_bits,
                   int payload_bits = 32, int counter_bits = 32) {
    PipelineConfig c;
    c.num_lanes    = n;
    c.lane_latency = k;
    c.seq_bits     = seq_bits;
    c.payload_bits = payload_bits;
    c.counter_bits = counter_bits;
    return c;
}

TickInputs In(bool valid, std::uint64_t payload, bool ready) {
    TickInputs in;
    in.in_valid   = valid;
    in.in_payload = payload;
    in.out_ready  = ready;
    return in;
}

// ---------------------------------------------------------------------------
// Component-level rig with a stall override on lane 0. Same three phases as
// ClockCore::Tick, but the test can force lane 0 to see "not ready" from its
// reassembly slot, delaying its completion.
// ---------------------------------------------------------------------------
struct ForcedStallRig {
    explicit ForcedStallRig(const PipelineConfig& cfg) : cfg(cfg), xform(cfg) {
        disp.Configure(cfg.num_lanes, cfg.seq_bits, cfg.payload_bits);
        for (std::size_t i = 0; i < cfg.num_lanes; ++i) lanes[i].Configure(i, cfg.lane_latency, &xform);
        reasm.Configure(cfg.num_lanes, cfg.seq_bits);
        counter.Configure(cfg.counter_bits);
    }

    // Returns the released block, if any.
    std::optional<Block> Tick(bool in_valid, std::uint64_t payload, bool out_ready, bool stall_lane0) {
        LaneFlags slot_ready = reasm.lane_ready_flags();
        if (stall_lane0) slot_ready[0] = false;

        LaneFlags lane_ready{};
        LaneOutputs lane_out{};
        for (std::size_t i = 0; i < cfg.num_lanes; ++i) {
            lane_ready[i] = lanes[i].in_ready(slot_ready[i]);
            // A forced-stalled lane must not hand its block over.
            if (lanes[i].out_valid() && slot_ready[i]) lane_out[i] = lanes[i].out_block();
        }
        std::optional<Block> presented;
        if (reasm.out_valid()) presented = reasm.out_block();

        auto adm = disp.Evaluate(in_valid, payload, lane_ready);
        for (std::size_t i = 0; i < cfg.num_lanes; ++i) {
            std::optional<Block> a;
            if (adm && adm->lane == i) a = adm->block;
            lanes[i].Evaluate(a, slot_ready[i]);
        }
        const bool released = reasm.Evaluate(lane_out, out_ready);
        counter.Evaluate(released);

        disp.Commit();
        for (std::size_t i = 0; i < cfg.num_lanes; ++i) lanes[i].Commit();
        reasm.Commit();
        counter.Commit();
        return released ? presented : std::nullopt;
    }

    PipelineConfig cfg;
    StageTransform xform;
    Dispatcher disp;
    std::array<Lane, kMaxLanes> lanes{};
    Reassembler reasm;
    StatsCounter counter;
};

void TEST_FixedLatencyBackToBack() {
    std::cout << "[RUN ] FixedLatencyBackToBack\n";
    const std::size_t K = 8;
    ClockCore core(Cfg(4, K, 8));
    const std::uint64_t payloads[4] = {0x11, 0x22, 0x33, 0x44};

    std::array<int, 4> first_valid{-1, -1, -1, -1};
    std::vector<std::pair<std::uint64_t, Block>> releases;

    for (std::uint64_t t = 0; t < 20; ++t) {
        for (std::size_t i = 0; i < 4; ++i) {
            if (first_valid[i] < 0 && core.lane(i).out_valid()) first_valid[i] = static_cast<int>(t);
        }
        const bool admit = t < 4;
        if (admit) CHECK(core.in_ready(), "ready while lanes are empty");
        const TickOutputs o = core.Tick(In(admit, admit ? payloads[t] : 0, true));
        if (admit) {
            CHECK(o.admitted.has_value(), "admitted at tick " + std::to_string(t));
            CHECK(o.admitted && o.admitted->lane == t && o.admitted->block.seq == t,
                  "B" + std::to_string(t) + " -> lane " + std::to_string(t) + ", seq " + std::to_string(t));
        }
        if (t < K + 1) CHECK(!o.out_valid, "no consumer valid before tick K+1");
        if (o.released) releases.emplace_back(t, o.out_block);
    }

    for (std::size_t i = 0; i < 4; ++i) {
        CHECK(first_valid[i] == static_cast<int>(i + K),
              "lane " + std::to_string(i) + " output appears exactly K ticks after admission");
    }
    CHECK(releases.size() == 4, "four blocks released");
    for (std::size_t i = 0; i < releases.size(); ++i) {
        CHECK(releases[i].first == K + 1 + i, "release " + std::to_string(i) + " at tick K+1+i");
        CHECK(releases[i].second.seq == i, "released in admission order");
        CHECK(releases[i].second.payload == core.transform().ApplyAll(payloads[i]), "payload transformed");
    }
    CHECK(core.counter().blocks_processed() == 4, "blocks_processed counts releases");
    CHECK(core.counter().cycles_elapsed() == 20, "cycles_elapsed counts ticks");
    std::cout << "[DONE] FixedLatencyBackToBack\n";
}

void TEST_RoundRobinFairness() {
    std::cout << "[RUN ] RoundRobinFairness\n";
    ClockCore core(Cfg(3, 2, 4));               // N=3 exercises true modulo
    Scoreboard sb(core.transform(), 3, 4);
    std::uint64_t admitted = 0;
    std::uint64_t t = 0;
    for (; t < 400 && (admitted < 40 || core.InFlight() > 0); ++t) {
        const bool valid = admitted < 40;
        const TickOutputs o = core.Tick(In(valid, 1000 + admitted, true));
        if (o.admitted) {
            CHECK(o.admitted->lane == admitted % 3, "strict rotation 0,1,2,0,...");
            CHECK(o.admitted->block.seq == admitted % 16, "seq +1 per admission, mod 16");
            sb.OnAdmit(*o.admitted, t);
            ++admitted;
        }
        if (o.released) sb.OnRelease(o.out_block, t);
        sb.OnOccupancy(core.reassembler().occupancy(), t);
    }
    CHECK(admitted == 40 && sb.released() == 40, "all admitted blocks drained");
    CHECK(sb.ok(), "scoreboard clean");
    // An always-ready consumer sustains one block per tick after the fill.
    CHECK(t <= 40 + 2 + 1 + 1, "full throughput with an always-ready consumer");
    std::cout << "[DONE] RoundRobinFairness\n";
}

void TEST_LaterBlockFinishesFirst() {
    std::cout << "[RUN ] LaterBlockFinishesFirst\n";
    ForcedStallRig rig(Cfg(2, 2, 3));
    std::vector<std::pair<std::uint64_t, Block>> releases;

    for (std::uint64_t t = 0; t < 10; ++t) {
        if (t == 4) {
            CHECK(rig.reasm.slot(1).has_value() && rig.reasm.slot(1)->seq == 1,
                  "B1 buffered in lane 1's slot");
            CHECK(!rig.reasm.slot(0).has_value(), "B0 still held back in lane 0");
            CHECK(!rig.reasm.out_valid(), "no output while seq 0 is missing");
        }
        // Lane 0 holds B0 for two extra ticks so B1 completes first.
        const bool force = (t == 2 || t == 3);
        auto rel = rig.Tick(t < 2, 0x100 + t, true, force);
        if (rel) releases.emplace_back(t, *rel);
    }
    CHECK(releases.size() == 2, "both blocks released");
    CHECK(releases.size() == 2 && releases[0].second.seq == 0 && releases[1].second.seq == 1,
          "B0 then B1, never B1 first");
    CHECK(releases.size() == 2 && releases[0].first == 5 && releases[1].first == 6,
          "released back-to-back once B0 completes");
    CHECK(rig.counter.blocks_processed() == 2, "two release events counted");
    std::cout << "[DONE] LaterBlockFinishesFirst\n";
}

void TEST_TwoLanesCompleteSameTick() {
    std::cout << "[RUN ] TwoLanesCompleteSameTick\n";
    ForcedStallRig rig(Cfg(2, 2, 3));
    std::vector<std::pair<std::uint64_t, Block>> releases;

    for (std::uint64_t t = 0; t < 10; ++t) {
        if (t == 4) {
            CHECK(rig.reasm.occupancy() == 2, "both completions latched in the same tick");
            CHECK(rig.reasm.out_valid() && rig.reasm.out_block().seq == 0, "cursor picks seq 0");
        }
        auto rel = rig.Tick(t < 2, 0x200 + t, true, t == 2);
        if (rel) releases.emplace_back(t, *rel);
    }
    CHECK(releases.size() == 2 &&
          releases[0].first == 4 && releases[0].second.seq == 0 &&
          releases[1].first == 5 && releases[1].second.seq == 1,
          "one release per tick, in cursor order");
    std::cout << "[DONE] TwoLanesCompleteSameTick\n";
}

void TEST_ConsumerBackpressureWindow() {
    std::cout << "[RUN ] ConsumerBackpressureWindow\n";
    const std::size_t N = 2;
    ClockCore core(Cfg(N, 2, 3));
    Scoreboard sb(core.transform(), N, 3);
    LinkMonitor out_mon("output");

    auto step = [&](std::uint64_t t, bool valid, bool ready) {
        const TickOutputs o = core.Tick(In(valid, t, ready));
        if (o.admitted) sb.OnAdmit(*o.admitted, t);
        if (o.released) sb.OnRelease(o.out_block, t);
        out_mon.Observe(t, o.out_valid, ready, o.out_block);
        sb.OnOccupancy(core.reassembler().occupancy(), t);
        return o;
    };

    std::uint64_t t = 0;
    for (; t < 6; ++t) (void)step(t, true, true);

    const auto pending_lane = core.reassembler().match_lane();
    CHECK(pending_lane.has_value(), "a release is pending when the consumer stalls");
    if (!pending_lane) return;
    const std::size_t L = *pending_lane;
    const Block presented = core.out_block();
    const std::uint64_t bp0  = core.counter().blocks_processed();
    const std::uint64_t cyc0 = core.counter().cycles_elapsed();

    bool producer_blocked = false;
    for (; t < 11; ++t) {
        CHECK(!core.reassembler().lane_ready(L), "pending slot refuses its lane");
        const TickOutputs o = step(t, true, false);
        CHECK(o.out_valid && o.out_block == presented, "presented block unchanged while held");
        CHECK(!o.released, "no release without ready");
        if (!o.in_ready) producer_blocked = true;
    }
    CHECK(core.counter().blocks_processed() == bp0, "blocks_processed frozen during the window");
    CHECK(core.counter().cycles_elapsed() == cyc0 + 5, "cycles_elapsed keeps counting");
    CHECK(producer_blocked, "backpressure reached the producer");
    CHECK(core.lane(L).out_valid() && core.lane(L).last_stalled(), "lane L is stalled on its next block");
    CHECK(core.lane(L).out_valid() &&
          core.lane(L).out_block().seq == ((presented.seq + N) & 7u),
          "exactly one further completion from lane L is blocked");

    const TickOutputs o = step(t++, true, true);
    CHECK(o.released && o.out_block == presented, "held block released when ready returns");

    std::uint64_t guard = 0;
    while (core.InFlight() > 0 && guard++ < 100) (void)step(t++, false, true);
    CHECK(sb.ok(), "order/value checks clean");
    CHECK(sb.outstanding() == 0, "nothing lost");
    CHECK(out_mon.clean(), "output link never retracted or changed a held block");
    std::cout << "[DONE] ConsumerBackpressureWindow\n";
}

void TEST_WrapAroundLongRun() {
    std::cout << "[RUN ] WrapAroundLongRun\n";
    const std::size_t N = 3;
    ClockCore core(Cfg(N, 2, /*seq_bits=*/4, /*payload_bits=*/12, /*counter_bits=*/4));
    PatternSource src(200, 0.8, 12, 5);
    PatternSink   sink(0.6, {}, 9);
    Scoreboard    sb(core.transform(), N, 4);
    LinkMonitor   in_mon("input"), out_mon("output");

    std::uint64_t t = 0;
    for (; t < 10000 && !(src.exhausted() && core.InFlight() == 0); ++t) {
        const bool probe = core.in_ready();
        const auto offer = src.Offer(t);
        const bool ready = sink.Ready(t);
        const TickOutputs o = core.Tick(In(offer.has_value(), offer.value_or(0), ready));
        in_mon.ObserveReadyProbe(t, probe, o.in_ready);
        in_mon.Observe(t, offer.has_value(), o.in_ready, Block{offer.value_or(0), 0});
        out_mon.Observe(t, o.out_valid, ready, o.out_block);
        if (o.admitted) { src.OnAccepted(t); sb.OnAdmit(*o.admitted, t); }
        if (o.released) { sink.OnReceive(o.out_block, t); sb.OnRelease(o.out_block, t); }
        sb.OnOccupancy(core.reassembler().occupancy(), t);
    }

    CHECK(src.exhausted() && core.InFlight() == 0, "run drained");
    CHECK(sb.ok(), "scoreboard clean across many wraps");
    CHECK(in_mon.clean() && out_mon.clean(), "handshake monitors clean");
    CHECK(sink.received().size() == 200, "200 blocks received");
    bool seq_ok = true;
    for (std::size_t i = 0; i < sink.received().size(); ++i) {
        if (sink.received()[i].seq != i % 16) seq_ok = false;
    }
    CHECK(seq_ok, "released seq ids are 0..15 repeating");
    CHECK(core.reassembler().next_expected() == 200 % 16, "cursor wrapped");
    CHECK(core.dispatcher().seq_counter() == 200 % 16, "seq counter wrapped");
    CHECK(core.counter().blocks_processed() == 200 % 16, "4-bit blocks_processed wrapped");
    CHECK(core.counter().cycles_elapsed() == t % 16, "4-bit cycles_elapsed wrapped");
    CHECK(sb.max_occupancy() <= N, "at most N blocks buffered");
    std::cout << "[DONE] WrapAroundLongRun\n";
}

void TEST_ResetDiscardsInFlight() {
    std::cout << "[RUN ] ResetDiscardsInFlight\n";
    ClockCore core(Cfg(2, 3, 4));
    for (std::uint64_t t = 0; t < 5; ++t) (void)core.Tick(In(true, t, false));
    CHECK(core.InFlight() > 0, "blocks in flight before reset");

    core.Reset();
    CHECK(core.InFlight() == 0, "reset empties lanes and slots");
    CHECK(core.tick() == 0, "tick index restarts");
    CHECK(!core.out_valid() && core.in_ready(), "idle boundary after reset");
    CHECK(core.dispatcher().seq_counter() == 0 && core.dispatcher().lane_sel() == 0, "dispatcher cleared");
    CHECK(core.reassembler().next_expected() == 0, "cursor cleared");
    CHECK(core.counter().blocks_processed() == 0 && core.counter().cycles_elapsed() == 0, "counters cleared");

    std::vector<Block> out;
    for (std::uint64_t t = 0; t < 20; ++t) {
        const TickOutputs o = core.Tick(In(t < 3, 0x70 + t, true));
        if (o.released) out.push_back(o.out_block);
    }
    CHECK(out.size() == 3, "only post-reset blocks are released");
    for (std::size_t i = 0; i < out.size(); ++i) {
        CHECK(out[i].seq == i && out[i].payload == core.transform().ApplyAll(0x70 + i),
              "post-reset numbering starts at 0");
    }
    std::cout << "[DONE] ResetDiscardsInFlight\n";
}

void TEST_PermanentBackpressureIsNotAnError() {
    std::cout << "[RUN ] PermanentBackpressureIsNotAnError\n";
    ClockCore core(Cfg(2, 2, 3));
    std::size_t in_flight_at_40 = 0;
    for (std::uint64_t t = 0; t < 50; ++t) {
        const TickOutputs o = core.Tick(In(true, t, false));
        CHECK(!o.released, "nothing leaves without ready");
        if (t == 40) in_flight_at_40 = core.InFlight();
    }
    CHECK(!core.in_ready(), "producer held off");
    CHECK(core.InFlight() == in_flight_at_40, "pipeline frozen, nothing dropped");
    CHECK(core.InFlight() <= core.config().MaxInFlight(), "bounded by N*(K+1)");
    CHECK(core.reassembler().occupancy() == 2, "each reassembly slot holds one block");
    CHECK(core.counter().blocks_processed() == 0 && core.counter().cycles_elapsed() == 50, "counters");
    std::cout << "[DONE] PermanentBackpressureIsNotAnError\n";
}

void TEST_ReadyIndependentOfPayload() {
    std::cout << "[RUN ] ReadyIndependentOfPayload\n";
    ClockCore a(Cfg(3, 4, 5));
    ClockCore b(Cfg(3, 4, 5));
    bool same = true;
    for (std::uint64_t t = 0; t < 60; ++t) {
        const bool ready = (t % 4) != 0;
        // Same valid/ready history, different payloads.
        const TickOutputs oa = a.Tick(In(true, t, ready));
        const TickOutputs ob = b.Tick(In(true, ~t, ready));
        if (oa.in_ready != ob.in_ready || oa.out_valid != ob.out_valid ||
            oa.admitted.has_value() != ob.admitted.has_value() ||
            oa.released != ob.released) {
            same = false;
        }
        if (oa.out_valid && ob.out_valid && oa.out_block.seq != ob.out_block.seq) same = false;
    }
    CHECK(same, "handshake timing never depends on payload contents");
    std::cout << "[DONE] ReadyIndependentOfPayload\n";
}

} // namespace

int main() {
    std::cout << "=== Pipeline Integration Tests ===\n";
    TEST_FixedLatencyBackToBack();
    TEST_RoundRobinFairness();
    TEST_LaterBlockFinishesFirst();
    TEST_TwoLanesCompleteSameTick();
    TEST_ConsumerBackpressureWindow();
    TEST_WrapAroundLongRun();
    TEST_ResetDiscardsInFlight();
    TEST_PermanentBackpressureIsNotAnError();
    TEST_ReadyIndependentOfPayload();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
