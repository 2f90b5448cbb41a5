/**
 * @file bench_exporter.cpp
 * @brief Timing of the per-reply and per-scrape hot paths.
 *
 * Measures reply decoding, snapshot normalization, host table upserts and
 * full scrape rendering for a few fleet sizes.
 *
 * Usage: ./bench_exporter [--csv]
 */

#include "cache/state_cache.hpp"
#include "network/host_table.hpp"
#include "protocol/codec.hpp"
#include "telemetry/prometheus_renderer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace hvac_exporter;
using Clock = std::chrono::steady_clock;

// ─────────────────────────────────────────────
// Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double min_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        timings.push_back(std::chrono::duration<double, std::micro>(Clock::now() - start).count());
    }

    std::sort(timings.begin(), timings.end());
    double mean = std::accumulate(timings.begin(), timings.end(), 0.0)
                / static_cast<double>(iterations);
    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .min_us = timings.front(), .p99_us = timings[p99_idx],
        .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,min_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.min_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(36) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(80, '-') << "\n";
        }
        std::cout << std::left << std::setw(36) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Fixtures
// ─────────────────────────────────────────────

const std::string BASIC_REPLY =
    "ret=OK,type=aircon,reg=eu,dst=1,ver=1_2_51,rev=D3A0C9F,pow=1,err=0,location=0,"
    "name=%4c%69%76%69%6e%67,icon=0,method=home only,port=30050,id=,pw=,lpw_flag=0,"
    "adp_kind=3,pv=3.20,cpv=3,cpv_minor=20,led=1,en_setzone=1,mac=A0B1C2D3E4F5,"
    "adp_mode=run,en_hol=0,grp_name=,en_grp=0";

std::string mac_for(size_t i) {
    std::ostringstream oss;
    oss << "A0B1C2" << std::hex << std::setw(6) << std::setfill('0') << i;
    return oss.str();
}

void fill_fleet(HostTable& hosts, StateCache& cache, size_t count) {
    auto now = std::chrono::system_clock::now();
    QueryReply reply{{{"pow", "1"}, {"mode", "3"}, {"stemp", "22.0"}, {"f_rate", "A"},
                      {"f_dir", "3"}, {"htemp", "21.5"}, {"hhum", "-"}, {"otemp", "12.0"},
                      {"cmpfreq", "30"}, {"name", "%4c%69%76%69%6e%67"}}};

    for (size_t i = 0; i < count; ++i) {
        DiscoveryReply discovered;
        discovered.unit_id = mac_for(i);
        discovered.endpoint = Endpoint{.host = "10.0." + std::to_string(i / 250) + "."
                                               + std::to_string(i % 250 + 1)};
        auto result = hosts.upsert_discovered(discovered, now);
        cache.store(result.key, snapshot_from_reply(reply, now));
    }
}

// ─────────────────────────────────────────────
// Benchmarks
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_codec() {
    std::vector<BenchResult> results;

    results.push_back(run_bench("decode_discovery_reply", "Codec", 10000, [] {
        auto reply = decode_discovery_reply(BASIC_REPLY, "10.0.0.5");
        if (!reply) std::abort();
    }, std::to_string(BASIC_REPLY.size()) + " bytes"));

    auto fields = decode_query_reply(BASIC_REPLY);
    results.push_back(run_bench("snapshot_from_reply", "Codec", 10000, [&] {
        auto snapshot = snapshot_from_reply(*fields, std::chrono::system_clock::now());
        if (snapshot.metrics.empty()) std::abort();
    }, std::to_string(fields->fields.size()) + " fields"));

    return results;
}

std::vector<BenchResult> bench_host_table() {
    std::vector<BenchResult> results;

    HostTable hosts;
    StateCache cache(hosts, Duration{7500});
    fill_fleet(hosts, cache, 256);

    DiscoveryReply known;
    known.unit_id = mac_for(128);
    known.endpoint = Endpoint{.host = "10.0.0.129"};
    results.push_back(run_bench("upsert_known_unit", "HostTable", 10000, [&] {
        hosts.upsert_discovered(known, std::chrono::system_clock::now());
    }, "256 hosts"));

    return results;
}

std::vector<BenchResult> bench_render() {
    std::vector<BenchResult> results;

    for (size_t fleet : {1u, 16u, 256u}) {
        HostTable hosts;
        StateCache cache(hosts, Duration{7500});
        ExporterStats stats;
        fill_fleet(hosts, cache, fleet);

        std::string text;
        results.push_back(run_bench("render_prometheus/" + std::to_string(fleet), "Scrape", 200, [&] {
            auto now = std::chrono::system_clock::now();
            text = render_prometheus(hosts.snapshot(), cache.snapshot_all(now), stats, now);
        }, std::to_string(fleet) + " hosts"));
        results.back().extra += ", " + std::to_string(text.size() / 1024) + " KiB";
    }

    return results;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  hvac_exporter Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_codec());
    append(bench_host_table());
    append(bench_render());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
