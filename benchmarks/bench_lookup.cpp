/**
 * @file bench_lookup.cpp
 * @brief Lookup latency for attribute_index
 *
 * Two scenarios:
 * - Skewed values with a good hash, across thresholds: typical get() latency
 * - One huge value and one tiny value sharing a hash: get(tiny) with the
 *   huge value bucketed (threshold above its count) versus pulled into the
 *   high-cardinality map (default threshold)
 */

#include "benchmark_utils.hpp"
#include <attridx/attridx.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace attridx;
using namespace attridx::bench;

namespace {

// "big" and "small" collide on purpose; everything else uses std::hash
struct collide_hash {
    uint64_t operator()(const std::string& s) const {
        if (s == "big" || s == "small") return 7;
        return std_hash<std::string>{}(s);
    }
};

auto identity = [](const std::string& s) { return s; };

} // namespace

int main(int argc, char* argv[]) {
    const size_t num_objects = (argc > 1) ? std::stoull(argv[1]) : 1000000;
    const size_t num_queries = (argc > 2) ? std::stoull(argv[2]) : 100000;
    const size_t num_values = 10000;

    std::cout << "=== attridx lookup latency ===\n"
              << num_objects << " objects, " << num_queries << " queries, "
              << num_values << " distinct values\n\n";

    const auto objects = skewed_values(num_objects, num_values, 1.0);
    const auto queries = skewed_values(num_queries, num_values, 1.0, 7);

    print_header(std::cout);

    for (size_t threshold : {size_t{0}, default_cardinality_threshold, num_objects}) {
        auto start = std::chrono::steady_clock::now();
        auto index = make_attribute_index(objects, identity, {.cardinality_threshold = threshold});
        auto build_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        if (!index) {
            std::cerr << "Build failed: " << error_message(index.error()) << "\n";
            return 1;
        }
        const auto& s = index->statistics();
        print_report(std::cout, measure_get("skewed, threshold " + std::to_string(threshold),
                                            *index, queries));
        std::cout << "    build " << build_ms << " ms, " << s.high_cardinality_values
                  << " high-cardinality values, " << s.unique_hashes << " buckets\n";
    }

    // About ten "small" objects; their bucket also holds every "big" entry
    // unless "big" is extracted
    const auto mixed = two_value_mix(num_objects, "big", "small", num_objects / 10 + 1);
    const std::vector<std::string> small_queries(num_queries / 10 + 1, "small");

    for (size_t threshold : {num_objects, default_cardinality_threshold}) {
        auto index = attribute_index<std::string, uint32_t, collide_hash>::build(
            mixed, identity, {.cardinality_threshold = threshold});
        if (!index) {
            std::cerr << "Build failed: " << error_message(index.error()) << "\n";
            return 1;
        }
        const std::string label = index->is_high_cardinality("big")
            ? "colliding small, big extracted"
            : "colliding small, big bucketed";
        const auto report = measure_get(label, *index, small_queries);
        print_report(std::cout, report);
        std::cout << "    largest bucket " << index->statistics().largest_bucket << "\n";
    }

    return 0;
}
