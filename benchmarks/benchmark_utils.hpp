/**
 * @file benchmark_utils.hpp
 * @brief Attribute value generators and per-query latency reports
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace attridx::bench {

// ===== VALUE GENERATORS =====

/**
 * @brief Attribute values "v<k>" where rank k has weight 1 / (k + 1)^skew
 *
 * skew = 0 gives uniform values; around 1 a few values cover most objects,
 * which is what pushes values over the cardinality threshold.
 */
inline std::vector<std::string> skewed_values(size_t count, size_t distinct,
                                              double skew, uint64_t seed = 42) {
    std::vector<double> weights(distinct);
    for (size_t k = 0; k < distinct; ++k) {
        weights[k] = 1.0 / std::pow(static_cast<double>(k + 1), skew);
    }
    std::discrete_distribution<size_t> rank(weights.begin(), weights.end());
    std::mt19937_64 rng(seed);

    std::vector<std::string> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back("v" + std::to_string(rank(rng)));
    }
    return values;
}

/**
 * @brief Mostly @p big, with @p small at every @p stride-th position
 */
inline std::vector<std::string> two_value_mix(size_t count, const std::string& big,
                                              const std::string& small, size_t stride) {
    std::vector<std::string> values(count, big);
    for (size_t i = 0; i < count; i += stride) {
        values[i] = small;
    }
    return values;
}

// ===== LATENCY =====

struct latency_report {
    std::string label;
    size_t queries{0};
    size_t ids_returned{0};
    double mean_ns{0};
    double p50_ns{0};
    double p99_ns{0};
    double max_ns{0};
};

inline void print_header(std::ostream& out) {
    out << std::left << std::setw(40) << "scenario"
        << std::right << std::setw(10) << "queries"
        << std::setw(12) << "ids"
        << std::setw(10) << "mean"
        << std::setw(10) << "p50"
        << std::setw(10) << "p99"
        << std::setw(12) << "max" << "  (ns)\n";
}

inline void print_report(std::ostream& out, const latency_report& r) {
    out << std::left << std::setw(40) << r.label
        << std::right << std::setw(10) << r.queries
        << std::setw(12) << r.ids_returned
        << std::fixed << std::setprecision(0)
        << std::setw(10) << r.mean_ns
        << std::setw(10) << r.p50_ns
        << std::setw(10) << r.p99_ns
        << std::setw(12) << r.max_ns << "\n";
}

/**
 * @brief Time index.get(q) for every query, one measurement per call
 *
 * The returned id counts are summed into ids_returned so the calls
 * cannot be optimized away.
 */
template<typename Index, typename Value>
latency_report measure_get(std::string label, const Index& index,
                           const std::vector<Value>& queries) {
    using clock = std::chrono::steady_clock;

    latency_report report;
    report.label = std::move(label);
    report.queries = queries.size();
    if (queries.empty()) {
        return report;
    }

    std::vector<double> samples;
    samples.reserve(queries.size());
    for (const auto& q : queries) {
        auto start = clock::now();
        auto ids = index.get(q);
        auto stop = clock::now();
        report.ids_returned += ids.size();
        samples.push_back(std::chrono::duration<double, std::nano>(stop - start).count());
    }

    std::ranges::sort(samples);
    double total = 0;
    for (double s : samples) {
        total += s;
    }
    auto at = [&samples](double q) {
        return samples[std::min(samples.size() - 1, static_cast<size_t>(q * samples.size()))];
    };
    report.mean_ns = total / static_cast<double>(samples.size());
    report.p50_ns = at(0.50);
    report.p99_ns = at(0.99);
    report.max_ns = samples.back();
    return report;
}

} // namespace attridx::bench
