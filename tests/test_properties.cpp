/**
 * @file test_properties.cpp
 * @brief Property-based tests for attribute_index invariants
 *
 * Randomized inputs across thresholds and hash quality:
 * - Partition: every indexed object appears exactly once
 * - Lookup correctness: get(v) is exactly the objects holding v
 * - Ordering: results strictly ascending
 * - Size and idempotence
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <attridx/attridx.hpp>
#include "test_values.hpp"
#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <vector>

using namespace attridx;

// ===== PROPERTY GENERATORS =====

namespace {

std::vector<int> generate_values(size_t n, int distinct, uint32_t seed) {
    std::mt19937 rng{seed};
    // Skewed: a few values dominate so both storage regions get used
    std::geometric_distribution<int> dist{0.15};
    std::vector<int> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        values.push_back(dist(rng) % distinct);
    }
    return values;
}

template<typename Index>
void check_invariants(const Index& index, const std::vector<int>& objects, int distinct) {
    using id = typename Index::id_type;

    // Reference answer computed the slow way
    std::map<int, std::vector<id>> expected;
    for (size_t i = 0; i < objects.size(); ++i) {
        expected[objects[i]].push_back(static_cast<id>(i));
    }

    SECTION("Partition covers every object exactly once") {
        std::vector<id> seen;
        if (auto* part = index.bucketed_part()) {
            auto ids = part->ids();
            seen.insert(seen.end(), ids.begin(), ids.end());
        }
        index.for_each_high_cardinality([&](const int&, std::span<const id> ids) {
            seen.insert(seen.end(), ids.begin(), ids.end());
        });
        std::ranges::sort(seen);

        std::vector<id> all(objects.size());
        std::iota(all.begin(), all.end(), id{0});
        REQUIRE(seen == all);
        REQUIRE(index.get_all() == all);
        REQUIRE(index.size() == objects.size());
    }

    SECTION("get returns exactly the holders, ascending") {
        for (const auto& [value, ids] : expected) {
            auto got = index.get(value);
            REQUIRE(got == ids);
            REQUIRE(std::ranges::adjacent_find(got, std::ranges::greater_equal{}) == got.end());
            REQUIRE(index.count(value) == ids.size());
        }
    }

    SECTION("Absent values are empty") {
        for (int v = distinct; v < distinct + 50; ++v) {
            REQUIRE(index.get(v).empty());
            REQUIRE_FALSE(index.contains(v));
        }
        REQUIRE(index.get(-1).empty());
    }

    SECTION("Routing respects the threshold") {
        for (const auto& [value, ids] : expected) {
            REQUIRE(index.is_high_cardinality(value) == (ids.size() > index.threshold()));
        }
    }

    SECTION("Queries are idempotent") {
        auto size = index.size();
        for (const auto& [value, ids] : expected) {
            REQUIRE(index.get(value) == index.get(value));
        }
        REQUIRE(index.size() == size);
    }
}

} // namespace

// ===== INDEX PROPERTIES =====

TEST_CASE("Invariants with a well-spread hash", "[properties]") {
    const size_t threshold = GENERATE(0, 1, 3, 10, 1000);
    const uint32_t seed = GENERATE(1u, 7u, 42u);
    constexpr int distinct = 40;

    auto objects = generate_values(2000, distinct, seed);
    auto index = attribute_index<int, uint16_t, mix64_hash>::build(
        objects, [](int v) { return v; }, {.cardinality_threshold = threshold});
    REQUIRE(index.has_value());

    check_invariants(*index, objects, distinct);
}

TEST_CASE("Invariants with a heavily colliding hash", "[properties][collision]") {
    const size_t threshold = GENERATE(0, 2, 20, 1000);
    const uint32_t seed = GENERATE(3u, 99u);
    constexpr int distinct = 60;

    auto objects = generate_values(1500, distinct, seed);
    auto index = attribute_index<int, uint16_t, mod7_hash>::build(
        objects, [](int v) { return v; }, {.cardinality_threshold = threshold});
    REQUIRE(index.has_value());

    const auto& stats = index->statistics();
    // At most seven distinct hashes exist
    REQUIRE(stats.hash_collisions + 7 >= stats.distinct_values);
    if (auto* part = index->bucketed_part()) {
        REQUIRE(part->bucket_count() <= 7);
    }

    check_invariants(*index, objects, distinct);
}

TEST_CASE("Identifier width does not change answers", "[properties][id_width]") {
    auto objects = generate_values(200, 15, 5);
    constexpr index_config config{.cardinality_threshold = 8};

    auto narrow = attribute_index<int, uint8_t, mix64_hash>::build(objects, [](int v) { return v; }, config);
    auto wide = attribute_index<int, uint64_t, mix64_hash>::build(objects, [](int v) { return v; }, config);
    REQUIRE(narrow.has_value());
    REQUIRE(wide.has_value());

    for (int v = 0; v < 15; ++v) {
        auto a = narrow->get(v);
        auto b = wide->get(v);
        REQUIRE(std::ranges::equal(a, b));
    }
    REQUIRE(narrow->size() == wide->size());
}
