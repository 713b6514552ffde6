/**
 * @file test_bucketed_index.cpp
 * @brief Tests for hash bucket lookup and two-pointer collision resolution
 */

#include <catch2/catch_test_macros.hpp>

#include <attridx/bucketed_index.hpp>
#include "test_values.hpp"
#include <string>
#include <vector>

using namespace attridx;

namespace {

template<typename Hash>
auto make_bucketed(const std::vector<std::string>& names, Hash hash) {
    std::vector<tagged_value> objects;
    for (const auto& n : names) {
        objects.push_back(tagged_value{n});
    }
    auto sorted = hash_sort<uint32_t>(objects, [](const tagged_value& v) { return v; }, hash);
    REQUIRE(sorted.has_value());
    group_by_value(*sorted);
    return bucketed_index<tagged_value, uint32_t, Hash, std::equal_to<tagged_value>>(
        std::move(*sorted), hash, std::equal_to<tagged_value>{});
}

std::vector<uint32_t> to_vector(std::span<const uint32_t> ids) {
    return {ids.begin(), ids.end()};
}

} // namespace

TEST_CASE("bucketed_index finds values in a collision-free layout", "[bucketed]") {
    // Every name has a different length, so no collisions
    auto index = make_bucketed({"a", "bb", "ccc", "bb", "a"}, length_hash{});

    REQUIRE(index.size() == 5);
    REQUIRE(index.bucket_count() == 3);
    REQUIRE(index.largest_bucket() == 2);

    REQUIRE(to_vector(index.find(tagged_value{"a"})) == std::vector<uint32_t>{0, 4});
    REQUIRE(to_vector(index.find(tagged_value{"bb"})) == std::vector<uint32_t>{1, 3});
    REQUIRE(to_vector(index.find(tagged_value{"ccc"})) == std::vector<uint32_t>{2});
}

TEST_CASE("bucketed_index resolves hash collisions by equality", "[bucketed][collision]") {
    auto index = make_bucketed({"red", "blue", "red", "green", "blue", "red"}, constant_hash{});

    REQUIRE(index.bucket_count() == 1);
    REQUIRE(index.largest_bucket() == 6);

    SECTION("Each value gets only its own ids") {
        REQUIRE(to_vector(index.find(tagged_value{"red"})) == std::vector<uint32_t>{0, 2, 5});
        REQUIRE(to_vector(index.find(tagged_value{"blue"})) == std::vector<uint32_t>{1, 4});
        REQUIRE(to_vector(index.find(tagged_value{"green"})) == std::vector<uint32_t>{3});
    }

    SECTION("Same hash, absent value: pointers meet") {
        REQUIRE(index.find(tagged_value{"purple"}).empty());
    }
}

TEST_CASE("bucketed_index misses on unknown hash", "[bucketed]") {
    auto index = make_bucketed({"a", "ccc"}, length_hash{});

    // Length 2 is between the two stored hashes, length 9 is past the end
    REQUIRE(index.find(tagged_value{"zz"}).empty());
    REQUIRE(index.find(tagged_value{"zzzzzzzzz"}).empty());
    REQUIRE(index.find(tagged_value{""}).empty());
}

TEST_CASE("bucketed_index find returns a view into its own storage", "[bucketed]") {
    auto index = make_bucketed({"x", "yy", "x"}, length_hash{});
    auto all = index.ids();
    auto match = index.find(tagged_value{"x"});

    REQUIRE(match.size() == 2);
    REQUIRE(match.data() >= all.data());
    REQUIRE(match.data() + match.size() <= all.data() + all.size());
}

TEST_CASE("bucketed_index directory invariants", "[bucketed][invariants]") {
    auto index = make_bucketed(
        {"a", "bb", "c", "dd", "eee", "f", "gg", "hhhh", "a", "eee"}, length_hash{});

    auto hashes = index.hashes();
    auto unique = index.unique_hashes();
    auto starts = index.hash_starts();
    auto lengths = index.hash_run_lengths();

    REQUIRE(hashes.size() == index.size());
    REQUIRE(index.values().size() == index.size());
    REQUIRE(unique.size() == starts.size());
    REQUIRE(unique.size() == lengths.size());

    size_t covered = 0;
    for (size_t i = 0; i < unique.size(); ++i) {
        if (i > 0) {
            REQUIRE(unique[i - 1] < unique[i]);
        }
        REQUIRE(starts[i] == covered);
        for (size_t j = starts[i]; j < starts[i] + lengths[i]; ++j) {
            REQUIRE(hashes[j] == unique[i]);
        }
        covered += lengths[i];
    }
    REQUIRE(covered == index.size());
}

TEST_CASE("bucketed_index with no entries", "[bucketed][edge]") {
    auto index = make_bucketed({}, constant_hash{});
    REQUIRE(index.size() == 0);
    REQUIRE(index.bucket_count() == 0);
    REQUIRE(index.largest_bucket() == 0);
    REQUIRE(index.find(tagged_value{"anything"}).empty());
}
