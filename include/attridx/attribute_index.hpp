/**
 * @file attribute_index.hpp
 * @brief Immutable single-attribute index: value -> sorted object ids
 *
 * Values only need hashing and equality. Values shared by more than
 * cardinality_threshold objects get their own pre-sorted id list in a hash
 * map; everything else goes into one bucketed_index. A value with a huge
 * id list therefore never sits in a bucket that a colliding small value
 * has to scan through.
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "primitives.hpp"
#include "bucketed_index.hpp"
#include <algorithm>
#include <optional>
#include <ranges>
#include <span>
#include <unordered_map>
#include <variant>
#include <vector>

namespace attridx {

// ===== ROUTING =====

// Value stored in the high-cardinality map with its ids sorted
template<object_id Id>
struct direct_lookup {
    std::vector<Id> ids;
};

// Value left in the bucketed index
struct bucketed {};

template<object_id Id>
using value_route = std::variant<direct_lookup<Id>, bucketed>;

/**
 * @brief Decide where one value's run of ids is stored
 *
 * More than @p threshold ids goes to the high-cardinality map; exactly
 * @p threshold or fewer stays bucketed.
 */
template<object_id Id>
[[nodiscard]] value_route<Id> route_run(std::span<const Id> run_ids, size_t threshold) {
    if (run_ids.size() > threshold) {
        std::vector<Id> ids(run_ids.begin(), run_ids.end());
        std::ranges::sort(ids);
        return direct_lookup<Id>{std::move(ids)};
    }
    return bucketed{};
}

// ===== STATISTICS =====

struct index_stats {
    size_t object_count{0};             // objects seen at construction
    size_t indexed_count{0};            // objects that yielded a value
    size_t distinct_values{0};
    size_t high_cardinality_values{0};
    size_t direct_entries{0};
    size_t bucketed_entries{0};
    size_t unique_hashes{0};            // directory length of the bucketed index
    size_t hash_collisions{0};          // distinct values minus distinct hashes
    size_t largest_bucket{0};
};

// ===== ATTRIBUTE INDEX =====

/**
 * @class attribute_index
 * @brief Build-once, read-many index over one attribute of a fixed sequence
 *
 * Stores only identifiers (positions in the source sequence), hashes and
 * values, so it does not reference the source after construction. All
 * queries are const and safe to run concurrently.
 *
 * @tparam Value    attribute value type, hashable and equality-comparable
 * @tparam Id       unsigned identifier type, wide enough for n - 1
 * @tparam Hash     maps Value to 64 bits; equal values must hash equal
 * @tparam KeyEqual value equality
 */
template<typename Value,
         object_id Id = uint32_t,
         typename Hash = std_hash<Value>,
         typename KeyEqual = std::equal_to<Value>>
    requires indexable<Value, Hash, KeyEqual>
class attribute_index {
public:
    using value_type = Value;
    using id_type = Id;
    using id_list = std::vector<Id>;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using bucketed_type = bucketed_index<Value, Id, Hash, KeyEqual>;

private:
    // unordered_map wants size_t
    struct map_hasher {
        [[no_unique_address]] Hash hash;

        size_t operator()(const Value& v) const {
            return static_cast<size_t>(static_cast<uint64_t>(hash(v)));
        }
    };

    using direct_map = std::unordered_map<Value, id_list, map_hasher, KeyEqual>;

    direct_map direct_;
    std::optional<bucketed_type> bucketed_;
    index_config config_;
    index_stats stats_;

    attribute_index(direct_map direct, std::optional<bucketed_type> bucketed,
                    index_config config, index_stats stats)
        : direct_(std::move(direct))
        , bucketed_(std::move(bucketed))
        , config_(config)
        , stats_(stats) {}

    // Drop flagged positions, keeping the order of the rest
    static void compact(hashed_entries<Value, Id>& entries, const std::vector<bool>& drop) {
        size_t out = 0;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (drop[i]) {
                continue;
            }
            if (out != i) {
                entries.hashes[out] = entries.hashes[i];
                entries.values[out] = std::move(entries.values[i]);
                entries.ids[out] = entries.ids[i];
            }
            ++out;
        }
        auto keep = static_cast<std::ptrdiff_t>(out);
        entries.hashes.erase(entries.hashes.begin() + keep, entries.hashes.end());
        entries.values.erase(entries.values.begin() + keep, entries.values.end());
        entries.ids.erase(entries.ids.begin() + keep, entries.ids.end());
    }

    static size_t count_distinct_hashes(const std::vector<hash_value>& sorted_hashes) noexcept {
        size_t distinct = 0;
        for (size_t i = 0; i < sorted_hashes.size(); ++i) {
            if (i == 0 || sorted_hashes[i] != sorted_hashes[i - 1]) {
                ++distinct;
            }
        }
        return distinct;
    }

public:
    // ===== CONSTRUCTION =====

    /**
     * @brief Index every object of @p objects by the value @p extract yields
     *
     * @p extract may be any invocable on const Object&, including a pointer
     * to data member, returning Value or std::optional<Value>. Objects
     * yielding an empty optional are not indexed.
     *
     * Exceptions thrown by the extractor or hasher propagate; no partial
     * index is ever returned.
     *
     * @return the index, or error::id_width_overflow
     */
    template<std::ranges::input_range Objects, typename Extractor>
    [[nodiscard]] static result<attribute_index> build(
        Objects&& objects,
        Extractor&& extract,
        index_config config = {},
        Hash hash = {},
        KeyEqual equal = {}) {

        static_assert(std::same_as<extracted_value_t<Extractor, std::ranges::range_value_t<Objects>>, Value>,
                      "extractor must produce the index value type");

        auto sorted = hash_sort<Id>(objects, extract, hash);
        if (!sorted) {
            return std::unexpected(sorted.error());
        }
        auto& entries = *sorted;

        group_by_value(entries, equal);
        auto value_runs = run_length_encode(entries.values, equal);

        index_stats stats;
        stats.object_count = entries.object_count;
        stats.indexed_count = entries.size();
        stats.distinct_values = value_runs.size();
        stats.hash_collisions = value_runs.size() - count_distinct_hashes(entries.hashes);

        direct_map direct(0, map_hasher{hash}, equal);
        std::vector<bool> extracted(entries.size(), false);
        size_t n_extracted = 0;

        const std::span<const Id> all_ids(entries.ids);
        for (size_t i = 0; i < value_runs.size(); ++i) {
            const size_t start = value_runs.starts[i];
            const size_t length = value_runs.lengths[i];

            auto route = route_run<Id>(all_ids.subspan(start, length), config.cardinality_threshold);
            if (auto* lookup = std::get_if<direct_lookup<Id>>(&route)) {
                std::fill_n(extracted.begin() + static_cast<std::ptrdiff_t>(start), length, true);
                n_extracted += length;
                direct.emplace(std::move(value_runs.uniques[i]), std::move(lookup->ids));
            }
        }

        stats.high_cardinality_values = direct.size();
        stats.direct_entries = n_extracted;

        std::optional<bucketed_type> remainder;
        if (n_extracted < entries.size()) {
            if (n_extracted > 0) {
                compact(entries, extracted);
            }
            remainder.emplace(std::move(entries), hash, equal);
            stats.bucketed_entries = remainder->size();
            stats.unique_hashes = remainder->bucket_count();
            stats.largest_bucket = remainder->largest_bucket();
        }

        return attribute_index{std::move(direct), std::move(remainder), config, stats};
    }

    // ===== BUILDER =====

    /**
     * @class builder
     * @brief Fluent configuration for attribute_index construction
     */
    class builder {
        index_config config_{};
        Hash hash_{};
        KeyEqual equal_{};

    public:
        builder() = default;

        builder& with_config(index_config config) {
            config_ = config;
            return *this;
        }

        builder& with_cardinality_threshold(size_t threshold) {
            config_.cardinality_threshold = threshold;
            return *this;
        }

        builder& with_hasher(Hash hash) {
            hash_ = std::move(hash);
            return *this;
        }

        builder& with_equal(KeyEqual equal) {
            equal_ = std::move(equal);
            return *this;
        }

        template<std::ranges::input_range Objects, typename Extractor>
        [[nodiscard]] result<attribute_index> build(Objects&& objects, Extractor&& extract) const {
            return attribute_index::build(std::forward<Objects>(objects),
                                          std::forward<Extractor>(extract),
                                          config_, hash_, equal_);
        }
    };

    // ===== QUERIES =====

    /**
     * @brief Ids of objects whose value equals @p value, ascending
     *
     * Unknown values give an empty list.
     */
    [[nodiscard]] id_list get(const Value& value) const {
        if (auto it = direct_.find(value); it != direct_.end()) {
            return it->second;
        }
        if (bucketed_) {
            auto match = bucketed_->find(value);
            id_list ids(match.begin(), match.end());
            // Bucket runs come out ascending; keep the output guarantee local
            if (!std::ranges::is_sorted(ids)) {
                std::ranges::sort(ids);
            }
            return ids;
        }
        return empty_ids<Id>();
    }

    /**
     * @brief Ids of every object that has a value for this attribute, ascending
     */
    [[nodiscard]] id_list get_all() const {
        id_list all;
        all.reserve(size());
        if (bucketed_) {
            auto ids = bucketed_->ids();
            all.insert(all.end(), ids.begin(), ids.end());
        }
        for (const auto& [value, ids] : direct_) {
            all.insert(all.end(), ids.begin(), ids.end());
        }
        std::ranges::sort(all);
        return all;
    }

    /**
     * @brief Number of (object, value) associations held
     */
    [[nodiscard]] size_t size() const noexcept {
        size_t total = bucketed_ ? bucketed_->size() : 0;
        for (const auto& [value, ids] : direct_) {
            total += ids.size();
        }
        return total;
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] size_t count(const Value& value) const {
        if (auto it = direct_.find(value); it != direct_.end()) {
            return it->second.size();
        }
        return bucketed_ ? bucketed_->find(value).size() : 0;
    }

    [[nodiscard]] bool contains(const Value& value) const {
        return count(value) != 0;
    }

    // ===== INTROSPECTION =====

    [[nodiscard]] size_t object_count() const noexcept { return stats_.object_count; }
    [[nodiscard]] size_t threshold() const noexcept { return config_.cardinality_threshold; }
    [[nodiscard]] const index_config& config() const noexcept { return config_; }
    [[nodiscard]] const index_stats& statistics() const noexcept { return stats_; }

    [[nodiscard]] bool is_high_cardinality(const Value& value) const {
        return direct_.contains(value);
    }

    // Absent when every value went to the high-cardinality map
    [[nodiscard]] const bucketed_type* bucketed_part() const noexcept {
        return bucketed_ ? &*bucketed_ : nullptr;
    }

    template<typename F>
    void for_each_high_cardinality(F&& f) const {
        for (const auto& [value, ids] : direct_) {
            f(value, std::span<const Id>(ids));
        }
    }
};

// ===== FACTORY FUNCTIONS =====

/**
 * @brief Build an index, deducing the value type from the extractor
 */
template<object_id Id = uint32_t,
         std::ranges::input_range Objects,
         typename Extractor,
         typename Value = extracted_value_t<Extractor, std::ranges::range_value_t<Objects>>,
         typename Hash = std_hash<Value>>
[[nodiscard]] auto make_attribute_index(Objects&& objects, Extractor&& extract,
                                        index_config config = {}, Hash hash = {})
    -> result<attribute_index<Value, Id, Hash>> {
    return attribute_index<Value, Id, Hash>::build(
        std::forward<Objects>(objects), std::forward<Extractor>(extract), config, std::move(hash));
}

} // namespace attridx
