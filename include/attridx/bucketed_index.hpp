/**
 * @file bucketed_index.hpp
 * @brief Hash-sorted parallel arrays with a run-length encoded hash directory
 *
 * Layout, for n entries and U unique hashes:
 *
 *   sorted_ids_, sorted_values_, sorted_hashes_   length n, ordered by
 *       (hash, value group, id)
 *   unique_hashes_, hash_starts_, hash_run_lengths_   length U
 *
 * A lookup bisects unique_hashes_ to find the bucket, then shrinks
 * [start, end) from both sides until both ends hold the wanted value.
 * Values are grouped inside each bucket, so what remains is exactly the
 * matching run.
 */

#pragma once

#include "core.hpp"
#include "primitives.hpp"
#include <algorithm>
#include <span>
#include <vector>

namespace attridx {

template<typename Value, object_id Id, typename Hash, typename KeyEqual>
    requires indexable<Value, Hash, KeyEqual>
class bucketed_index {
    std::vector<Id> sorted_ids_;
    std::vector<Value> sorted_values_;
    std::vector<hash_value> sorted_hashes_;
    std::vector<hash_value> unique_hashes_;
    std::vector<size_t> hash_starts_;
    std::vector<size_t> hash_run_lengths_;
    size_t largest_bucket_{0};
    [[no_unique_address]] Hash hasher_;
    [[no_unique_address]] KeyEqual equal_;

public:
    /**
     * @brief Take ownership of grouped entries and build the directory
     *
     * @p entries must already be hash sorted and value grouped.
     */
    bucketed_index(hashed_entries<Value, Id> entries, Hash hasher, KeyEqual equal)
        : sorted_ids_(std::move(entries.ids))
        , sorted_values_(std::move(entries.values))
        , sorted_hashes_(std::move(entries.hashes))
        , hasher_(std::move(hasher))
        , equal_(std::move(equal)) {

        auto directory = run_length_encode(sorted_hashes_);
        unique_hashes_ = std::move(directory.uniques);
        hash_starts_ = std::move(directory.starts);
        hash_run_lengths_ = std::move(directory.lengths);
        if (!hash_run_lengths_.empty()) {
            largest_bucket_ = std::ranges::max(hash_run_lengths_);
        }
    }

    // ===== LOOKUP =====

    /**
     * @brief Identifiers of entries whose value equals @p value
     * @return View into this index's storage; empty if absent
     */
    [[nodiscard]] std::span<const Id> find(const Value& value) const {
        const hash_value target{static_cast<uint64_t>(hasher_(value))};

        auto it = std::ranges::lower_bound(unique_hashes_, target);
        if (it == unique_hashes_.end() || *it != target) {
            return {};
        }
        auto bucket = static_cast<size_t>(it - unique_hashes_.begin());

        size_t start = hash_starts_[bucket];
        size_t end = start + hash_run_lengths_[bucket];

        // Usually a no-op; only moves on a hash collision
        while (start < end && !equal_(sorted_values_[start], value)) {
            ++start;
        }
        while (end > start && !equal_(sorted_values_[end - 1], value)) {
            --end;
        }
        if (end <= start) {
            return {};
        }
        return std::span<const Id>(sorted_ids_).subspan(start, end - start);
    }

    // ===== ACCESSORS =====

    [[nodiscard]] std::span<const Id> ids() const noexcept { return sorted_ids_; }
    [[nodiscard]] std::span<const Value> values() const noexcept { return sorted_values_; }
    [[nodiscard]] std::span<const hash_value> hashes() const noexcept { return sorted_hashes_; }
    [[nodiscard]] std::span<const hash_value> unique_hashes() const noexcept { return unique_hashes_; }
    [[nodiscard]] std::span<const size_t> hash_starts() const noexcept { return hash_starts_; }
    [[nodiscard]] std::span<const size_t> hash_run_lengths() const noexcept { return hash_run_lengths_; }

    [[nodiscard]] size_t size() const noexcept { return sorted_ids_.size(); }
    [[nodiscard]] size_t bucket_count() const noexcept { return unique_hashes_.size(); }
    [[nodiscard]] size_t largest_bucket() const noexcept { return largest_bucket_; }
};

} // namespace attridx
