/**
 * @file primitives.hpp
 * @brief Sorting, grouping and run-length primitives used to build an index
 *
 * These work on three parallel sequences (hashes, values, identifiers).
 * Only hashes are ever ordered; values are compared with an equality
 * predicate, so value types need not be sortable.
 */

#pragma once

#include "core.hpp"
#include <algorithm>
#include <functional>
#include <numeric>
#include <optional>
#include <ranges>
#include <vector>

namespace attridx {

// ===== EXTRACTOR TRAITS =====

template<typename T>
struct unwrap_optional {
    using type = T;
    static constexpr bool is_optional = false;
};

template<typename T>
struct unwrap_optional<std::optional<T>> {
    using type = T;
    static constexpr bool is_optional = true;
};

template<typename Extractor, typename Object>
using extractor_result_t =
    std::remove_cvref_t<std::invoke_result_t<Extractor&, const Object&>>;

/**
 * @brief Value type produced by an extractor
 *
 * An extractor returning std::optional<V> yields V; an empty optional
 * means the object has no value for the attribute.
 */
template<typename Extractor, typename Object>
using extracted_value_t = typename unwrap_optional<extractor_result_t<Extractor, Object>>::type;

// ===== HASH SORT =====

/**
 * @struct hashed_entries
 * @brief Parallel (hash, value, id) sequences of equal length
 */
template<typename Value, object_id Id>
struct hashed_entries {
    std::vector<hash_value> hashes;
    std::vector<Value> values;
    std::vector<Id> ids;
    size_t object_count{0};  // positions consumed, including objects without a value

    [[nodiscard]] size_t size() const noexcept { return ids.size(); }
    [[nodiscard]] bool empty() const noexcept { return ids.empty(); }
};

/**
 * @brief Extract, hash and stably sort every object's value by hash
 *
 * The identifier of an object is its position in @p objects. Entries with
 * equal hashes keep their input order, so ids inside a hash run ascend.
 *
 * @return entries, or error::id_width_overflow if a position does not fit Id
 */
template<object_id Id,
         std::ranges::input_range Objects,
         typename Extractor,
         typename Hash,
         typename Value = extracted_value_t<Extractor, std::ranges::range_value_t<Objects>>>
    requires value_hasher<Hash, Value>
[[nodiscard]] result<hashed_entries<Value, Id>> hash_sort(
    Objects&& objects, Extractor&& extract, const Hash& hasher) {

    using traits = unwrap_optional<extractor_result_t<Extractor, std::ranges::range_value_t<Objects>>>;

    std::vector<hash_value> hashes;
    std::vector<Value> values;
    std::vector<Id> ids;

    if constexpr (std::ranges::sized_range<Objects>) {
        auto n = static_cast<size_t>(std::ranges::size(objects));
        if (!fits_id_width<Id>(n)) {
            return std::unexpected(error::id_width_overflow);
        }
        hashes.reserve(n);
        values.reserve(n);
        ids.reserve(n);
    }

    auto append = [&](Id id, Value v) {
        hashes.emplace_back(static_cast<uint64_t>(hasher(v)));
        values.push_back(std::move(v));
        ids.push_back(id);
    };

    uint64_t position = 0;
    for (auto&& object : objects) {
        if (position > std::numeric_limits<Id>::max()) {
            return std::unexpected(error::id_width_overflow);
        }
        auto id = static_cast<Id>(position++);
        auto&& extracted = std::invoke(extract, std::as_const(object));
        if constexpr (traits::is_optional) {
            if (extracted) {
                append(id, *std::forward<decltype(extracted)>(extracted));
            }
        } else {
            append(id, std::forward<decltype(extracted)>(extracted));
        }
    }

    std::vector<size_t> order(ids.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::ranges::stable_sort(order, std::ranges::less{},
                             [&hashes](size_t i) { return hashes[i]; });

    hashed_entries<Value, Id> sorted;
    sorted.object_count = static_cast<size_t>(position);
    sorted.hashes.reserve(order.size());
    sorted.values.reserve(order.size());
    sorted.ids.reserve(order.size());
    for (size_t i : order) {
        sorted.hashes.push_back(hashes[i]);
        sorted.values.push_back(std::move(values[i]));
        sorted.ids.push_back(ids[i]);
    }
    return sorted;
}

// ===== GROUP BY VALUE =====

namespace detail {

// Stable regroup of [start, end), a run sharing one hash
template<typename Value, object_id Id, typename KeyEqual>
void group_run(hashed_entries<Value, Id>& entries, size_t start, size_t end,
               const KeyEqual& equal) {
    const size_t len = end - start;
    std::vector<size_t> group_of(len);
    std::vector<size_t> representatives;  // offset of first member of each group

    for (size_t i = 0; i < len; ++i) {
        const Value& v = entries.values[start + i];
        size_t g = 0;
        while (g < representatives.size() &&
               !std::invoke(equal, entries.values[start + representatives[g]], v)) {
            ++g;
        }
        if (g == representatives.size()) {
            representatives.push_back(i);
        }
        group_of[i] = g;
    }

    if (representatives.size() == 1) {
        return;
    }

    // Counting sort on group number keeps relative order inside each group
    std::vector<size_t> offsets(representatives.size() + 1, 0);
    for (size_t g : group_of) {
        ++offsets[g + 1];
    }
    std::partial_sum(offsets.begin(), offsets.end(), offsets.begin());

    std::vector<size_t> order(len);
    for (size_t i = 0; i < len; ++i) {
        order[offsets[group_of[i]]++] = i;
    }

    std::vector<Value> values;
    std::vector<Id> ids;
    values.reserve(len);
    ids.reserve(len);
    for (size_t i : order) {
        values.push_back(std::move(entries.values[start + i]));
        ids.push_back(entries.ids[start + i]);
    }
    std::ranges::move(values, entries.values.begin() + static_cast<std::ptrdiff_t>(start));
    std::ranges::copy(ids, entries.ids.begin() + static_cast<std::ptrdiff_t>(start));
}

} // namespace detail

/**
 * @brief Make equal values contiguous inside every run of equal hash
 *
 * Hash order is untouched. Within each value group the original relative
 * order of identifiers is kept. Only equality is used.
 */
template<typename Value, object_id Id, typename KeyEqual = std::equal_to<Value>>
void group_by_value(hashed_entries<Value, Id>& entries, const KeyEqual& equal = {}) {
    const size_t n = entries.size();
    size_t run_start = 0;
    while (run_start < n) {
        size_t run_end = run_start + 1;
        while (run_end < n && entries.hashes[run_end] == entries.hashes[run_start]) {
            ++run_end;
        }
        // Two entries are always grouped, equal or not
        if (run_end - run_start > 2) {
            detail::group_run(entries, run_start, run_end, equal);
        }
        run_start = run_end;
    }
}

// ===== RUN-LENGTH ENCODING =====

template<typename T>
struct runs {
    std::vector<size_t> starts;
    std::vector<size_t> lengths;
    std::vector<T> uniques;

    [[nodiscard]] size_t size() const noexcept { return starts.size(); }
};

/**
 * @brief Compress a grouped sequence into (start, length, element) runs
 */
template<typename T, typename KeyEqual = std::equal_to<T>>
[[nodiscard]] runs<T> run_length_encode(const std::vector<T>& sequence,
                                        const KeyEqual& equal = {}) {
    runs<T> out;
    size_t i = 0;
    while (i < sequence.size()) {
        size_t j = i + 1;
        while (j < sequence.size() && std::invoke(equal, sequence[i], sequence[j])) {
            ++j;
        }
        out.starts.push_back(i);
        out.lengths.push_back(j - i);
        out.uniques.push_back(sequence[i]);
        i = j;
    }
    return out;
}

// Zero-length identifier sequence of the configured width
template<object_id Id>
[[nodiscard]] std::vector<Id> empty_ids() {
    return {};
}

} // namespace attridx
