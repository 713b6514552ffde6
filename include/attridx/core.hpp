/**
 * @file core.hpp
 * @brief Core types, concepts and error handling for attridx
 *
 * Strong types keep hashes and identifiers from being mixed up, and
 * std::expected carries construction errors without exceptions.
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>

namespace attridx {

// ===== STRONG TYPES =====

/**
 * @struct hash_value
 * @brief 64-bit hash of an attribute value
 *
 * Hashes are the only thing the index ever orders; values are compared
 * for equality only.
 */
struct hash_value {
    uint64_t value{0};

    constexpr hash_value() noexcept = default;
    explicit constexpr hash_value(uint64_t v) noexcept : value(v) {}

    explicit constexpr operator uint64_t() const noexcept { return value; }

    constexpr auto operator<=>(const hash_value&) const noexcept = default;
};

// ===== ERROR HANDLING =====

enum class error : uint8_t {
    id_width_overflow,   // more objects than the identifier type can address
    invalid_id_width,    // not one of 8, 16, 32, 64
    unhashable_value     // runtime-typed value without a usable hash
};

[[nodiscard]] constexpr std::string_view error_message(error e) noexcept {
    switch (e) {
        case error::id_width_overflow: return "object count exceeds identifier width";
        case error::invalid_id_width:  return "identifier width must be 8, 16, 32 or 64";
        case error::unhashable_value:  return "attribute value is not hashable";
    }
    return "unknown error";
}

template<typename T>
using result = std::expected<T, error>;

using status = result<void>;

// ===== OBJECT IDENTIFIERS =====

template<typename Id>
concept object_id = std::unsigned_integral<Id> && !std::same_as<Id, bool>;

enum class id_width : uint8_t {
    bits8 = 8,
    bits16 = 16,
    bits32 = 32,
    bits64 = 64
};

/**
 * @brief Smallest identifier width that can represent n - 1
 */
[[nodiscard]] constexpr id_width smallest_id_width(size_t object_count) noexcept {
    uint64_t max_id = object_count == 0 ? 0 : static_cast<uint64_t>(object_count) - 1;
    if (max_id <= std::numeric_limits<uint8_t>::max()) return id_width::bits8;
    if (max_id <= std::numeric_limits<uint16_t>::max()) return id_width::bits16;
    if (max_id <= std::numeric_limits<uint32_t>::max()) return id_width::bits32;
    return id_width::bits64;
}

[[nodiscard]] constexpr result<id_width> parse_id_width(unsigned bits) noexcept {
    switch (bits) {
        case 8:  return id_width::bits8;
        case 16: return id_width::bits16;
        case 32: return id_width::bits32;
        case 64: return id_width::bits64;
        default: return std::unexpected(error::invalid_id_width);
    }
}

template<object_id Id>
[[nodiscard]] constexpr bool fits_id_width(size_t object_count) noexcept {
    return object_count == 0 ||
           static_cast<uint64_t>(object_count) - 1 <= std::numeric_limits<Id>::max();
}

/**
 * @brief Select a compile-time identifier type from a runtime width
 *
 * Calls f(std::type_identity<Id>{}) for the matching unsigned type.
 * Every branch must return the same type.
 */
template<typename F>
decltype(auto) dispatch_id_width(id_width width, F&& f) {
    switch (width) {
        case id_width::bits8:  return std::forward<F>(f)(std::type_identity<uint8_t>{});
        case id_width::bits16: return std::forward<F>(f)(std::type_identity<uint16_t>{});
        case id_width::bits32: return std::forward<F>(f)(std::type_identity<uint32_t>{});
        case id_width::bits64: return std::forward<F>(f)(std::type_identity<uint64_t>{});
    }
    std::unreachable();
}

// ===== VALUE CONTRACT =====

/**
 * @concept value_hasher
 * @brief Maps a value to a 64-bit hash; equal values must hash equal
 */
template<typename Hash, typename Value>
concept value_hasher = requires(const Hash& h, const Value& v) {
    { h(v) } -> std::convertible_to<uint64_t>;
};

/**
 * @concept indexable
 * @brief A value usable as an attribute value: hashable and equality-comparable
 *
 * No ordering is required. A type that fails this concept cannot be indexed.
 */
template<typename Value, typename Hash, typename KeyEqual>
concept indexable =
    std::copy_constructible<Value> &&
    value_hasher<Hash, Value> &&
    std::predicate<const KeyEqual&, const Value&, const Value&>;

// ===== CONFIGURATION =====

// Bounds the worst-case two-pointer scan inside one hash bucket
inline constexpr size_t default_cardinality_threshold = 250;

// Aggregate type to allow designated initializers
struct index_config {
    size_t cardinality_threshold{default_cardinality_threshold};
};

} // namespace attridx
