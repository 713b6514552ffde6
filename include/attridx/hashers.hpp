/**
 * @file hashers.hpp
 * @brief Value hash functions - each maps a value to 64 bits
 */

#pragma once

#include "core.hpp"
#include <functional>
#include <string_view>

namespace attridx {

/**
 * @struct std_hash
 * @brief Adapts std::hash to the 64-bit hasher contract
 */
template<typename Value>
struct std_hash {
    [[nodiscard]] uint64_t operator()(const Value& v) const
        noexcept(noexcept(std::hash<Value>{}(v))) {
        return static_cast<uint64_t>(std::hash<Value>{}(v));
    }
};

/**
 * @struct fnv1a_hash
 * @brief FNV-1a over the bytes of a string-like value
 *
 * Stable across processes and platforms, unlike std::hash.
 */
struct fnv1a_hash {
    [[nodiscard]] constexpr uint64_t operator()(std::string_view key) const noexcept {
        constexpr uint64_t fnv_offset_basis = 14695981039346656037ULL;
        constexpr uint64_t fnv_prime = 1099511628211ULL;

        uint64_t h = fnv_offset_basis;
        for (unsigned char c : key) {
            h ^= c;
            h *= fnv_prime;
        }
        return h;
    }
};

/**
 * @struct mix64_hash
 * @brief SplitMix64 finalizer for integral values
 */
struct mix64_hash {
    template<std::integral T>
    [[nodiscard]] constexpr uint64_t operator()(T v) const noexcept {
        uint64_t h = static_cast<uint64_t>(v);
        h ^= h >> 30;
        h *= 0xbf58476d1ce4e5b9ULL;
        h ^= h >> 27;
        h *= 0x94d049bb133111ebULL;
        h ^= h >> 31;
        return h;
    }
};

} // namespace attridx
