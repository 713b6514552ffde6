#pragma once

#include <cstdint>
#include <string>

/**
 * Value types and hashers for testing
 */

// Compared by equality only; there is no operator<
struct tagged_value {
    std::string name;

    bool operator==(const tagged_value&) const = default;
};

// Every value lands in one bucket
struct constant_hash {
    uint64_t operator()(const tagged_value&) const noexcept { return 42; }
};

// Values of equal length collide
struct length_hash {
    uint64_t operator()(const tagged_value& v) const noexcept { return v.name.size(); }
};

// Unsortable compound value
struct grid_point {
    int x{0};
    int y{0};

    bool operator==(const grid_point&) const = default;
};

struct grid_point_hash {
    uint64_t operator()(const grid_point& p) const noexcept {
        return (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) ^
               static_cast<uint32_t>(p.y);
    }
};

// Deliberately weak hash: only seven distinct outputs
struct mod7_hash {
    uint64_t operator()(int v) const noexcept {
        return static_cast<uint64_t>(v % 7);
    }
};
