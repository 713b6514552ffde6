/**
 * @file delimited.hpp
 * @brief Column extractor for delimited text records
 *
 * One line is one object. A line that is blank, or has fewer fields than
 * the wanted column, has no value for that column and is not indexed.
 * An empty field between delimiters is the value "".
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace attridx {

struct column_extractor {
    char delimiter{','};
    size_t column{0};

    [[nodiscard]] std::optional<std::string> operator()(std::string_view line) const {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return std::nullopt;
        }
        for (size_t col = 0;; ++col) {
            auto pos = line.find(delimiter);
            if (col == column) {
                return std::string(line.substr(0, pos));
            }
            if (pos == std::string_view::npos) {
                return std::nullopt;
            }
            line.remove_prefix(pos + 1);
        }
    }
};

} // namespace attridx
