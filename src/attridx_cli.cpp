/**
 * @file attridx_cli.cpp
 * @brief Command-line interface: index one column of a delimited file and query it
 *
 * Each line of the input file is one object; its id is the 0-based line
 * number. The chosen column is the attribute. Blank lines and lines too
 * short to have the column have no value and are not indexed.
 */

#include <attridx/attridx.hpp>
#include <attridx/delimited.hpp>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace attridx;

// Exit codes for consistent error handling
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_ERROR_CODE = 1;
constexpr int EXIT_INVALID_ARGS = 2;
constexpr int EXIT_FILE_ERROR = 3;

/**
 * @brief Display usage information
 */
void usage() {
    std::cerr << R"(attridx - immutable attribute index over one column of a file

USAGE:
    attridx <file> <column> [options] <command> [args...]

COMMANDS:
    get <value>...        Print ids of lines whose column equals each value
    count <value>...      Print number of matching lines for each value
    all                   Print ids of every line that has the column
    size                  Print number of indexed lines
    stats                 Show index statistics

OPTIONS:
    --delimiter <c>       Field delimiter (default: ',')
    --threshold <n>       Cardinality threshold (default: 250)
    --hash std|fnv1a      Value hash function (default: std)
    --id-width <bits>     Identifier width 8|16|32|64 (default: smallest fitting)
    --verbose             Report build statistics on stderr

EXAMPLES:
    attridx people.csv 2 get Oslo Lima
    attridx people.tsv 0 --delimiter '	' --threshold 100 stats
)";
}

struct cli_options {
    std::string file;
    size_t column{0};
    char delimiter{','};
    index_config config{};
    bool use_fnv1a{false};
    std::optional<id_width> width;
    bool verbose{false};
    std::string command;
    std::vector<std::string> args;
};

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<cli_options> parse_args(int argc, char* argv[]) {
    if (argc < 4) {
        return std::nullopt;
    }

    cli_options opts;
    opts.file = argv[1];
    auto column = parse_number<size_t>(argv[2]);
    if (!column) {
        std::cerr << "Error: Column must be a non-negative integer\n";
        return std::nullopt;
    }
    opts.column = *column;

    int i = 3;
    for (; i < argc && std::strncmp(argv[i], "--", 2) == 0; ++i) {
        std::string_view flag = argv[i];
        if (flag == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " needs a value\n";
            return std::nullopt;
        }
        std::string_view value = argv[++i];

        if (flag == "--delimiter") {
            if (value.size() != 1) {
                std::cerr << "Error: Delimiter must be a single character\n";
                return std::nullopt;
            }
            opts.delimiter = value[0];
        } else if (flag == "--threshold") {
            auto threshold = parse_number<size_t>(value);
            if (!threshold) {
                std::cerr << "Error: Threshold must be a non-negative integer\n";
                return std::nullopt;
            }
            opts.config.cardinality_threshold = *threshold;
        } else if (flag == "--hash") {
            if (value != "std" && value != "fnv1a") {
                std::cerr << "Error: Unknown hash '" << value << "'\n";
                return std::nullopt;
            }
            opts.use_fnv1a = value == "fnv1a";
        } else if (flag == "--id-width") {
            auto bits = parse_number<unsigned>(value);
            result<id_width> width = bits ? parse_id_width(*bits)
                                           : result<id_width>{std::unexpected(error::invalid_id_width)};
            if (!width) {
                std::cerr << "Error: " << error_message(width.error()) << "\n";
                return std::nullopt;
            }
            opts.width = *width;
        } else {
            std::cerr << "Error: Unknown option " << flag << "\n";
            return std::nullopt;
        }
    }

    if (i >= argc) {
        std::cerr << "Error: Missing command\n";
        return std::nullopt;
    }
    opts.command = argv[i++];
    opts.args.assign(argv + i, argv + argc);
    return opts;
}

std::optional<std::vector<std::string>> read_lines(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

template<typename Id>
void print_ids(const std::vector<Id>& ids) {
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) std::cout << ' ';
        // uint8_t would otherwise print as a character
        std::cout << static_cast<uint64_t>(ids[i]);
    }
    std::cout << '\n';
}

template<typename Index>
void print_stats(std::ostream& out, const Index& index) {
    const auto& s = index.statistics();
    out << "Objects:                 " << s.object_count << "\n";
    out << "Indexed:                 " << s.indexed_count << "\n";
    out << "Distinct values:         " << s.distinct_values << "\n";
    out << "Threshold:               " << index.threshold() << "\n";
    out << "High-cardinality values: " << s.high_cardinality_values
        << " (" << s.direct_entries << " entries)\n";
    out << "Bucketed entries:        " << s.bucketed_entries << "\n";
    out << "Unique hashes:           " << s.unique_hashes << "\n";
    out << "Hash collisions:         " << s.hash_collisions << "\n";
    out << "Largest bucket:          " << s.largest_bucket << "\n";
    out << "Identifier width:        " << sizeof(typename Index::id_type) * 8 << " bits\n";
}

template<typename Id, typename Hash>
int run(const cli_options& opts, const std::vector<std::string>& lines) {
    const column_extractor field{opts.delimiter, opts.column};

    auto index = attribute_index<std::string, Id, Hash>::build(lines, field, opts.config);
    if (!index) {
        std::cerr << "Error: " << error_message(index.error()) << "\n";
        return EXIT_ERROR_CODE;
    }

    if (opts.verbose) {
        std::cerr << "Indexed column " << opts.column << " of " << opts.file << "\n";
        print_stats(std::cerr, *index);
    }

    if (opts.command == "get" && !opts.args.empty()) {
        for (const auto& value : opts.args) {
            print_ids(index->get(value));
        }
        return EXIT_SUCCESS_CODE;
    }
    if (opts.command == "count" && !opts.args.empty()) {
        for (const auto& value : opts.args) {
            std::cout << index->count(value) << '\n';
        }
        return EXIT_SUCCESS_CODE;
    }
    if (opts.command == "all" && opts.args.empty()) {
        print_ids(index->get_all());
        return EXIT_SUCCESS_CODE;
    }
    if (opts.command == "size" && opts.args.empty()) {
        std::cout << index->size() << '\n';
        return EXIT_SUCCESS_CODE;
    }
    if (opts.command == "stats" && opts.args.empty()) {
        print_stats(std::cout, *index);
        return EXIT_SUCCESS_CODE;
    }

    std::cerr << "Error: Invalid command '" << opts.command << "'\n";
    usage();
    return EXIT_INVALID_ARGS;
}

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
        usage();
        return EXIT_SUCCESS_CODE;
    }

    auto opts = parse_args(argc, argv);
    if (!opts) {
        usage();
        return EXIT_INVALID_ARGS;
    }

    auto lines = read_lines(opts->file);
    if (!lines) {
        std::cerr << "Failed to open " << opts->file << "\n";
        std::cerr << "Check if file exists and has correct permissions\n";
        return EXIT_FILE_ERROR;
    }

    auto width = opts->width.value_or(smallest_id_width(lines->size()));

    try {
        return dispatch_id_width(width, [&](auto tag) {
            using Id = typename decltype(tag)::type;
            if (opts->use_fnv1a) {
                return run<Id, fnv1a_hash>(*opts, *lines);
            }
            return run<Id, std_hash<std::string>>(*opts, *lines);
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_ERROR_CODE;
    }
}
