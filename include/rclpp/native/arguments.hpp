/**
 * @file arguments.hpp
 * @brief Parsing of the runtime section of the process arguments.
 *
 * Everything between `--ros-args` and a lone `--` (or the end of the
 * argument list) belongs to the runtime; only remap rules
 * (`-r from:=to` / `--remap from:=to`) are understood there.  Arguments
 * outside of such a section are the application's and are ignored.
 */

#pragma once

#include <rclpp/native/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace rclpp::native {

struct RemapRule {
    std::string from;
    std::string to;
};

struct Arguments {
    std::vector<std::string> argv;        ///< Copy of every argument.
    std::optional<std::string> node_name; ///< From `__node:=`.
    std::optional<std::string> node_namespace; ///< From `__ns:=`.
    std::vector<RemapRule> topic_remaps;
};

namespace detail {

inline ret_t parse_remap(const std::string& rule, Arguments* out) {
    const size_t separator = rule.find(":=");
    if (separator == std::string::npos || separator == 0 ||
        separator + 2 == rule.size()) {
        return fail(RET_INVALID_ARGUMENT,
                    "malformed remap rule '" + rule + "', expected from:=to");
    }
    std::string from = rule.substr(0, separator);
    std::string to = rule.substr(separator + 2);
    if (from == "__node" || from == "__name") {
        out->node_name = std::move(to);
    } else if (from == "__ns") {
        out->node_namespace = std::move(to);
    } else {
        out->topic_remaps.push_back({std::move(from), std::move(to)});
    }
    return RET_OK;
}

} // namespace detail

/**
 * @brief Parse @p argv into @p out.
 * @return `RET_INVALID_ARGUMENT` for an unknown or malformed runtime
 *         argument; @p out is then left in an unspecified state.
 */
inline ret_t parse_arguments(int argc, const char* const* argv,
                             Arguments* out) {
    if (!out || argc < 0 || (argc > 0 && !argv)) {
        return fail(RET_INVALID_ARGUMENT, "invalid argument vector");
    }
    bool in_runtime_section = false;
    for (int i = 0; i < argc; ++i) {
        if (!argv[i]) {
            return fail(RET_INVALID_ARGUMENT,
                        "argument " + std::to_string(i) + " is null");
        }
        const std::string arg(argv[i]);
        out->argv.push_back(arg);

        if (!in_runtime_section) {
            in_runtime_section = (arg == "--ros-args");
            continue;
        }
        if (arg == "--") {
            in_runtime_section = false;
        } else if (arg == "--ros-args") {
            continue;
        } else if (arg == "-r" || arg == "--remap") {
            if (i + 1 >= argc || !argv[i + 1]) {
                return fail(RET_INVALID_ARGUMENT,
                            "'" + arg + "' must be followed by a rule");
            }
            ++i;
            out->argv.emplace_back(argv[i]);
            ret_t ret = detail::parse_remap(argv[i], out);
            if (ret != RET_OK) {
                return ret;
            }
        } else {
            return fail(RET_INVALID_ARGUMENT,
                        "unknown runtime argument '" + arg + "'");
        }
    }
    return RET_OK;
}

} // namespace rclpp::native
