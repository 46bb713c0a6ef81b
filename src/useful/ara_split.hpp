/******************************************************************************\
 * ara_split.hpp - Header file for splitting remote command output.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace ara {

/* split string into tuple of size determined at compile time. usage:
    auto [s_1, ..., s_N] = split::string<N>(line_to_split, delim = ' ');
   the last element receives the unsplit remainder of the line.
*/
namespace split {

    static inline std::string removeLeadingWhitespace(const std::string& str, const std::string& whitespace = " \t\r\n") {
        const auto startPos = str.find_first_not_of(whitespace);
        if (startPos == std::string::npos) return "";
        const auto endPos = str.find_last_not_of(whitespace);
        return str.substr(startPos, endPos - startPos + 1);
    }

    namespace detail {
        template <std::size_t, typename T>
        using repeat_t = T;

        template <std::size_t... Is>
        static inline auto stringTuple(std::index_sequence<Is...>) {
            return std::tuple<repeat_t<Is, std::string>...>{};
        }
    }

    template <std::size_t N>
    static inline auto string(std::string const& line, char delim = ' ') {
        static_assert(N > 0, "split into zero strings");
        auto tup = detail::stringTuple(std::make_index_sequence<N>{});

        std::stringstream linestream(line);
        std::apply([&](auto&... str_targets) {
            (std::getline(linestream, str_targets, delim), ...);
        }, tup);

        std::string rest;
        std::getline(linestream, rest, '\0');
        if (!rest.empty()) {
            std::get<N - 1>(tup).append(delim + rest);
        }

        return tup;
    }

    // split output into non-empty, trimmed lines
    static inline std::vector<std::string> lines(std::string const& output) {
        auto result = std::vector<std::string>{};
        std::stringstream stream(output);
        std::string line;
        while (std::getline(stream, line)) {
            line = removeLeadingWhitespace(line);
            if (!line.empty()) {
                result.push_back(std::move(line));
            }
        }
        return result;
    }

} /* namespace ara::split */

} /* namespace ara */
