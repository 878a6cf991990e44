/**
 * @file
 * @brief Utilities for manipulating strings
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <algorithm>
#include <cctype> // IWYU pragma: export
#include <charconv>
#include <chrono>
#include <concepts>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

#include "beacon/core/utils/enum.hpp"

namespace beacon::utils {

    /** Transforms a string with a given operation */
    template <typename F> inline std::string transform(std::string_view string, F operation) {
        std::string out {};
        out.reserve(string.size());
        for(auto character : string) {
            out += static_cast<char>(operation(static_cast<unsigned char>(character)));
        }
        return out;
    }

    /** Converts a string-like object to a string */
    template <typename S>
        requires std::convertible_to<S, std::string_view>
    inline std::string to_string(S string_like) {
        const std::string_view string_view {string_like};
        return {string_view.data(), string_view.size()};
    }

    /** Converts a bool to a string */
    template <typename B>
        requires std::same_as<B, bool>
    inline std::string to_string(B t) {
        return {t ? "true" : "false"};
    }

    /** Converts a non-boolean arithmetic object to a string */
    template <typename A>
        requires std::is_arithmetic_v<A> && (!std::same_as<A, bool>)
    inline std::string to_string(A t) {
        std::string out {};
        out.resize(25);
        const auto res = std::to_chars(out.data(), out.data() + out.size(), t);
        out.resize(res.ptr - out.data());
        return out;
    }

    /** Object that is an std::chrono::duration */
    template <typename D>
    concept is_chrono_duration = requires(D d) { std::chrono::duration(d); };

    /** Convert a duration to a string, using the largest unit that represents it exactly */
    template <typename D>
        requires is_chrono_duration<D>
    std::string to_string(D d) {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d);
        if(ns.count() % 1'000'000'000 == 0) {
            return to_string(ns.count() / 1'000'000'000) + "s";
        }
        if(ns.count() % 1'000'000 == 0) {
            return to_string(ns.count() / 1'000'000) + "ms";
        }
        if(ns.count() % 1'000 == 0) {
            return to_string(ns.count() / 1'000) + "us";
        }
        return to_string(ns.count()) + "ns";
    }

    /** Converts an enum to a string */
    template <typename E>
        requires std::is_enum_v<E>
    inline std::string to_string(E enum_val) {
        return to_string(enum_name(enum_val));
    }

    /** Object that can be converted to a string */
    template <typename T>
    concept convertible_to_string = requires(T t) {
        { to_string(t) } -> std::same_as<std::string>;
    };

    /** Put a string in quotation marks */
    template <typename S>
        requires std::convertible_to<S, std::string_view>
    inline std::string quote(S string_like) {
        return "\"" + to_string(string_like) + "\"";
    }

    /** Converts a range to a string with custom to_string function and delimiter */
    template <typename R, typename F>
        requires std::ranges::bidirectional_range<R> && std::is_invocable_r_v<std::string, F, std::ranges::range_value_t<R>>
    inline std::string range_to_string(const R& range, F to_string_func, const std::string& delim = ", ") {
        std::string out {};
        if(!std::ranges::empty(range)) {
            std::ranges::for_each(std::ranges::subrange(std::cbegin(range), std::ranges::prev(std::ranges::cend(range))),
                                  [&](const auto& element) { out += to_string_func(element) + delim; });
            out += to_string_func(*std::ranges::crbegin(range));
        }
        return out;
    }

    /** Converts a range to a string with custom delimiter */
    template <typename R>
        requires std::ranges::bidirectional_range<R> && convertible_to_string<std::ranges::range_value_t<R>>
    inline std::string range_to_string(const R& range, const std::string& delim = ", ") {
        return range_to_string(
            range, [](const auto& element) { return to_string(element); }, delim);
    }

    /** List all possible enum values */
    template <typename E>
        requires std::is_enum_v<E>
    inline std::string list_enum_names() {
        return range_to_string(enum_names<E>());
    }

} // namespace beacon::utils
