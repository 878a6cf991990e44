/**
 * @file
 * @brief Conversions between enums and their names
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <optional>
#include <string_view>
#include <type_traits>

#if __has_include(<magic_enum/magic_enum.hpp>)
#include <magic_enum/magic_enum.hpp>
#else
#include <magic_enum.hpp>
#endif

namespace beacon::utils {

    /** Look up an enum value by name, ignoring case unless requested otherwise */
    template <typename E>
        requires std::is_enum_v<E>
    constexpr std::optional<E> enum_cast(std::string_view value, bool case_insensitive = true) noexcept {
        return case_insensitive ? magic_enum::enum_cast<E>(value, magic_enum::case_insensitive)
                                : magic_enum::enum_cast<E>(value);
    }

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto enum_name(E enum_val) noexcept {
        return magic_enum::enum_name<E>(enum_val);
    }

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto enum_names() noexcept {
        return magic_enum::enum_names<E>();
    }

} // namespace beacon::utils
