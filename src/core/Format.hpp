//
// Created on 13/10/2026.
//

#ifndef NOMERCYUNO_FORMAT_HPP
#define NOMERCYUNO_FORMAT_HPP

#include <array>
#include <string_view>
#include <fmt/format.h>
#include "Types.hpp"

namespace uno::core
{
    inline auto to_string(Color const c) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::ColorCount> map{
            "RED", "YELLOW", "GREEN", "BLUE", "WILD"
        };
        return map[std::to_underlying(c)];
    }

    inline auto to_string(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RankCount> map{
            "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
            "SKIP", "REVERSE", "DRAW_TWO", "WILD", "WILD_DRAW_FOUR"
        };
        return map[std::to_underlying(r)];
    }
}

template <>
struct fmt::formatter<uno::core::Color> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(uno::core::Color const c, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(uno::core::to_string(c), ctx);
    }
};

template <>
struct fmt::formatter<uno::core::Rank> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(uno::core::Rank const r, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(uno::core::to_string(r), ctx);
    }
};

// wild ranks print without their stored color
template <>
struct fmt::formatter<uno::core::Card> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(uno::core::Card const& c, FormatContext& ctx) const
    {
        if (uno::core::IsWild(c.rank))
            return fmt::formatter<std::string_view>::format(uno::core::to_string(c.rank), ctx);
        std::string const s = fmt::format("{} {}", uno::core::to_string(c.color), uno::core::to_string(c.rank));
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //NOMERCYUNO_FORMAT_HPP
