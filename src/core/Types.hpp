//
// Created on 12/10/2026.
//

#ifndef NOMERCYUNO_TYPES_HPP
#define NOMERCYUNO_TYPES_HPP

#define UNO_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <utility>
#include <variant>

namespace uno::core
{
    enum class Color : uint8_t
    {
        Red = 0,
        Yellow,
        Green,
        Blue,
        // nominal color of a wild card before it is resolved
        Wild
    };
    enum class Rank : uint8_t
    {
        Zero = 0,
        One,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Skip,
        Reverse,
        DrawTwo,
        Wild,
        WildDrawFour
    };
}

namespace uno::core::constants
{
    inline constexpr size_t ColorCount = std::to_underlying(Color::Wild) + 1;
    inline constexpr size_t RankCount = std::to_underlying(Rank::WildDrawFour) + 1;
    inline constexpr std::array<Color, 4> StandardColors{Color::Red, Color::Yellow, Color::Green, Color::Blue};
    inline constexpr size_t DeckSize = 108;
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 10;
}

namespace uno::core
{
    constexpr auto IsNumber(Rank const r) noexcept -> bool { return r <= Rank::Nine; }
    constexpr auto IsAction(Rank const r) noexcept -> bool { return r >= Rank::Skip && r <= Rank::DrawTwo; }
    constexpr auto IsWild(Rank const r) noexcept -> bool { return r == Rank::Wild || r == Rank::WildDrawFour; }
    constexpr auto IsStandard(Color const c) noexcept -> bool { return c != Color::Wild; }
    // ranks a pending draw chain can be answered with
    constexpr auto IsStackable(Rank const r) noexcept -> bool { return r == Rank::DrawTwo || r == Rank::WildDrawFour; }

    struct Card
    {
        Card() = delete;
        constexpr Card(Color color, Rank rank) : color(color), rank(rank) {}

        Color color;
        Rank rank;
    };
    constexpr auto operator==(Card const& a, Card const& b) -> bool { return a.color == b.color && a.rank == b.rank; }

    // zones only ever hold const cards; a card never changes after the deck is built
    using CardSP = std::shared_ptr<Card const>;

    using RngT = std::mt19937_64;

    struct Config
    {
        uint32_t n_players{2};
        uint8_t  hand_size{7};
        // drawn cards that match the table are played immediately
        bool     no_mercy{true};
        uint64_t seed{std::random_device{}()};
    };
    using PlyrIdxT = uint8_t;
}

#endif //NOMERCYUNO_TYPES_HPP
