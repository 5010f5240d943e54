#pragma once

#include <cstddef>
#include <cstdint>

namespace monopoly {

using PlayerId   = unsigned; //!< Seat index of a player. Stable for the whole game.
using SpaceIndex = unsigned; //!< Board position in [0, BOARD_SIZE).
using Money      = int;      //!< Signed to allow the transient negative window before bankruptcy.

inline constexpr std::size_t BOARD_SIZE = 40u;

// Classic ruleset constants.
inline constexpr Money STARTING_MONEY  = 1500;
inline constexpr Money GO_INCOME       = 200;
inline constexpr Money INCOME_TAX      = 200;
inline constexpr Money LUXURY_TAX      = 100;
inline constexpr Money JAIL_FINE       = 50;
inline constexpr unsigned MAX_JAIL_TURNS = 3u;
inline constexpr unsigned SPEEDING_LIMIT = 3u; //!< Consecutive doubles that send a player to jail.
inline constexpr unsigned HOTEL          = 5u; //!< House count that denotes a hotel.

inline constexpr SpaceIndex GO_POSITION         = 0u;
inline constexpr SpaceIndex JAIL_POSITION       = 10u;
inline constexpr SpaceIndex GO_TO_JAIL_POSITION = 30u;

inline constexpr unsigned UTILITY_SINGLE_MULTIPLIER = 4u;
inline constexpr unsigned UTILITY_BOTH_MULTIPLIER   = 10u;

//! What happens when a token comes to rest on a space.
enum class SpaceKind : std::uint8_t {
	Go,
	Property,
	Railroad,
	Utility,
	IncomeTax,
	LuxuryTax,
	Chance,
	CommunityChest,
	Jail,
	GoToJail,
	FreeParking,
	None,
};

//! Colour group of a space. Railroads and utilities form their own groups.
enum class ColorGroup : std::uint8_t {
	None,
	Brown,
	LightBlue,
	Pink,
	Orange,
	Red,
	Yellow,
	Green,
	DarkBlue,
	Railroad,
	Utility,
};

//! Spaces that can be bought and carry a deed owner.
inline constexpr bool isPurchasable(SpaceKind kind) {
	return kind == SpaceKind::Property || kind == SpaceKind::Railroad || kind == SpaceKind::Utility;
}

inline constexpr bool isValidSpace(SpaceIndex index) {
	return index < BOARD_SIZE;
}

} // namespace monopoly
