#pragma once

#include "model/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace monopoly {

//! Static metadata of a board space. Immutable after the board is built.
struct SpaceData {
	SpaceIndex index{0u};
	SpaceKind kind{SpaceKind::None};
	std::string name;
	Money price{0};              //!< Purchase price. Zero for spaces that cannot be bought.
	std::vector<Money> rent;     //!< Property: base, 1-4 houses, hotel. Railroad: 1-4 railroads owned.
	Money houseCost{0};          //!< Cost of one house. Unused while building is not supported.
	Money mortgageValue{0};      //!< Paid out when mortgaging.
	ColorGroup group{ColorGroup::None};
};

//! Mutable ownership record of a space.
struct Deed {
	std::optional<PlayerId> owner; //!< Empty while the bank owns the space.
	unsigned houses{0u};           //!< [0, HOTEL], HOTEL denotes a hotel.
	bool mortgaged{false};
};

//! The 40 board spaces and their deeds.
class Board {
public:
	//! Setup a board from the space list. The list must hold BOARD_SIZE spaces ordered by index.
	explicit Board(std::vector<SpaceData> spaces);

	std::size_t size() const;

	const SpaceData& space(SpaceIndex index) const;
	const Deed& deed(SpaceIndex index) const;

	// Deed mutation. Only the transaction resolver is expected to call these.
	void setOwner(SpaceIndex index, std::optional<PlayerId> owner);
	void setHouses(SpaceIndex index, unsigned houses);
	void setMortgaged(SpaceIndex index, bool mortgaged);
	void resetDeeds(); //!< All deeds back to the bank, no houses, no mortgages.

	//! Indices of all spaces in a colour group, ordered by index.
	std::vector<SpaceIndex> spacesInGroup(ColorGroup group) const;
	//! Indices of all spaces of one kind, ordered by index.
	std::vector<SpaceIndex> spacesOfKind(SpaceKind kind) const;

	//! Number of deeds in the group owned by the player.
	unsigned countOwnedInGroup(ColorGroup group, PlayerId player) const;
	//! True if the player owns every space of the group.
	bool ownsWholeGroup(ColorGroup group, PlayerId player) const;
	//! True if any space of the group has at least one house.
	bool groupHasBuildings(ColorGroup group) const;

private:
	std::vector<SpaceData> m_spaces; //!< Static data, indexed by position.
	std::vector<Deed> m_deeds;       //!< Deed per position. Non-purchasable spaces keep an empty deed.
};

} // namespace monopoly
