#include "core/rent.hpp"

#include <algorithm>
#include <cassert>

namespace monopoly {

static Money propertyRent(const Board& board, const SpaceData& space, const Deed& deed) {
	assert(!space.rent.empty());

	const auto houses = std::min<std::size_t>(deed.houses, space.rent.size() - 1u);
	const auto rent   = space.rent[houses];

	if (deed.houses == 0u && board.ownsWholeGroup(space.group, *deed.owner)) {
		return 2 * rent;
	}
	return rent;
}

static Money railroadRent(const Board& board, const SpaceData& space, const Deed& deed) {
	assert(!space.rent.empty());

	const auto owned = board.countOwnedInGroup(space.group, *deed.owner);
	const auto index = std::clamp<std::size_t>(owned, 1u, space.rent.size()) - 1u;
	return space.rent[index];
}

static Money utilityRent(const Board& board, const SpaceData& space, const Deed& deed, std::optional<unsigned> diceSum) {
	if (!diceSum) {
		return 0;
	}

	const auto owned      = board.countOwnedInGroup(space.group, *deed.owner);
	const auto multiplier = owned >= 2u ? UTILITY_BOTH_MULTIPLIER : UTILITY_SINGLE_MULTIPLIER;
	return static_cast<Money>(*diceSum * multiplier);
}

Money computeRent(const Board& board, const SpaceIndex index, const std::optional<unsigned> diceSum) {
	assert(isValidSpace(index));

	const auto& space = board.space(index);
	const auto& deed  = board.deed(index);
	if (!deed.owner || deed.mortgaged) {
		return 0;
	}

	switch (space.kind) {
	case SpaceKind::Property:
		return propertyRent(board, space, deed);
	case SpaceKind::Railroad:
		return railroadRent(board, space, deed);
	case SpaceKind::Utility:
		return utilityRent(board, space, deed, diceSum);
	case SpaceKind::Go:
	case SpaceKind::IncomeTax:
	case SpaceKind::LuxuryTax:
	case SpaceKind::Chance:
	case SpaceKind::CommunityChest:
	case SpaceKind::Jail:
	case SpaceKind::GoToJail:
	case SpaceKind::FreeParking:
	case SpaceKind::None:
		return 0;
	}
	return 0;
}

Money taxAmount(const SpaceKind kind) {
	switch (kind) {
	case SpaceKind::IncomeTax:
		return INCOME_TAX;
	case SpaceKind::LuxuryTax:
		return LUXURY_TAX;
	default:
		return 0;
	}
}

} // namespace monopoly
