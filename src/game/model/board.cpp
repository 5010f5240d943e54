#include "model/board.hpp"

#include <algorithm>
#include <cassert>

namespace monopoly {

Board::Board(std::vector<SpaceData> spaces) : m_spaces(std::move(spaces)), m_deeds(m_spaces.size()) {
	assert(m_spaces.size() == BOARD_SIZE);
	for (std::size_t i = 0; i != m_spaces.size(); ++i) {
		assert(m_spaces[i].index == i); // Board data must be ordered by position.
	}
}

std::size_t Board::size() const {
	return m_spaces.size();
}

const SpaceData& Board::space(SpaceIndex index) const {
	assert(index < m_spaces.size()); // Caller should verify valid index.
	return m_spaces[index];
}

const Deed& Board::deed(SpaceIndex index) const {
	assert(index < m_deeds.size()); // Caller should verify valid index.
	return m_deeds[index];
}

void Board::setOwner(SpaceIndex index, std::optional<PlayerId> owner) {
	assert(index < m_deeds.size());
	assert(isPurchasable(m_spaces[index].kind)); // Only deeds of purchasable spaces have owners.
	m_deeds[index].owner = owner;
}

void Board::setHouses(SpaceIndex index, unsigned houses) {
	assert(index < m_deeds.size());
	assert(houses <= HOTEL);
	m_deeds[index].houses = std::min(houses, HOTEL);
}

void Board::setMortgaged(SpaceIndex index, bool mortgaged) {
	assert(index < m_deeds.size());
	m_deeds[index].mortgaged = mortgaged;
}

void Board::resetDeeds() {
	std::fill(m_deeds.begin(), m_deeds.end(), Deed{});
}

std::vector<SpaceIndex> Board::spacesInGroup(ColorGroup group) const {
	std::vector<SpaceIndex> result;
	for (const auto& s: m_spaces) {
		if (s.group == group) {
			result.push_back(s.index);
		}
	}
	return result;
}

std::vector<SpaceIndex> Board::spacesOfKind(SpaceKind kind) const {
	std::vector<SpaceIndex> result;
	for (const auto& s: m_spaces) {
		if (s.kind == kind) {
			result.push_back(s.index);
		}
	}
	return result;
}

unsigned Board::countOwnedInGroup(ColorGroup group, PlayerId player) const {
	unsigned count = 0u;
	for (const auto index: spacesInGroup(group)) {
		if (m_deeds[index].owner == player) {
			++count;
		}
	}
	return count;
}

bool Board::ownsWholeGroup(ColorGroup group, PlayerId player) const {
	if (group == ColorGroup::None) {
		return false;
	}

	const auto members = spacesInGroup(group);
	return !members.empty() && std::all_of(members.begin(), members.end(), [&](SpaceIndex i) { return m_deeds[i].owner == player; });
}

bool Board::groupHasBuildings(ColorGroup group) const {
	if (group == ColorGroup::None) {
		return false;
	}

	const auto members = spacesInGroup(group);
	return std::any_of(members.begin(), members.end(), [&](SpaceIndex i) { return m_deeds[i].houses > 0u; });
}

} // namespace monopoly
