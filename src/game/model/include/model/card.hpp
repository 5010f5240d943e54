#pragma once

#include "model/types.hpp"

#include <string>
#include <variant>

namespace monopoly {

enum class DeckKind : std::uint8_t { Chance, CommunityChest };

// Card actions. Positive amounts are paid to the drawing player.
struct MoneyAction {
	Money amount; //!< Negative amounts are paid to the bank.
};
struct JailFreeAction {};
struct GoToJailAction {};
struct AdvanceAction {
	SpaceIndex target;
	bool collectGo; //!< Credit Go income when the advance wraps past Go.
};
struct AdvanceRelativeAction {
	int offset; //!< Negative values move backwards.
};
struct AdvanceNearestAction {
	SpaceKind kind;              //!< Railroad or Utility.
	unsigned rentMultiplier{1u}; //!< Applied to the rent owed on arrival.
};
struct CollectFromEachAction {
	Money amount;
};
struct PayEachPlayerAction {
	Money amount;
};
struct RepairsAction {
	Money perHouse;
	Money perHotel;
};

using CardAction = std::variant<MoneyAction, JailFreeAction, GoToJailAction, AdvanceAction, AdvanceRelativeAction, AdvanceNearestAction,
                                CollectFromEachAction, PayEachPlayerAction, RepairsAction>;

struct Card {
	std::string id;   //!< Stable identifier. Used to persist deck order.
	std::string text; //!< Text shown to the players.
	CardAction action;
};

} // namespace monopoly
