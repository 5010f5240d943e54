#pragma once

#include "core/gameState.hpp"
#include "model/card.hpp"

#include <optional>

namespace monopoly {

//! Effect of a card that the turn state machine still has to carry out.
struct CardOutcome {
	std::optional<PendingMove> move; //!< Move to start once the card is acknowledged.
	bool bankrupt{false};            //!< Drawing player went bankrupt paying the card.
};

//! Apply the money and jail effects of a card to the drawing player.
//! Moves are not started but returned so the card can be shown first.
CardOutcome executeCard(GameState& state, PlayerId player, const Card& card);

} // namespace monopoly
