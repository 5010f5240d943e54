#pragma once

#include "core/gameState.hpp"

namespace monopoly {

//! What the turn state machine has to do after a token came to rest.
enum class LandingResult : std::uint8_t {
	EndTurn,       //!< Nothing left to decide.
	AwaitPurchase, //!< Buy popup shown.
	AwaitRent,     //!< Rent paid, rent popup shown.
	AwaitCard,     //!< Card executed, card popup shown. A card move may be pending.
	Jailed,        //!< Player was sent to jail. The turn ends without a doubles bonus.
	Bankrupt,      //!< Player went bankrupt. The turn ends at once.
};

//! Execute the effect of the space the player is standing on.
//! Uses the move context of the move that just finished and the dice sum of the last throw.
LandingResult resolveLanding(GameState& state, PlayerId player);

} // namespace monopoly
