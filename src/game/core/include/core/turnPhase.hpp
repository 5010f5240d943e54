#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace monopoly {

//! Phase of the current turn.
enum class Phase : std::uint8_t {
	Roll,        //!< Current player may roll, open the property view or settle jail.
	Moving,      //!< Token animating. No input accepted.
	Buying,      //!< Waiting for the buy/decline choice.
	PayingRent,  //!< Rent paid, waiting for acknowledgment.
	CardPending, //!< Card shown, waiting for acknowledgment.
};

//! Returns true if the state machine may go from one phase to the other.
bool isTransitionAllowed(Phase from, Phase to);

std::string_view toString(Phase phase);
std::optional<Phase> phaseFromString(std::string_view name);

} // namespace monopoly
