#include "core/turnPhase.hpp"

#include <array>

namespace monopoly {

struct Transition {
	Phase from;
	Phase to;
};

// Roll -> Roll is the turn passing on without movement (speeding, jail).
static constexpr std::array<Transition, 10> TRANSITIONS{{
        {Phase::Roll, Phase::Roll},
        {Phase::Roll, Phase::Moving},
        {Phase::Moving, Phase::Roll},
        {Phase::Moving, Phase::Buying},
        {Phase::Moving, Phase::PayingRent},
        {Phase::Moving, Phase::CardPending},
        {Phase::Buying, Phase::Roll},
        {Phase::PayingRent, Phase::Roll},
        {Phase::CardPending, Phase::Roll},
        {Phase::CardPending, Phase::Moving},
}};

bool isTransitionAllowed(Phase from, Phase to) {
	for (const auto& t: TRANSITIONS) {
		if (t.from == from && t.to == to) {
			return true;
		}
	}
	return false;
}

std::string_view toString(Phase phase) {
	switch (phase) {
	case Phase::Roll:
		return "Roll";
	case Phase::Moving:
		return "Moving";
	case Phase::Buying:
		return "Buying";
	case Phase::PayingRent:
		return "PayingRent";
	case Phase::CardPending:
		return "CardPending";
	}
	return "Unknown";
}

std::optional<Phase> phaseFromString(std::string_view name) {
	for (const auto phase: {Phase::Roll, Phase::Moving, Phase::Buying, Phase::PayingRent, Phase::CardPending}) {
		if (toString(phase) == name) {
			return phase;
		}
	}
	return {};
}

} // namespace monopoly
