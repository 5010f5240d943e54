#include "core/dice.hpp"
#include "core/turnPhase.hpp"

#include <gtest/gtest.h>

namespace monopoly::gtest {

TEST(TurnPhase, TransitionTable) {
	EXPECT_TRUE(isTransitionAllowed(Phase::Roll, Phase::Moving));
	EXPECT_TRUE(isTransitionAllowed(Phase::Roll, Phase::Roll));
	EXPECT_TRUE(isTransitionAllowed(Phase::Moving, Phase::Buying));
	EXPECT_TRUE(isTransitionAllowed(Phase::Moving, Phase::PayingRent));
	EXPECT_TRUE(isTransitionAllowed(Phase::Moving, Phase::CardPending));
	EXPECT_TRUE(isTransitionAllowed(Phase::Moving, Phase::Roll));
	EXPECT_TRUE(isTransitionAllowed(Phase::CardPending, Phase::Moving));
	EXPECT_TRUE(isTransitionAllowed(Phase::Buying, Phase::Roll));
	EXPECT_TRUE(isTransitionAllowed(Phase::PayingRent, Phase::Roll));

	EXPECT_FALSE(isTransitionAllowed(Phase::Roll, Phase::Buying));
	EXPECT_FALSE(isTransitionAllowed(Phase::Buying, Phase::Moving));
	EXPECT_FALSE(isTransitionAllowed(Phase::PayingRent, Phase::CardPending));
	EXPECT_FALSE(isTransitionAllowed(Phase::Moving, Phase::Moving));
	EXPECT_FALSE(isTransitionAllowed(Phase::Buying, Phase::Buying));
}

TEST(TurnPhase, Names) {
	for (const auto phase: {Phase::Roll, Phase::Moving, Phase::Buying, Phase::PayingRent, Phase::CardPending}) {
		EXPECT_EQ(phaseFromString(toString(phase)), phase);
	}
	EXPECT_FALSE(phaseFromString("GameOver").has_value());
}

TEST(Dice, DoublesDetection) {
	for (unsigned a = 1u; a <= 6u; ++a) {
		for (unsigned b = 1u; b <= 6u; ++b) {
			const DiceRoll roll{a, b};
			EXPECT_EQ(roll.isDoubles(), a == b);
			EXPECT_EQ(roll.sum(), a + b);
		}
	}
	EXPECT_FALSE(DiceRoll{}.isDoubles());
}

TEST(Dice, RandomFacesInRange) {
	RandomDice dice{123u};
	for (int i = 0; i != 200; ++i) {
		const auto roll = dice.roll();
		EXPECT_GE(roll.first, 1u);
		EXPECT_LE(roll.first, 6u);
		EXPECT_GE(roll.second, 1u);
		EXPECT_LE(roll.second, 6u);
	}
}

} // namespace monopoly::gtest
