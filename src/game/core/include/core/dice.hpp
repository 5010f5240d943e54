#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace monopoly {

//! Result of throwing two dice.
struct DiceRoll {
	unsigned first{0u};
	unsigned second{0u};

public:
	unsigned sum() const {
		return first + second;
	}
	bool isDoubles() const {
		return first != 0u && first == second;
	}
};

//! Source of dice throws. Allows the game to run on scripted dice in tests.
class IDice {
public:
	virtual ~IDice()          = default;
	virtual DiceRoll roll()   = 0; //!< Two independent faces in [1, 6].
};

//! Uniformly distributed dice.
class RandomDice : public IDice {
public:
	//! Seeded dice replay the same sequence. Without a seed the engine is seeded from the system.
	explicit RandomDice(std::optional<std::uint64_t> seed = std::nullopt);

	DiceRoll roll() override;

private:
	std::mt19937_64 m_rng;
	std::uniform_int_distribution<unsigned> m_face{1u, 6u};
};

} // namespace monopoly
