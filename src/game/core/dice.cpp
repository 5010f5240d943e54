#include "core/dice.hpp"

namespace monopoly {

static std::uint64_t systemSeed() {
	std::random_device device;
	return (static_cast<std::uint64_t>(device()) << 32u) ^ device();
}

RandomDice::RandomDice(std::optional<std::uint64_t> seed) : m_rng(seed ? *seed : systemSeed()) {
}

DiceRoll RandomDice::roll() {
	const auto first  = m_face(m_rng);
	const auto second = m_face(m_rng);
	return {first, second};
}

} // namespace monopoly
