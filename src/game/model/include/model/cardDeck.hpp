#pragma once

#include "model/card.hpp"

#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace monopoly {

//! Cyclic draw pile. A drawn card goes back to the bottom so the deck never runs out.
class CardDeck {
public:
	CardDeck() = default;
	explicit CardDeck(std::vector<Card> cards);

	//! Shuffle once at game start.
	void shuffle(std::mt19937_64& rng);

	//! Take the top card and put it back at the bottom.
	//! \note Returns empty only for a deck that was built without cards.
	std::optional<Card> draw();

	std::size_t size() const;
	bool empty() const;

	//! Card ids from top to bottom.
	std::vector<std::string> order() const;

	//! Reorder the deck to match the given ids from top to bottom.
	//! \return False and leaves the deck unchanged if the ids are not a permutation of the deck.
	bool restoreOrder(const std::vector<std::string>& ids);

private:
	std::deque<Card> m_cards; //!< Front is the top of the deck.
};

} // namespace monopoly
