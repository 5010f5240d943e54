#include "model/cardDeck.hpp"

#include <algorithm>

namespace monopoly {

CardDeck::CardDeck(std::vector<Card> cards) : m_cards(std::make_move_iterator(cards.begin()), std::make_move_iterator(cards.end())) {
}

void CardDeck::shuffle(std::mt19937_64& rng) {
	std::shuffle(m_cards.begin(), m_cards.end(), rng);
}

std::optional<Card> CardDeck::draw() {
	if (m_cards.empty()) {
		return {};
	}

	Card card = m_cards.front();
	m_cards.pop_front();
	m_cards.push_back(card);
	return card;
}

std::size_t CardDeck::size() const {
	return m_cards.size();
}

bool CardDeck::empty() const {
	return m_cards.empty();
}

std::vector<std::string> CardDeck::order() const {
	std::vector<std::string> ids;
	ids.reserve(m_cards.size());
	for (const auto& card: m_cards) {
		ids.push_back(card.id);
	}
	return ids;
}

bool CardDeck::restoreOrder(const std::vector<std::string>& ids) {
	if (ids.size() != m_cards.size()) {
		return false;
	}

	std::deque<Card> remaining = m_cards;
	std::deque<Card> reordered;
	for (const auto& id: ids) {
		const auto it = std::find_if(remaining.begin(), remaining.end(), [&](const Card& c) { return c.id == id; });
		if (it == remaining.end()) {
			return false;
		}
		reordered.push_back(*it);
		remaining.erase(it);
	}

	m_cards = std::move(reordered);
	return true;
}

} // namespace monopoly
