#include "core/gameState.hpp"

#include "model/classicBoard.hpp"

#include <utility>

namespace monopoly {

GameState::GameState(Board gameBoard) : board(std::move(gameBoard)) {
}

GameState newGame(std::size_t playerCount, std::mt19937_64& deckRng) {
	GameState state{classicBoard()};

	state.players.reserve(playerCount);
	for (PlayerId id = 0u; id != playerCount; ++id) {
		state.players.emplace_back(id);
		state.turnOrder.push_back(id);
	}

	state.chance         = CardDeck(chanceCards());
	state.communityChest = CardDeck(communityChestCards());
	state.chance.shuffle(deckRng);
	state.communityChest.shuffle(deckRng);

	return state;
}

std::optional<PlayerId> currentPlayer(const GameState& state) {
	if (state.turnIndex >= state.turnOrder.size()) {
		return {};
	}

	const auto id = state.turnOrder[state.turnIndex];
	if (id >= state.players.size() || state.players[id].bankrupt) {
		return {};
	}
	return id;
}

std::vector<PlayerId> solventPlayers(const GameState& state) {
	std::vector<PlayerId> result;
	for (const auto id: state.turnOrder) {
		if (id < state.players.size() && !state.players[id].bankrupt) {
			result.push_back(id);
		}
	}
	return result;
}

void record(GameState& state, GameDelta delta) {
	delta.turn = state.turn;
	state.journal.push_back(std::move(delta));
}

} // namespace monopoly
