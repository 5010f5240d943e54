#include "core/movement.hpp"

#include "core/transactions.hpp"

#include <algorithm>
#include <cassert>

namespace monopoly {

std::vector<SpaceIndex> forwardPath(const SpaceIndex from, const unsigned steps) {
	assert(isValidSpace(from));

	std::vector<SpaceIndex> path;
	path.reserve(steps);
	for (unsigned i = 1u; i <= steps; ++i) {
		path.push_back(static_cast<SpaceIndex>((from + i) % BOARD_SIZE));
	}
	return path;
}

std::vector<SpaceIndex> backwardPath(const SpaceIndex from, const unsigned steps) {
	assert(isValidSpace(from));

	std::vector<SpaceIndex> path;
	path.reserve(steps);
	for (unsigned i = 1u; i <= steps; ++i) {
		path.push_back(static_cast<SpaceIndex>((from + BOARD_SIZE * steps - i) % BOARD_SIZE));
	}
	return path;
}

unsigned forwardDistance(const SpaceIndex from, const SpaceIndex to) {
	assert(isValidSpace(from) && isValidSpace(to));

	const auto distance = (to + BOARD_SIZE - from) % BOARD_SIZE;
	return distance == 0u ? static_cast<unsigned>(BOARD_SIZE) : static_cast<unsigned>(distance);
}

bool passesGo(const std::vector<SpaceIndex>& path) {
	return std::find(path.begin(), path.end(), GO_POSITION) != path.end();
}

std::optional<SpaceIndex> nearestAhead(const Board& board, const SpaceIndex from, const SpaceKind kind) {
	std::optional<SpaceIndex> best;
	unsigned bestDistance = 0u;

	for (const auto index: board.spacesOfKind(kind)) {
		const auto distance = forwardDistance(from, index);
		if (!best || distance < bestDistance) {
			best         = index;
			bestDistance = distance;
		}
	}
	return best;
}

void startMove(GameState& state, const PlayerId player, std::vector<SpaceIndex> path, const MoveContext context) {
	assert(player < state.players.size());
	assert(!path.empty());
	assert(std::all_of(path.begin(), path.end(), isValidSpace));

	auto& move      = state.players[player].move;
	move.path       = std::move(path);
	move.startTime  = state.clock;
	move.active     = true;
	state.moveContext = context;
}

bool moveFinished(const GameState& state, const PlayerId player, const double stepDuration) {
	assert(player < state.players.size());

	const auto& move = state.players[player].move;
	if (!move.active) {
		return false;
	}
	return state.clock - move.startTime >= stepDuration * static_cast<double>(move.path.size());
}

void finishMove(GameState& state, const PlayerId player) {
	assert(player < state.players.size());

	auto& account = state.players[player];
	auto& move    = account.move;
	if (!move.active || move.path.empty()) {
		return;
	}

	account.position = move.path.back();
	if (state.moveContext.forward && state.moveContext.collectGo && passesGo(move.path)) {
		credit(state, player, GO_INCOME);
		state.moveContext.goCredited = true;
		record(state, {.action = GameAction::PassGo, .player = player, .space = GO_POSITION, .amount = GO_INCOME});
	}

	record(state, {.action = GameAction::Move, .player = player, .space = account.position});
	move = {};
}

void sendToJail(GameState& state, const PlayerId player) {
	assert(player < state.players.size());

	auto& account              = state.players[player];
	account.position           = JAIL_POSITION;
	account.inJail             = true;
	account.jailTurns          = 0u;
	account.consecutiveDoubles = 0u;
	account.move               = {};

	record(state, {.action = GameAction::Jail, .player = player, .space = JAIL_POSITION});
}

} // namespace monopoly
