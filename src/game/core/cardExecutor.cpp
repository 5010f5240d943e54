#include "core/cardExecutor.hpp"

#include "core/movement.hpp"
#include "core/transactions.hpp"

#include <algorithm>
#include <cassert>
#include <cstdlib>

namespace monopoly {

namespace {

//! Visitor applying one card action. Members are filled in by the caller.
struct CardVisitor {
	GameState& state;
	PlayerId player;
	CardOutcome outcome{};

	void payment(const PlayerId from, const std::optional<PlayerId> to, const Money amount) {
		record(state, {.action = GameAction::Payment, .player = from, .amount = amount, .counterparty = to});
	}

	void operator()(const MoneyAction& action) {
		if (action.amount >= 0) {
			credit(state, player, action.amount);
			record(state, {.action = GameAction::Payment, .player = player, .amount = action.amount});
		} else if (debit(state, player, -action.amount)) {
			payment(player, std::nullopt, -action.amount);
		} else {
			outcome.bankrupt = true;
		}
	}

	void operator()(const JailFreeAction&) {
		++state.players[player].jailFreeCards;
	}

	void operator()(const GoToJailAction&) {
		sendToJail(state, player);
	}

	void operator()(const AdvanceAction& action) {
		assert(isValidSpace(action.target));

		const auto from = state.players[player].position;
		outcome.move    = PendingMove{
		        .path    = forwardPath(from, forwardDistance(from, action.target)),
		        .context = {.forward = true, .collectGo = action.collectGo, .fromCard = true},
		};
	}

	void operator()(const AdvanceRelativeAction& action) {
		if (action.offset == 0) {
			return;
		}

		const auto from  = state.players[player].position;
		const auto steps = static_cast<unsigned>(std::abs(action.offset));
		if (action.offset > 0) {
			outcome.move = PendingMove{.path = forwardPath(from, steps), .context = {.forward = true, .collectGo = true, .fromCard = true}};
		} else {
			outcome.move = PendingMove{.path = backwardPath(from, steps), .context = {.forward = false, .collectGo = false, .fromCard = true}};
		}
	}

	void operator()(const AdvanceNearestAction& action) {
		const auto from   = state.players[player].position;
		const auto target = nearestAhead(state.board, from, action.kind);
		if (!target) {
			return;
		}

		outcome.move = PendingMove{
		        .path    = forwardPath(from, forwardDistance(from, *target)),
		        .context = {.forward = true, .collectGo = true, .fromCard = true, .rentMultiplier = action.rentMultiplier},
		};
	}

	void operator()(const CollectFromEachAction& action) {
		for (const auto other: solventPlayers(state)) {
			if (other == player) {
				continue;
			}

			const auto amount = std::min(action.amount, state.players[other].cash);
			if (amount > 0 && debit(state, other, amount, player)) {
				payment(other, player, amount);
			}
		}
	}

	void operator()(const PayEachPlayerAction& action) {
		for (const auto other: solventPlayers(state)) {
			if (other == player) {
				continue;
			}

			const auto amount = std::min(action.amount, state.players[player].cash);
			if (amount > 0 && debit(state, player, amount, other)) {
				payment(player, other, amount);
			}
		}
	}

	void operator()(const RepairsAction& action) {
		Money total = 0;
		for (const auto index: state.players[player].properties) {
			const auto houses = state.board.deed(index).houses;
			total += houses == HOTEL ? action.perHotel : static_cast<Money>(houses) * action.perHouse;
		}

		if (total == 0) {
			return;
		}
		if (debit(state, player, total)) {
			payment(player, std::nullopt, total);
		} else {
			outcome.bankrupt = true;
		}
	}
};

} // namespace

CardOutcome executeCard(GameState& state, const PlayerId player, const Card& card) {
	assert(player < state.players.size());

	CardVisitor visitor{state, player};
	std::visit(visitor, card.action);
	return visitor.outcome;
}

} // namespace monopoly
