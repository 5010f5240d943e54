#include "core/transactions.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cassert>
#include <format>

namespace monopoly {

void credit(GameState& state, const PlayerId player, const Money amount) {
	assert(player < state.players.size());
	assert(amount >= 0);

	state.players[player].cash += amount;
}

bool debit(GameState& state, const PlayerId payer, const Money amount, const std::optional<PlayerId> creditor) {
	assert(payer < state.players.size());
	assert(!creditor || *creditor < state.players.size());

	if (amount <= 0) {
		return true;
	}

	auto& account = state.players[payer];
	if (account.cash < amount) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Transactions] Player {} cannot pay {} (has {}).", payer, amount, account.cash));
		declareBankruptcy(state, payer, creditor);
		return false;
	}

	account.cash -= amount;
	if (creditor) {
		credit(state, *creditor, amount);
	}
	return true;
}

void declareBankruptcy(GameState& state, const PlayerId debtor, std::optional<PlayerId> creditor) {
	assert(debtor < state.players.size());

	auto& account = state.players[debtor];
	if (account.bankrupt) {
		return;
	}

	// Deeds may only be held by solvent players.
	if (creditor && (*creditor == debtor || state.players[*creditor].bankrupt)) {
		creditor.reset();
	}

	for (const auto index: account.properties) {
		if (creditor) {
			state.board.setOwner(index, *creditor);
			state.players[*creditor].addProperty(index);
		} else {
			state.board.setOwner(index, std::nullopt);
			state.board.setHouses(index, 0u);
			state.board.setMortgaged(index, false);
		}
	}

	account.properties.clear();
	account.bankrupt           = true;
	account.inJail             = false;
	account.jailTurns          = 0u;
	account.consecutiveDoubles = 0u;
	account.move               = {};

	record(state, {.action = GameAction::Bankruptcy, .player = debtor, .counterparty = creditor});
	Logger().Log(Logging::LogLevel::Info,
	             creditor ? std::format("[Transactions] Player {} is bankrupt to player {}.", debtor, *creditor)
	                      : std::format("[Transactions] Player {} is bankrupt to the bank.", debtor));
}

bool buyProperty(GameState& state, const PlayerId buyer, const SpaceIndex index) {
	assert(buyer < state.players.size());
	assert(isValidSpace(index));

	const auto& space = state.board.space(index);
	if (!isPurchasable(space.kind) || state.board.deed(index).owner) {
		return false;
	}

	auto& account = state.players[buyer];
	if (account.bankrupt || account.cash < space.price) {
		return false;
	}

	account.cash -= space.price;
	account.addProperty(index);
	state.board.setOwner(index, buyer);
	return true;
}

Money unmortgageCost(const Board& board, const SpaceIndex index) {
	return board.space(index).mortgageValue * 11 / 10;
}

bool mortgageProperty(GameState& state, const PlayerId player, const SpaceIndex index) {
	assert(player < state.players.size());

	const auto& deed = state.board.deed(index);
	if (deed.owner != player || deed.mortgaged) {
		return false;
	}

	const auto& space = state.board.space(index);
	if (state.board.groupHasBuildings(space.group)) {
		return false;
	}

	state.board.setMortgaged(index, true);
	credit(state, player, space.mortgageValue);
	return true;
}

bool unmortgageProperty(GameState& state, const PlayerId player, const SpaceIndex index) {
	assert(player < state.players.size());

	const auto& deed = state.board.deed(index);
	if (deed.owner != player || !deed.mortgaged) {
		return false;
	}

	const auto cost = unmortgageCost(state.board, index);
	auto& account   = state.players[player];
	if (account.cash < cost) {
		return false;
	}

	account.cash -= cost;
	state.board.setMortgaged(index, false);
	return true;
}

bool isTradable(const GameState& state, const PlayerId owner, const SpaceIndex index) {
	if (!isValidSpace(index) || !isPurchasable(state.board.space(index).kind)) {
		return false;
	}

	const auto& deed = state.board.deed(index);
	return deed.owner == owner && !deed.mortgaged && !state.board.groupHasBuildings(state.board.space(index).group);
}

static bool canGive(const GameState& state, const PlayerId giver, const Money money, const std::vector<SpaceIndex>& deeds) {
	if (money < 0 || state.players[giver].cash < money) {
		return false;
	}
	return std::all_of(deeds.begin(), deeds.end(), [&](SpaceIndex index) { return isTradable(state, giver, index); });
}

static void transferDeeds(GameState& state, const PlayerId from, const PlayerId to, const std::vector<SpaceIndex>& deeds) {
	for (const auto index: deeds) {
		state.players[from].removeProperty(index);
		state.players[to].addProperty(index);
		state.board.setOwner(index, to);
	}
}

bool executeTrade(GameState& state, const TradeOffer& offer) {
	assert(offer.initiator < state.players.size());
	assert(offer.partner < state.players.size());

	const auto& initiator = state.players[offer.initiator];
	const auto& partner   = state.players[offer.partner];
	if (offer.initiator == offer.partner || initiator.bankrupt || partner.bankrupt) {
		return false;
	}
	if (!canGive(state, offer.initiator, offer.offerMoney, offer.offerDeeds) || !canGive(state, offer.partner, offer.requestMoney, offer.requestDeeds)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Transactions] Trade between players {} and {} is no longer valid.", offer.initiator, offer.partner));
		return false;
	}

	state.players[offer.initiator].cash += offer.requestMoney - offer.offerMoney;
	state.players[offer.partner].cash += offer.offerMoney - offer.requestMoney;
	transferDeeds(state, offer.initiator, offer.partner, offer.offerDeeds);
	transferDeeds(state, offer.partner, offer.initiator, offer.requestDeeds);
	return true;
}

} // namespace monopoly
