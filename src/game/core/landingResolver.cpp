#include "core/landingResolver.hpp"

#include "Logging.hpp"
#include "core/cardExecutor.hpp"
#include "core/movement.hpp"
#include "core/rent.hpp"
#include "core/transactions.hpp"

#include <cassert>
#include <format>

namespace monopoly {

static LandingResult landOnGo(GameState& state, const PlayerId player) {
	if (!state.moveContext.goCredited) {
		credit(state, player, GO_INCOME);
		state.moveContext.goCredited = true;
		record(state, {.action = GameAction::PassGo, .player = player, .space = GO_POSITION, .amount = GO_INCOME});
	}
	return LandingResult::EndTurn;
}

static LandingResult landOnDeed(GameState& state, const PlayerId player, const SpaceIndex index) {
	const auto& space = state.board.space(index);
	const auto& deed  = state.board.deed(index);

	if (!deed.owner) {
		state.popup = Popup{.kind = PopupKind::Buy, .player = player, .space = index, .amount = space.price};
		return LandingResult::AwaitPurchase;
	}

	const auto owner = *deed.owner;
	if (owner == player) {
		return LandingResult::EndTurn;
	}

	const auto diceSum = state.moveContext.fromCard ? std::optional<unsigned>{} : state.diceSum;
	const auto rent    = computeRent(state.board, index, diceSum) * static_cast<Money>(state.moveContext.rentMultiplier);
	if (rent == 0) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Landing] No rent due on {}.", space.name));
		return LandingResult::EndTurn;
	}

	if (!debit(state, player, rent, owner)) {
		return LandingResult::Bankrupt;
	}

	record(state, {.action = GameAction::Rent, .player = player, .space = index, .amount = rent, .counterparty = owner});
	state.popup = Popup{.kind = PopupKind::Rent, .player = player, .space = index, .amount = rent, .counterparty = owner};
	return LandingResult::AwaitRent;
}

static LandingResult landOnCard(GameState& state, const PlayerId player, const SpaceIndex index, const DeckKind deckKind) {
	auto& deck = deckKind == DeckKind::Chance ? state.chance : state.communityChest;

	const auto card = deck.draw();
	if (!card) {
		Logger().Log(Logging::LogLevel::Error, "[Landing] Drew from an empty deck.");
		assert(false);
		return LandingResult::EndTurn;
	}

	record(state, {.action = GameAction::Card, .player = player, .space = index, .detail = card->id});
	auto outcome = executeCard(state, player, *card);
	if (outcome.bankrupt) {
		return LandingResult::Bankrupt;
	}

	state.pendingMove = std::move(outcome.move);
	state.popup       = Popup{
	        .kind   = PopupKind::Card,
	        .player = player,
	        .space  = index,
	        .deck   = deckKind,
	        .cardId = card->id,
	        .text   = card->text,
	};
	return LandingResult::AwaitCard;
}

static LandingResult payTax(GameState& state, const PlayerId player, const SpaceIndex index, const Money amount) {
	if (!debit(state, player, amount)) {
		return LandingResult::Bankrupt;
	}

	record(state, {.action = GameAction::Tax, .player = player, .space = index, .amount = amount});
	return LandingResult::EndTurn;
}

LandingResult resolveLanding(GameState& state, const PlayerId player) {
	assert(player < state.players.size());

	const auto index = state.players[player].position;
	if (!isValidSpace(index)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Landing] Player {} stands on invalid space {}.", player, index));
		assert(false);
		return LandingResult::EndTurn;
	}

	const auto& space = state.board.space(index);
	switch (space.kind) {
	case SpaceKind::Go:
		return landOnGo(state, player);
	case SpaceKind::Property:
	case SpaceKind::Railroad:
	case SpaceKind::Utility:
		return landOnDeed(state, player, index);
	case SpaceKind::GoToJail:
		sendToJail(state, player);
		return LandingResult::Jailed;
	case SpaceKind::Chance:
		return landOnCard(state, player, index, DeckKind::Chance);
	case SpaceKind::CommunityChest:
		return landOnCard(state, player, index, DeckKind::CommunityChest);
	case SpaceKind::IncomeTax:
	case SpaceKind::LuxuryTax:
		return payTax(state, player, index, taxAmount(space.kind));
	case SpaceKind::Jail:
	case SpaceKind::FreeParking:
	case SpaceKind::None:
		return LandingResult::EndTurn;
	}
	return LandingResult::EndTurn;
}

} // namespace monopoly
