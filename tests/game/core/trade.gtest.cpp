#include "core/game.hpp"
#include "core/transactions.hpp"
#include "testHelpers.hpp"

#include <gtest/gtest.h>

namespace monopoly::gtest {

static void send(Game& game, GameEvent event) {
	game.pushEvent(event);
	game.tick(0.0);
}

static GameState tradeState() {
	auto state = makeState(3u);
	giveDeed(state, 0u, 1u);
	giveDeed(state, 0u, 3u);
	giveDeed(state, 1u, 39u);
	return state;
}

TEST(Trade, AcceptSwapsCashAndDeeds) {
	Game game(tradeState(), GameConfig{}, scriptedDice({}));
	RecordingListener listener;
	game.subscribeState(&listener);
	game.subscribeSignals(&listener, GS_BoardChange | GS_PopupChange);

	send(game, ProposeTradeEvent{0u, 1u});
	ASSERT_TRUE(game.state().trade.has_value());
	ASSERT_TRUE(game.state().popup.has_value());
	EXPECT_EQ(game.state().popup->kind, PopupKind::Trade);
	EXPECT_EQ(game.state().popup->player, 0u);
	EXPECT_EQ(game.state().popup->counterparty, 1u);

	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Offer, 300});
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 1u, true});
	send(game, SetTradePropertyEvent{0u, TradeSide::Request, 39u, true});
	EXPECT_EQ(game.state().trade->offerMoney, 300);
	EXPECT_EQ(game.state().trade->offerDeeds, std::vector<SpaceIndex>{1u});
	EXPECT_EQ(game.state().trade->requestDeeds, std::vector<SpaceIndex>{39u});

	// Sending hands the popup to the partner. The phase never leaves Roll.
	send(game, AcknowledgeEvent{0u, 1u});
	EXPECT_EQ(game.state().trade->stage, TradeStage::AwaitingResponse);
	EXPECT_EQ(game.state().popup->player, 1u);
	EXPECT_EQ(game.phase(), Phase::Roll);

	send(game, AcknowledgeEvent{1u, 2u});
	EXPECT_FALSE(game.state().trade.has_value());
	EXPECT_FALSE(game.state().popup.has_value());

	const auto& state = game.state();
	EXPECT_EQ(state.board.deed(1u).owner, 1u);
	EXPECT_EQ(state.board.deed(39u).owner, 0u);
	EXPECT_EQ(state.board.deed(3u).owner, 0u);
	EXPECT_EQ(state.players[0].properties, (std::vector<SpaceIndex>{3u, 39u}));
	EXPECT_EQ(state.players[1].properties, std::vector<SpaceIndex>{1u});
	EXPECT_EQ(state.players[0].cash, STARTING_MONEY - 300);
	EXPECT_EQ(state.players[1].cash, STARTING_MONEY + 300);

	const auto trades = listener.deltasOf(GameAction::Trade);
	ASSERT_EQ(trades.size(), 1u);
	EXPECT_EQ(trades.front().player, 0u);
	EXPECT_EQ(trades.front().counterparty, 1u);
	EXPECT_EQ(trades.front().amount, 300);
	EXPECT_TRUE(listener.received(GS_BoardChange));
	EXPECT_TRUE(listener.received(GS_PopupChange));

	// The initiator keeps the turn.
	EXPECT_EQ(game.currentPlayer(), 0u);
	EXPECT_EQ(game.phase(), Phase::Roll);
}

TEST(Trade, PartnerDeclines) {
	Game game(tradeState(), GameConfig{}, scriptedDice({}));
	RecordingListener listener;
	game.subscribeState(&listener);

	send(game, ProposeTradeEvent{0u, 1u});
	send(game, SetTradePropertyEvent{0u, TradeSide::Request, 39u, true});
	send(game, AcknowledgeEvent{0u, 1u});
	send(game, AcknowledgeEvent{1u, 0u});

	EXPECT_FALSE(game.state().trade.has_value());
	EXPECT_FALSE(game.state().popup.has_value());
	EXPECT_EQ(game.state().board.deed(39u).owner, 1u);
	EXPECT_TRUE(listener.deltasOf(GameAction::Trade).empty());
	EXPECT_EQ(listener.deltasOf(GameAction::TradeDeclined).size(), 1u);
}

TEST(Trade, InitiatorCancels) {
	Game game(tradeState(), GameConfig{}, scriptedDice({{1u, 2u}}));

	send(game, ProposeTradeEvent{0u, 2u});
	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Offer, 100});
	send(game, AcknowledgeEvent{0u, 0u});
	EXPECT_FALSE(game.state().trade.has_value());
	EXPECT_FALSE(game.state().popup.has_value());
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY);

	send(game, RollEvent{0u});
	EXPECT_EQ(game.phase(), Phase::Moving);
}

TEST(Trade, MoneyIsClampedToCash) {
	auto state            = tradeState();
	state.players[1].cash = 120;
	Game game(std::move(state), GameConfig{}, scriptedDice({}));

	send(game, ProposeTradeEvent{0u, 1u});
	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Offer, 5000});
	EXPECT_EQ(game.state().trade->offerMoney, STARTING_MONEY);
	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Offer, -9999});
	EXPECT_EQ(game.state().trade->offerMoney, 0);

	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Request, 100});
	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Request, 100});
	EXPECT_EQ(game.state().trade->requestMoney, 120);
}

TEST(Trade, OnlyTradableDeedsJoinTheOffer) {
	auto state = tradeState();
	giveDeed(state, 0u, 5u);
	giveDeed(state, 1u, 37u);
	state.board.setMortgaged(5u, true);
	state.board.setHouses(37u, 1u);
	Game game(std::move(state), GameConfig{}, scriptedDice({}));

	send(game, ProposeTradeEvent{0u, 1u});
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 5u, true});   // Mortgaged.
	send(game, SetTradePropertyEvent{0u, TradeSide::Request, 39u, true}); // Park Place in the same group has a house.
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 39u, true});   // Not the initiator's.
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 12u, true});   // Unowned.
	EXPECT_TRUE(game.state().trade->offerDeeds.empty());
	EXPECT_TRUE(game.state().trade->requestDeeds.empty());

	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 1u, true});
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 1u, true});
	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 3u, true});
	EXPECT_EQ(game.state().trade->offerDeeds, (std::vector<SpaceIndex>{1u, 3u}));

	send(game, SetTradePropertyEvent{0u, TradeSide::Offer, 1u, false});
	EXPECT_EQ(game.state().trade->offerDeeds, std::vector<SpaceIndex>{3u});
}

TEST(Trade, OnlyCurrentPlayerProposes) {
	auto state                = tradeState();
	state.players[2].bankrupt = true;
	Game game(std::move(state), GameConfig{}, scriptedDice({}));

	send(game, ProposeTradeEvent{1u, 0u});
	send(game, ProposeTradeEvent{0u, 0u});
	send(game, ProposeTradeEvent{0u, 2u});
	send(game, ProposeTradeEvent{0u, 7u});
	EXPECT_FALSE(game.state().trade.has_value());
	EXPECT_FALSE(game.state().popup.has_value());
}

TEST(Trade, OpenTradeBlocksOtherInput) {
	Game game(tradeState(), GameConfig{}, scriptedDice({{1u, 2u}}));

	send(game, ProposeTradeEvent{0u, 1u});
	send(game, RollEvent{0u});
	send(game, OpenPropertiesEvent{0u});
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.state().popup->kind, PopupKind::Trade);

	// The partner cannot edit or answer before the offer is sent.
	send(game, AdjustTradeMoneyEvent{1u, TradeSide::Request, 100});
	send(game, AcknowledgeEvent{1u, 2u});
	EXPECT_EQ(game.state().trade->requestMoney, 0);
	EXPECT_EQ(game.state().trade->stage, TradeStage::Editing);

	// Once sent the offer is fixed.
	send(game, AcknowledgeEvent{0u, 1u});
	send(game, AdjustTradeMoneyEvent{0u, TradeSide::Offer, 100});
	send(game, AcknowledgeEvent{0u, 0u});
	EXPECT_EQ(game.state().trade->offerMoney, 0);
	EXPECT_EQ(game.state().popup->player, 1u);
}

TEST(Trade, ExecuteRejectsStaleOffer) {
	auto state = tradeState();
	const TradeOffer offer{.initiator = 0u, .partner = 1u, .offerMoney = 100, .offerDeeds = {1u}, .requestDeeds = {39u}};

	state.board.setMortgaged(39u, true);
	EXPECT_FALSE(executeTrade(state, offer));
	EXPECT_EQ(state.board.deed(1u).owner, 0u);
	EXPECT_EQ(state.players[0].cash, STARTING_MONEY);

	state.board.setMortgaged(39u, false);
	state.players[0].cash = 50;
	EXPECT_FALSE(executeTrade(state, offer));
	EXPECT_EQ(state.board.deed(39u).owner, 1u);

	state.players[0].cash = 100;
	EXPECT_TRUE(executeTrade(state, offer));
	EXPECT_EQ(state.players[0].cash, 0);
	EXPECT_EQ(state.players[1].cash, STARTING_MONEY + 100);
	EXPECT_TRUE(state.players[1].owns(1u));
	EXPECT_FALSE(state.players[1].owns(39u));
}

} // namespace monopoly::gtest
