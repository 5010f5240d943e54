#include "core/game.hpp"
#include "testHelpers.hpp"

#include <gtest/gtest.h>

namespace monopoly::gtest {

static void roll(Game& game, PlayerId player) {
	game.pushEvent(RollEvent{player});
	game.tick(SETTLE);
}

static void acknowledge(Game& game, PlayerId player, unsigned choice = 0u) {
	game.pushEvent(AcknowledgeEvent{player, choice});
	game.tick(0.0);
}

// Player 0 at Go rolls 3 and 4 onto an unowned $150 lot and buys it.
TEST(Game, RollMoveAndPurchase) {
	const SpaceData lot{
	        .index         = 7u,
	        .kind          = SpaceKind::Property,
	        .name          = "Test Lot",
	        .price         = 150,
	        .rent          = {10, 50, 150, 450, 625, 750},
	        .houseCost     = 100,
	        .mortgageValue = 75,
	        .group         = ColorGroup::Pink,
	};
	auto state  = makeState(2u);
	state.board = boardWith(lot);

	Game game(std::move(state), GameConfig{}, scriptedDice({{3u, 4u}}));
	ASSERT_EQ(game.currentPlayer(), 0u);

	game.pushEvent(RollEvent{0u});
	game.tick(0.0);
	EXPECT_EQ(game.phase(), Phase::Moving);
	EXPECT_EQ(game.state().dice.sum(), 7u);
	EXPECT_EQ(game.state().players[0].position, GO_POSITION);
	EXPECT_EQ(game.state().players[0].move.path.size(), 7u);

	game.tick(1.0);
	EXPECT_EQ(game.phase(), Phase::Moving);

	game.tick(1.5);
	EXPECT_EQ(game.phase(), Phase::Buying);
	EXPECT_EQ(game.state().players[0].position, 7u);
	ASSERT_TRUE(game.state().popup.has_value());
	EXPECT_EQ(game.state().popup->amount, 150);

	acknowledge(game, 0u, 0u);
	EXPECT_EQ(game.state().board.deed(7u).owner, 0u);
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY - 150);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_FALSE(game.state().popup.has_value());
}

TEST(Game, DeclinePurchase) {
	Game game(makeState(2u), GameConfig{}, scriptedDice({{1u, 2u}}));

	roll(game, 0u);
	ASSERT_EQ(game.phase(), Phase::Buying);
	EXPECT_EQ(game.state().players[0].position, 3u);

	acknowledge(game, 0u, 1u);
	EXPECT_FALSE(game.state().board.deed(3u).owner.has_value());
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY);
	EXPECT_EQ(game.currentPlayer(), 1u);
}

TEST(Game, InputOfOtherPlayersIsIgnored) {
	Game game(makeState(2u), GameConfig{}, scriptedDice({{1u, 2u}}));

	roll(game, 1u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.state().players[1].position, GO_POSITION);

	roll(game, 0u);
	ASSERT_EQ(game.phase(), Phase::Buying);

	// Wrong player, then a roll in the wrong phase.
	acknowledge(game, 1u, 0u);
	roll(game, 0u);
	EXPECT_EQ(game.phase(), Phase::Buying);
	EXPECT_EQ(game.state().players[0].position, 3u);
	EXPECT_FALSE(game.state().board.deed(3u).owner.has_value());
}

// Owner of the whole brown group charges twice the base rent.
TEST(Game, MonopolyRent) {
	auto state = makeState(2u);
	giveDeed(state, 1u, 1u);
	giveDeed(state, 1u, 3u);

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}}));
	roll(game, 0u);

	ASSERT_EQ(game.phase(), Phase::PayingRent);
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY - 8);
	EXPECT_EQ(game.state().players[1].cash, STARTING_MONEY + 8);
	ASSERT_TRUE(game.state().popup.has_value());
	EXPECT_EQ(game.state().popup->kind, PopupKind::Rent);

	acknowledge(game, 0u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.currentPlayer(), 1u);
}

// A player with $10 landing on income tax goes bankrupt and is skipped from then on.
TEST(Game, TaxBankruptcyIsSkipped) {
	auto state = makeState(3u);
	giveDeed(state, 0u, 39u);
	state.board.setHouses(39u, 2u);
	state.players[0].cash = 10;

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 3u}, {1u, 2u}, {1u, 2u}}));
	roll(game, 0u);

	EXPECT_TRUE(game.state().players[0].bankrupt);
	EXPECT_FALSE(game.state().board.deed(39u).owner.has_value());
	EXPECT_EQ(game.state().board.deed(39u).houses, 0u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.currentPlayer(), 1u);

	roll(game, 1u);
	acknowledge(game, 1u, 1u);
	EXPECT_EQ(game.currentPlayer(), 2u);

	roll(game, 2u);
	acknowledge(game, 2u, 1u);
	EXPECT_EQ(game.currentPlayer(), 1u);

	// The bankrupt player cannot act.
	roll(game, 0u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.state().players[0].position, 4u);
}

TEST(Game, TurnOrderWrapsPastBankruptPlayers) {
	auto state                = makeState(3u);
	state.players[2].bankrupt = true;
	state.turnIndex           = 1u;

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}}));
	roll(game, 1u);
	acknowledge(game, 1u, 1u);

	EXPECT_EQ(game.currentPlayer(), 0u);
}

TEST(Game, DoublesGrantAnotherRoll) {
	Game game(makeState(2u), GameConfig{}, scriptedDice({{3u, 3u}, {1u, 2u}}));

	roll(game, 0u);
	EXPECT_EQ(game.state().players[0].position, 6u);
	acknowledge(game, 0u, 1u);
	EXPECT_EQ(game.currentPlayer(), 0u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.state().players[0].consecutiveDoubles, 1u);

	roll(game, 0u);
	EXPECT_EQ(game.state().players[0].position, 9u);
	acknowledge(game, 0u, 1u);
	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_EQ(game.state().players[0].consecutiveDoubles, 0u);
}

// Third doubles in a row go straight to jail without moving.
TEST(Game, Speeding) {
	Game game(makeState(2u), GameConfig{}, scriptedDice({{2u, 2u}, {3u, 3u}, {6u, 6u}}));
	RecordingListener listener;
	game.subscribeState(&listener);

	roll(game, 0u);
	EXPECT_EQ(game.state().players[0].position, 4u);
	EXPECT_EQ(game.currentPlayer(), 0u);

	roll(game, 0u);
	EXPECT_EQ(game.state().players[0].position, JAIL_POSITION);
	EXPECT_FALSE(game.state().players[0].inJail);
	EXPECT_EQ(game.currentPlayer(), 0u);

	roll(game, 0u);
	EXPECT_TRUE(game.state().players[0].inJail);
	EXPECT_EQ(game.state().players[0].position, JAIL_POSITION);
	EXPECT_EQ(game.state().players[0].consecutiveDoubles, 0u);
	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_EQ(game.phase(), Phase::Roll);

	EXPECT_EQ(listener.deltasOf(GameAction::Move).size(), 2u);
	EXPECT_EQ(listener.deltasOf(GameAction::Jail).size(), 1u);
}

TEST(Game, PassingGoOnRoll) {
	auto state                = makeState(2u);
	state.players[0].position = 38u;

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}}));
	roll(game, 0u);

	EXPECT_EQ(game.state().players[0].position, 1u);
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY + GO_INCOME);
	EXPECT_EQ(game.phase(), Phase::Buying);
}

TEST(Game, CardMoveRunsAfterAcknowledgment) {
	auto state                = makeState(2u);
	state.players[0].position = 4u;
	state.chance              = CardDeck({{"ch_boardwalk", "Advance to Boardwalk.", AdvanceAction{39u, false}}});

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}}));
	roll(game, 0u);

	ASSERT_EQ(game.phase(), Phase::CardPending);
	ASSERT_TRUE(game.state().popup.has_value());
	EXPECT_EQ(game.state().popup->cardId, "ch_boardwalk");
	EXPECT_EQ(game.state().players[0].position, 7u);

	acknowledge(game, 0u);
	EXPECT_EQ(game.phase(), Phase::Moving);
	EXPECT_FALSE(game.state().diceSum.has_value());

	game.tick(SETTLE);
	EXPECT_EQ(game.state().players[0].position, 39u);
	EXPECT_EQ(game.phase(), Phase::Buying);
	EXPECT_EQ(game.currentPlayer(), 0u);
}

TEST(Game, AdvanceToGoCreditsOnce) {
	auto state                = makeState(2u);
	state.players[0].position = 32u;
	state.chance              = CardDeck({{"ch_go", "Advance to Go (Collect $200).", AdvanceAction{0u, true}}});

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 3u}}));
	roll(game, 0u);
	ASSERT_EQ(game.phase(), Phase::CardPending);

	acknowledge(game, 0u);
	game.tick(SETTLE);

	EXPECT_EQ(game.state().players[0].position, GO_POSITION);
	EXPECT_EQ(game.state().players[0].cash, STARTING_MONEY + GO_INCOME);
	EXPECT_EQ(game.currentPlayer(), 1u);
}

TEST(Game, GoToJailCardEndsTurn) {
	auto state                = makeState(2u);
	state.players[0].position = 4u;
	state.chance              = CardDeck({{"ch_go_to_jail", "Go to Jail.", GoToJailAction{}}});

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}}));
	roll(game, 0u);
	ASSERT_EQ(game.phase(), Phase::CardPending);
	EXPECT_TRUE(game.state().players[0].inJail);

	acknowledge(game, 0u);
	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_EQ(game.state().players[0].position, JAIL_POSITION);
}

TEST(Game, LastPlayerStanding) {
	auto state            = makeState(2u);
	state.players[0].cash = 10;

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 3u}}));
	RecordingListener listener;
	game.subscribeSignals(&listener, GS_StateChange);

	EXPECT_FALSE(game.winner().has_value());
	roll(game, 0u);

	EXPECT_EQ(game.winner(), 1u);
	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_TRUE(listener.received(GS_StateChange));
}

// Events left after the turn passed on wait for the next tick.
TEST(Game, OneTurnPerTick) {
	auto state                = makeState(2u);
	state.players[0].inJail    = true;
	state.players[0].position  = JAIL_POSITION;

	Game game(std::move(state), GameConfig{}, scriptedDice({{1u, 2u}, {1u, 2u}}));
	game.pushEvent(RollEvent{0u});
	game.pushEvent(RollEvent{1u});
	game.tick(0.0);

	EXPECT_EQ(game.currentPlayer(), 1u);
	EXPECT_EQ(game.phase(), Phase::Roll);
	EXPECT_EQ(game.state().players[1].position, GO_POSITION);

	game.tick(0.0);
	EXPECT_EQ(game.phase(), Phase::Moving);
}

TEST(Game, StepDurationFromConfig) {
	Game game(makeState(2u), GameConfig{.stepDuration = 1.0}, scriptedDice({{1u, 2u}}));

	game.pushEvent(RollEvent{0u});
	game.tick(0.0);
	game.tick(2.5);
	EXPECT_EQ(game.phase(), Phase::Moving);

	game.tick(0.6);
	EXPECT_EQ(game.phase(), Phase::Buying);
}

TEST(Game, SeededSetupIsReproducible) {
	const GameConfig config{.diceSeed = 11u, .deckSeed = 5u};
	Game first(3u, config);
	Game second(3u, config);

	EXPECT_EQ(first.state().chance.order(), second.state().chance.order());
	EXPECT_EQ(first.state().communityChest.order(), second.state().communityChest.order());
	EXPECT_EQ(first.state().players.size(), 3u);
	EXPECT_EQ(first.state().turnOrder, (std::vector<PlayerId>{0u, 1u, 2u}));

	roll(first, 0u);
	roll(second, 0u);
	EXPECT_EQ(first.state().dice.first, second.state().dice.first);
	EXPECT_EQ(first.state().dice.second, second.state().dice.second);
	EXPECT_EQ(first.state().players[0].position, second.state().players[0].position);
}

} // namespace monopoly::gtest
