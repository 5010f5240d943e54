#include "core/game.hpp"

#include "Logging.hpp"
#include "core/landingResolver.hpp"
#include "core/movement.hpp"
#include "core/snapshot.hpp"
#include "core/transactions.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <utility>

namespace monopoly {

static constexpr uint64_t ALL_SIGNALS = GS_BoardChange | GS_PlayerChange | GS_PhaseChange | GS_PopupChange | GS_StateChange;

static std::mt19937_64 deckGenerator(const GameConfig& config) {
	if (config.deckSeed) {
		return std::mt19937_64{*config.deckSeed};
	}

	std::random_device device;
	return std::mt19937_64{(static_cast<std::uint64_t>(device()) << 32u) ^ device()};
}

static GameState setupGame(const std::size_t playerCount, const GameConfig& config) {
	assert(playerCount >= 1u);

	auto rng = deckGenerator(config);
	return newGame(playerCount, rng);
}

Game::Game(const std::size_t playerCount, GameConfig config, std::unique_ptr<IDice> dice)
    : Game(setupGame(playerCount, config), config, std::move(dice)) {
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] New game with {} players.", playerCount));
}

Game::Game(GameState state, GameConfig config, std::unique_ptr<IDice> dice)
    : m_config(std::move(config)), m_dice(std::move(dice)), m_state(std::move(state)) {
	if (!m_dice) {
		m_dice = std::make_unique<RandomDice>(m_config.diceSeed);
	}
	assert(!m_state.turnOrder.empty());
}

void Game::pushEvent(GameEvent event) {
	m_eventQueue.Push(event);
}

void Game::tick(const double dt) {
	const auto popupBefore = m_state.popup;
	const auto tradeBefore = m_state.trade;
	const auto turnBefore  = m_state.turn;

	while (m_state.turn == turnBefore) {
		const auto event = m_eventQueue.TryPop();
		if (!event) {
			break;
		}
		std::visit([&](auto&& ev) { handleEvent(ev); }, *event);
	}

	m_state.clock += std::max(dt, 0.0);
	if (m_state.turn == turnBefore) {
		updateMovement();
	}

	notifyListeners(popupBefore, tradeBefore);
}

const GameState& Game::state() const {
	return m_state;
}

const GameConfig& Game::config() const {
	return m_config;
}

Phase Game::phase() const {
	return m_state.phase;
}

std::optional<PlayerId> Game::currentPlayer() const {
	return monopoly::currentPlayer(m_state);
}

std::optional<PlayerId> Game::winner() const {
	const auto solvent = solventPlayers(m_state);
	if (m_state.players.size() > 1u && solvent.size() == 1u) {
		return solvent.front();
	}
	return {};
}

std::string Game::saveSnapshot() const {
	return toSnapshot(m_state).dump();
}

bool Game::loadSnapshot(const std::string& snapshot) {
	const auto parsed = nlohmann::json::parse(snapshot, nullptr, false);
	if (parsed.is_discarded()) {
		Logger().Log(Logging::LogLevel::Warning, "[Game] Snapshot is not valid JSON.");
		return false;
	}

	auto state = fromSnapshot(parsed);
	if (!state) {
		return false;
	}

	m_state = std::move(*state);
	m_eventQueue.Clear();
	m_signals = ALL_SIGNALS;

	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Resumed game at turn {}.", m_state.turn));
	return true;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

bool Game::canActInRollPhase(const PlayerId player) const {
	const auto current = currentPlayer();
	if (!current || *current != player || m_state.phase != Phase::Roll || m_state.popup) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Ignored input of player {} in phase {}.", player, toString(m_state.phase)));
		return false;
	}
	return true;
}

void Game::handleEvent(const RollEvent& event) {
	if (!canActInRollPhase(event.player)) {
		return;
	}

	const auto roll = m_dice->roll();
	if (roll.first < 1u || roll.first > 6u || roll.second < 1u || roll.second > 6u) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Game] Dice returned invalid faces {} and {}.", roll.first, roll.second));
		assert(false);
		return;
	}

	m_state.dice    = roll;
	m_state.diceSum = roll.sum();
	record(m_state, {.action = GameAction::Roll, .player = event.player, .amount = static_cast<Money>(roll.sum()), .detail = std::format("{}+{}", roll.first, roll.second)});

	auto& account = m_state.players[event.player];
	if (account.inJail) {
		rollInJail(event.player, roll);
		return;
	}

	if (roll.isDoubles()) {
		if (++account.consecutiveDoubles >= SPEEDING_LIMIT) {
			Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} rolled doubles {} times and goes to jail.", event.player, SPEEDING_LIMIT));
			sendToJail(m_state, event.player);
			advanceTurn();
			return;
		}
	} else {
		account.consecutiveDoubles = 0u;
	}

	beginMove(event.player, forwardPath(account.position, roll.sum()), MoveContext{});
}

void Game::rollInJail(const PlayerId player, const DiceRoll& roll) {
	auto& account              = m_state.players[player];
	account.consecutiveDoubles = 0u; // Leaving jail never grants another throw.

	if (roll.isDoubles()) {
		releaseFromJail(player, 0);
		beginMove(player, forwardPath(account.position, roll.sum()), MoveContext{});
		return;
	}

	if (++account.jailTurns < MAX_JAIL_TURNS) {
		advanceTurn();
		return;
	}

	// Last attempt failed. The fine is due and the player moves anyway.
	if (!debit(m_state, player, JAIL_FINE)) {
		advanceTurn();
		return;
	}
	releaseFromJail(player, JAIL_FINE);
	beginMove(player, forwardPath(account.position, roll.sum()), MoveContext{});
}

void Game::releaseFromJail(const PlayerId player, const Money finePaid) {
	auto& account     = m_state.players[player];
	account.inJail    = false;
	account.jailTurns = 0u;

	record(m_state, {.action = GameAction::Release, .player = player, .space = JAIL_POSITION, .amount = finePaid});
}

void Game::handleEvent(const PayJailFineEvent& event) {
	if (!canActInRollPhase(event.player)) {
		return;
	}

	const auto& account = m_state.players[event.player];
	if (!account.inJail || account.cash < JAIL_FINE) {
		return;
	}

	if (debit(m_state, event.player, JAIL_FINE)) {
		releaseFromJail(event.player, JAIL_FINE);
	}
}

void Game::handleEvent(const UseJailCardEvent& event) {
	if (!canActInRollPhase(event.player)) {
		return;
	}

	auto& account = m_state.players[event.player];
	if (!account.inJail || account.jailFreeCards == 0u) {
		return;
	}

	--account.jailFreeCards;
	releaseFromJail(event.player, 0);
}

void Game::beginMove(const PlayerId player, std::vector<SpaceIndex> path, const MoveContext context) {
	startMove(m_state, player, std::move(path), context);
	setPhase(Phase::Moving);
}

void Game::updateMovement() {
	if (m_state.phase != Phase::Moving) {
		return;
	}

	const auto player = currentPlayer();
	if (!player || !m_state.players[*player].move.active) {
		Logger().Log(Logging::LogLevel::Error, "[Game] Moving phase without a token in flight. Skipping the turn.");
		assert(false);
		advanceTurn();
		return;
	}

	if (!moveFinished(m_state, *player, m_config.stepDuration)) {
		return;
	}

	finishMove(m_state, *player);
	applyLanding(*player);
}

void Game::applyLanding(const PlayerId player) {
	switch (resolveLanding(m_state, player)) {
	case LandingResult::EndTurn:
		finishTurnOrAllowDouble();
		break;
	case LandingResult::AwaitPurchase:
		setPhase(Phase::Buying);
		break;
	case LandingResult::AwaitRent:
		setPhase(Phase::PayingRent);
		break;
	case LandingResult::AwaitCard:
		setPhase(Phase::CardPending);
		break;
	case LandingResult::Jailed:
	case LandingResult::Bankrupt:
		advanceTurn();
		break;
	}
}

void Game::handleEvent(const AcknowledgeEvent& event) {
	// Trade popups may be answered by the partner. Every other popup belongs to the current player.
	const auto current     = currentPlayer();
	const bool tradePopup  = m_state.popup && m_state.popup->kind == PopupKind::Trade;
	if (!m_state.popup || !current || m_state.popup->player != event.player || (!tradePopup && *current != event.player)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Ignored acknowledgment of player {}.", event.player));
		return;
	}

	switch (m_state.popup->kind) {
	case PopupKind::Buy:
		if (m_state.phase == Phase::Buying) {
			acknowledgePurchase(event.player, event.choice);
		}
		break;
	case PopupKind::Rent:
		if (m_state.phase == Phase::PayingRent) {
			m_state.popup.reset();
			finishTurnOrAllowDouble();
		}
		break;
	case PopupKind::Card:
		if (m_state.phase == Phase::CardPending) {
			acknowledgeCard();
		}
		break;
	case PopupKind::Properties:
		choosePropertyAction(event.player, event.choice);
		break;
	case PopupKind::Trade:
		answerTrade(event.choice);
		break;
	}
}

void Game::acknowledgePurchase(const PlayerId player, const unsigned choice) {
	const auto index = m_state.popup->space;
	m_state.popup.reset();
	assert(index);

	if (choice == 0u && index && buyProperty(m_state, player, *index)) {
		record(m_state, {.action = GameAction::Purchase, .player = player, .space = index, .amount = m_state.board.space(*index).price});
		Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} bought {}.", player, m_state.board.space(*index).name));
	} else {
		record(m_state, {.action = GameAction::Decline, .player = player, .space = index});
	}

	finishTurnOrAllowDouble();
}

void Game::acknowledgeCard() {
	const auto player = m_state.popup->player;
	m_state.popup.reset();

	if (auto pending = std::exchange(m_state.pendingMove, std::nullopt)) {
		m_state.diceSum.reset();
		beginMove(player, std::move(pending->path), pending->context);
		return;
	}
	finishTurnOrAllowDouble();
}

void Game::handleEvent(const OpenPropertiesEvent& event) {
	if (!canActInRollPhase(event.player) || m_state.players[event.player].properties.empty()) {
		return;
	}
	showPropertyPage(event.player, 0u);
}

void Game::handleEvent(const ClosePropertiesEvent& event) {
	if (m_state.popup && m_state.popup->kind == PopupKind::Properties && m_state.popup->player == event.player) {
		m_state.popup.reset();
	}
}

void Game::showPropertyPage(const PlayerId player, const unsigned page) {
	const auto& properties = m_state.players[player].properties;
	assert(page < properties.size());

	const auto index = properties[page];
	const auto& deed = m_state.board.deed(index);

	m_state.popup = Popup{
	        .kind   = PopupKind::Properties,
	        .player = player,
	        .space  = index,
	        .amount = deed.mortgaged ? unmortgageCost(m_state.board, index) : m_state.board.space(index).mortgageValue,
	        .page   = page,
	};
}

void Game::choosePropertyAction(const PlayerId player, const unsigned choice) {
	const auto& properties = m_state.players[player].properties;
	const auto page        = m_state.popup->page;
	if (page >= properties.size()) {
		m_state.popup.reset();
		return;
	}

	const auto index = properties[page];
	switch (choice) {
	case 0u:
		if (page == 0u) {
			m_state.popup.reset();
		} else {
			showPropertyPage(player, page - 1u);
		}
		break;
	case 1u:
		if (m_state.board.deed(index).mortgaged) {
			const auto cost = unmortgageCost(m_state.board, index);
			if (unmortgageProperty(m_state, player, index)) {
				record(m_state, {.action = GameAction::Unmortgage, .player = player, .space = index, .amount = cost});
			}
		} else if (mortgageProperty(m_state, player, index)) {
			record(m_state, {.action = GameAction::Mortgage, .player = player, .space = index, .amount = m_state.board.space(index).mortgageValue});
		}
		showPropertyPage(player, page);
		break;
	case 2u:
		if (page + 1u >= properties.size()) {
			m_state.popup.reset();
		} else {
			showPropertyPage(player, page + 1u);
		}
		break;
	default:
		break;
	}
}

void Game::handleEvent(const ProposeTradeEvent& event) {
	if (!canActInRollPhase(event.player)) {
		return;
	}
	if (event.partner == event.player || event.partner >= m_state.players.size() || m_state.players[event.partner].bankrupt) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Player {} cannot trade with player {}.", event.player, event.partner));
		return;
	}

	m_state.trade = TradeOffer{.initiator = event.player, .partner = event.partner};
	showTradePopup();
}

void Game::handleEvent(const AdjustTradeMoneyEvent& event) {
	auto* trade = editableTrade(event.player);
	if (!trade) {
		return;
	}

	const auto payer = event.side == TradeSide::Offer ? trade->initiator : trade->partner;
	auto& money      = event.side == TradeSide::Offer ? trade->offerMoney : trade->requestMoney;
	money            = std::clamp<Money>(money + event.delta, 0, std::max<Money>(m_state.players[payer].cash, 0));
}

void Game::handleEvent(const SetTradePropertyEvent& event) {
	auto* trade = editableTrade(event.player);
	if (!trade) {
		return;
	}

	const auto giver = event.side == TradeSide::Offer ? trade->initiator : trade->partner;
	auto& deeds      = event.side == TradeSide::Offer ? trade->offerDeeds : trade->requestDeeds;
	const auto found = std::find(deeds.begin(), deeds.end(), event.space);

	if (!event.included) {
		if (found != deeds.end()) {
			deeds.erase(found);
		}
	} else if (found == deeds.end() && isTradable(m_state, giver, event.space)) {
		deeds.push_back(event.space);
	}
}

TradeOffer* Game::editableTrade(const PlayerId player) {
	if (!m_state.trade || m_state.trade->initiator != player || m_state.trade->stage != TradeStage::Editing) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Ignored trade edit of player {}.", player));
		return nullptr;
	}
	return &*m_state.trade;
}

void Game::showTradePopup() {
	const auto& trade  = *m_state.trade;
	const bool editing = trade.stage == TradeStage::Editing;

	m_state.popup = Popup{
	        .kind         = PopupKind::Trade,
	        .player       = editing ? trade.initiator : trade.partner,
	        .amount       = trade.offerMoney - trade.requestMoney,
	        .counterparty = editing ? trade.partner : trade.initiator,
	};
}

void Game::answerTrade(const unsigned choice) {
	if (!m_state.trade) {
		Logger().Log(Logging::LogLevel::Error, "[Game] Trade popup without an open trade.");
		assert(false);
		m_state.popup.reset();
		return;
	}

	auto& trade = *m_state.trade;
	if (trade.stage == TradeStage::Editing) {
		if (choice == 0u) {
			closeTrade(false);
		} else if (choice == 1u) {
			trade.stage = TradeStage::AwaitingResponse;
			showTradePopup();
		}
		return;
	}

	closeTrade(choice == 2u && executeTrade(m_state, trade));
}

void Game::closeTrade(const bool executed) {
	const auto trade = std::exchange(m_state.trade, std::nullopt);
	m_state.popup.reset();
	if (!trade) {
		return;
	}

	if (!executed) {
		record(m_state, {.action = GameAction::TradeDeclined, .player = trade->initiator, .counterparty = trade->partner});
		return;
	}

	record(m_state, {.action       = GameAction::Trade,
	                 .player       = trade->initiator,
	                 .amount       = trade->offerMoney - trade->requestMoney,
	                 .counterparty = trade->partner,
	                 .detail       = std::format("{} deeds for {} deeds", trade->offerDeeds.size(), trade->requestDeeds.size())});
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} traded with player {}.", trade->initiator, trade->partner));
}

void Game::finishTurnOrAllowDouble() {
	if (const auto player = currentPlayer()) {
		const auto& account = m_state.players[*player];
		if (!account.inJail && account.consecutiveDoubles > 0u) {
			m_state.moveContext = {};
			setPhase(Phase::Roll);
			return;
		}
	}
	advanceTurn();
}

void Game::advanceTurn() {
	if (m_state.turnOrder.empty()) {
		Logger().Log(Logging::LogLevel::Error, "[Game] Cannot advance the turn without seated players.");
		assert(false);
		return;
	}

	const auto leaving = m_state.turnOrder[m_state.turnIndex];
	m_state.players[leaving].consecutiveDoubles = 0u;

	const auto count = m_state.turnOrder.size();
	bool found       = false;
	for (std::size_t step = 1u; step <= count; ++step) {
		const auto index = (m_state.turnIndex + step) % count;
		if (!m_state.players[m_state.turnOrder[index]].bankrupt) {
			m_state.turnIndex = index;
			found             = true;
			break;
		}
	}
	if (!found) {
		Logger().Log(Logging::LogLevel::Error, "[Game] Every player is bankrupt. Input is ignored from now on.");
	}

	const auto next = currentPlayer();
	record(m_state, {.action = GameAction::TurnEnd, .player = leaving, .counterparty = next});
	if (next != leaving) {
		m_signals |= GS_PlayerChange;
	}

	++m_state.turn;
	m_state.dice = {};
	m_state.diceSum.reset();
	m_state.popup.reset();
	m_state.pendingMove.reset();
	m_state.trade.reset();
	m_state.moveContext = {};
	setPhase(Phase::Roll);
}

void Game::setPhase(const Phase next) {
	if (!isTransitionAllowed(m_state.phase, next)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Game] Rejected phase transition {} -> {}.", toString(m_state.phase), toString(next)));
		assert(false);
		return;
	}

	if (m_state.phase != next) {
		m_signals |= GS_PhaseChange;
	}
	m_state.phase = next;
}

void Game::notifyListeners(const std::optional<Popup>& popupBefore, const std::optional<TradeOffer>& tradeBefore) {
	if (m_state.popup != popupBefore || m_state.trade != tradeBefore) {
		m_signals |= GS_PopupChange;
	}

	const auto deltas = std::exchange(m_state.journal, {});
	for (const auto& delta: deltas) {
		switch (delta.action) {
		case GameAction::Bankruptcy:
			m_signals |= GS_StateChange | GS_BoardChange;
			break;
		case GameAction::Purchase:
		case GameAction::Trade:
		case GameAction::Mortgage:
		case GameAction::Unmortgage:
			m_signals |= GS_BoardChange;
			break;
		default:
			break;
		}
	}

	if ((m_signals & GS_StateChange) && winner()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} is the last player standing.", *winner()));
	}

	const auto signals = std::exchange(m_signals, GS_None);
	m_eventHub.signalDeltas(deltas);
	m_eventHub.signal(signals);
}

} // namespace monopoly
