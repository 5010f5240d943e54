#pragma once

#include "core/SafeQueue.hpp"
#include "core/dice.hpp"
#include "core/eventHub.hpp"
#include "core/gameConfig.hpp"
#include "core/gameEvent.hpp"
#include "core/gameState.hpp"

#include <memory>
#include <optional>
#include <string>

namespace monopoly {

using EventQueue = SafeQueue<GameEvent>;

//! Core game setup.
//! This owns the rules loop and emits signals and deltas; external code should only push events, tick and listen.
class Game {
public:
	//! Setup a new game on the classic board. Players are seated in id order, player 0 starts.
	//! \param dice Source of dice throws. Defaults to RandomDice seeded from the configuration.
	explicit Game(std::size_t playerCount, GameConfig config = {}, std::unique_ptr<IDice> dice = nullptr);
	//! Resume a game from a state, e.g. one restored from a snapshot.
	explicit Game(GameState state, GameConfig config = {}, std::unique_ptr<IDice> dice = nullptr);

	void pushEvent(GameEvent event); //!< Push an event to the event queue. Thread safe.

	//! Dispatch queued events, advance the virtual clock by dt seconds and evaluate time gates.
	//! Once a turn passes on, remaining events stay queued for the next tick.
	void tick(double dt);

	const GameState& state() const;
	const GameConfig& config() const;
	Phase phase() const;
	std::optional<PlayerId> currentPlayer() const;
	//! The last player standing once all others are bankrupt.
	std::optional<PlayerId> winner() const;

	std::string saveSnapshot() const;
	//! Replace the running game with a snapshot. Queued events are dropped.
	//! \returns False and keeps the running game if the snapshot is rejected.
	bool loadSnapshot(const std::string& snapshot);

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void handleEvent(const RollEvent& event);
	void handleEvent(const AcknowledgeEvent& event);
	void handleEvent(const OpenPropertiesEvent& event);
	void handleEvent(const ClosePropertiesEvent& event);
	void handleEvent(const PayJailFineEvent& event);
	void handleEvent(const UseJailCardEvent& event);
	void handleEvent(const ProposeTradeEvent& event);
	void handleEvent(const AdjustTradeMoneyEvent& event);
	void handleEvent(const SetTradePropertyEvent& event);

	//! True if the player is current and may act in the Roll phase.
	bool canActInRollPhase(PlayerId player) const;

	void rollInJail(PlayerId player, const DiceRoll& roll);
	void releaseFromJail(PlayerId player, Money finePaid);
	void beginMove(PlayerId player, std::vector<SpaceIndex> path, MoveContext context);
	void updateMovement();
	void applyLanding(PlayerId player);

	void acknowledgePurchase(PlayerId player, unsigned choice);
	void acknowledgeCard();
	void choosePropertyAction(PlayerId player, unsigned choice);
	void showPropertyPage(PlayerId player, unsigned page);

	//! The open trade if the player is its initiator and may still edit it.
	TradeOffer* editableTrade(PlayerId player);
	void showTradePopup();
	void answerTrade(unsigned choice);
	void closeTrade(bool executed);

	void finishTurnOrAllowDouble(); //!< Same player rolls again after doubles, otherwise the turn passes on.
	void advanceTurn();             //!< Pass the turn to the next player that is not bankrupt.
	void setPhase(Phase next);      //!< Change phase if the transition table allows it.

	//! Forward the journal to state listeners and raise the signals collected during the tick.
	void notifyListeners(const std::optional<Popup>& popupBefore, const std::optional<TradeOffer>& tradeBefore);

private:
	GameConfig m_config;
	std::unique_ptr<IDice> m_dice;
	GameState m_state;

	EventQueue m_eventQueue; //!< Queue of input events we have to handle.
	EventHub m_eventHub;     //!< Hub to signal updates of the game state to external components.
	uint64_t m_signals{GS_None}; //!< Signals raised since the last notification.
};

} // namespace monopoly
