#pragma once

#include "core/dice.hpp"
#include "core/gameEvent.hpp"
#include "core/turnPhase.hpp"
#include "model/board.hpp"
#include "model/cardDeck.hpp"
#include "model/player.hpp"

#include <optional>
#include <random>
#include <string>
#include <vector>

namespace monopoly {

enum class PopupKind : std::uint8_t {
	Buy,        //!< Choice 0 buys, any other choice declines.
	Rent,       //!< Rent paid. Any choice acknowledges.
	Card,       //!< Card drawn. Any choice acknowledges.
	Properties, //!< Property view. 0 previous/close, 1 toggle mortgage, 2 next/close.
	Trade,      //!< Trade offer. Initiator: 0 cancel, 1 send. Partner: 2 accept, any other choice declines.
};

//! Popup payload read by the renderer.
struct Popup {
	PopupKind kind{PopupKind::Buy};
	PlayerId player{0u};                  //!< Player who has to answer.
	std::optional<SpaceIndex> space;      //!< Space the popup is about.
	Money amount{0};                      //!< Price or rent.
	std::optional<PlayerId> counterparty; //!< Rent receiver or trade partner.
	std::optional<DeckKind> deck;         //!< Deck of a drawn card.
	std::string cardId;
	std::string text;   //!< Card text.
	unsigned page{0u};  //!< Property view: index into the player's property list.

public:
	bool operator==(const Popup&) const = default;
};

//! How the move in flight has to be settled when the token comes to rest.
struct MoveContext {
	bool forward{true};          //!< Backward moves never pass Go.
	bool collectGo{true};        //!< Credit Go income when the path passes Go.
	bool fromCard{false};        //!< Move caused by a card, no fresh dice throw.
	unsigned rentMultiplier{1u}; //!< Applied to rent owed on arrival.
	bool goCredited{false};      //!< Set once Go income was paid for this move.
};

//! Card move waiting for the card popup to be acknowledged.
struct PendingMove {
	std::vector<SpaceIndex> path;
	MoveContext context;
};

enum class TradeStage : std::uint8_t {
	Editing,          //!< Initiator builds the offer.
	AwaitingResponse, //!< Partner accepts or declines.
};

//! Trade negotiated between the current player and one other solvent player.
struct TradeOffer {
	PlayerId initiator{0u};
	PlayerId partner{0u};
	Money offerMoney{0};                   //!< Paid by the initiator.
	Money requestMoney{0};                 //!< Paid by the partner.
	std::vector<SpaceIndex> offerDeeds;    //!< Given by the initiator.
	std::vector<SpaceIndex> requestDeeds;  //!< Given by the partner.
	TradeStage stage{TradeStage::Editing};

public:
	bool operator==(const TradeOffer&) const = default;
};

//! Complete state of one game. Passed by reference to the resolver functions.
struct GameState {
	Board board;
	std::vector<PlayerAccount> players; //!< Indexed by PlayerId.
	std::vector<PlayerId> turnOrder;    //!< Seating order. Bankrupt players stay and are skipped.
	std::size_t turnIndex{0u};          //!< Index into turnOrder of the current player.

	Phase phase{Phase::Roll};
	DiceRoll dice;                  //!< Last throw. Zero faces before the first throw of a turn.
	std::optional<unsigned> diceSum; //!< Set right after the current player's own throw. Empty after card moves.

	CardDeck chance;
	CardDeck communityChest;

	std::optional<Popup> popup;
	std::optional<PendingMove> pendingMove;
	std::optional<TradeOffer> trade; //!< Open trade. Shown through a Trade popup.
	MoveContext moveContext; //!< Context of the move in flight or the landing being resolved.

	double clock{0.0};  //!< Virtual time advanced by Game::tick.
	unsigned turn{0u};  //!< Number of turns passed on so far.

	std::vector<GameDelta> journal; //!< Deltas not yet forwarded to listeners. Not persisted.

public:
	explicit GameState(Board gameBoard);
};

//! Setup a new game on the classic board with players 0..playerCount-1 seated in order.
//! Decks are shuffled with the given generator.
GameState newGame(std::size_t playerCount, std::mt19937_64& deckRng);

//! The current player or empty if every seated player is bankrupt.
std::optional<PlayerId> currentPlayer(const GameState& state);

//! Players not yet bankrupt, in seating order.
std::vector<PlayerId> solventPlayers(const GameState& state);

//! Append a delta stamped with the current turn.
void record(GameState& state, GameDelta delta);

} // namespace monopoly
