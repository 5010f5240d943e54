#pragma once

#include "model/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace monopoly {

// Input events. Events from a player who is not current, or in a phase that does not accept them, are ignored.
struct RollEvent {
	PlayerId player;
};
struct AcknowledgeEvent {
	PlayerId player;
	unsigned choice{0u}; //!< Index of the popup button pressed.
};
struct OpenPropertiesEvent {
	PlayerId player;
};
struct ClosePropertiesEvent {
	PlayerId player;
};
struct PayJailFineEvent {
	PlayerId player;
};
struct UseJailCardEvent {
	PlayerId player;
};

//! Side of a trade offer. Offer is given by the initiator, request by the partner.
enum class TradeSide : std::uint8_t { Offer, Request };

struct ProposeTradeEvent {
	PlayerId player;
	PlayerId partner;
};
struct AdjustTradeMoneyEvent {
	PlayerId player;
	TradeSide side;
	Money delta; //!< Added to the side's money, clamped to [0, cash of the paying player].
};
struct SetTradePropertyEvent {
	PlayerId player;
	TradeSide side;
	SpaceIndex space;
	bool included;
};

using GameEvent = std::variant<RollEvent, AcknowledgeEvent, OpenPropertiesEvent, ClosePropertiesEvent, PayJailFineEvent, UseJailCardEvent,
                               ProposeTradeEvent, AdjustTradeMoneyEvent, SetTradePropertyEvent>;

//! Types of notifications.
enum GameSignal : uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< A deed changed owner, houses or mortgage.
	GS_PlayerChange = 1 << 1, //!< Current player changed.
	GS_PhaseChange  = 1 << 2, //!< Turn phase changed.
	GS_PopupChange  = 1 << 3, //!< Popup shown, updated or closed.
	GS_StateChange  = 1 << 4, //!< A player went bankrupt or the last player is standing.
};

//! Kind of transaction reported in a delta.
enum class GameAction : std::uint8_t {
	Roll,          //!< Dice rolled. amount = dice sum.
	Move,          //!< Token came to rest. space = destination.
	PassGo,        //!< Go income credited.
	Purchase,      //!< Space bought. amount = price.
	Decline,       //!< Purchase declined or unaffordable.
	Rent,          //!< Rent paid to counterparty.
	Tax,           //!< Tax paid to the bank.
	Card,          //!< Card drawn. detail = card id.
	Payment,       //!< Card driven transfer. counterparty empty for the bank.
	Jail,          //!< Sent to jail.
	Release,       //!< Left jail.
	Mortgage,      //!< Deed mortgaged. amount = mortgage value.
	Unmortgage,    //!< Deed unmortgaged. amount = cost.
	Trade,         //!< Trade executed. counterparty = partner, amount = net money paid by the initiator.
	TradeDeclined, //!< Trade cancelled, declined or no longer valid.
	Bankruptcy,    //!< Player went bankrupt. counterparty = creditor, empty for the bank.
	TurnEnd,       //!< Turn passed on. counterparty = next player.
};

//! Fine grained description of one state change so listeners can apply or display it.
struct GameDelta {
	unsigned turn{0u};                    //!< Turn number the change belongs to.
	GameAction action{GameAction::Roll};  //!< What happened.
	PlayerId player{0u};                  //!< Player the change applies to.
	std::optional<SpaceIndex> space;      //!< Space involved, if any.
	Money amount{0};                      //!< Money moved, if any.
	std::optional<PlayerId> counterparty; //!< Other player involved, if any.
	std::string detail;                   //!< Additional information. Card id for card draws.
};

} // namespace monopoly
