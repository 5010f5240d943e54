#pragma once

#include "core/gameState.hpp"

#include <optional>

namespace monopoly {

//! Pay money from the bank to a player.
void credit(GameState& state, PlayerId player, Money amount);

//! Take money from a player and pay it to the creditor, or to the bank if there is none.
//! If the player cannot pay the full amount, no money moves and the player goes bankrupt to the creditor.
//! \returns True if the amount was paid.
bool debit(GameState& state, PlayerId payer, Money amount, std::optional<PlayerId> creditor = std::nullopt);

//! Flag the debtor bankrupt and settle the deeds.
//! Owed to a player, every deed moves to the creditor with houses and mortgage kept.
//! Owed to the bank, every deed goes back to the bank without houses or mortgage.
void declareBankruptcy(GameState& state, PlayerId debtor, std::optional<PlayerId> creditor);

//! Buy an unowned space at its price.
//! \returns False if the space cannot be bought or the player cannot afford it.
bool buyProperty(GameState& state, PlayerId buyer, SpaceIndex index);

//! Money paid to unmortgage a deed. Mortgage value plus ten percent, rounded down.
Money unmortgageCost(const Board& board, SpaceIndex index);

//! Mortgage an owned deed and pay out its mortgage value.
//! \returns False if the player does not own it, it is mortgaged already or the colour group has houses.
bool mortgageProperty(GameState& state, PlayerId player, SpaceIndex index);

//! Lift the mortgage of an owned deed at unmortgageCost.
//! \returns False if the player does not own it, it is not mortgaged or the player cannot afford it.
bool unmortgageProperty(GameState& state, PlayerId player, SpaceIndex index);

//! True if the owner may hand the deed over in a trade: owned, unmortgaged and no houses in its colour group.
bool isTradable(const GameState& state, PlayerId owner, SpaceIndex index);

//! Swap the cash and deeds of an offer between initiator and partner.
//! The whole offer is validated first; nothing moves if any part of it is no longer valid.
//! \returns False if the offer was rejected.
bool executeTrade(GameState& state, const TradeOffer& offer);

} // namespace monopoly
