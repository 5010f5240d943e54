#pragma once

#include "model/board.hpp"

#include <optional>

namespace monopoly {

//! Rent owed when landing on an owned space.
//! \param diceSum Sum of the throw that moved the token. Empty for card moves.
//! \returns Zero for unowned or mortgaged deeds and for spaces that cannot be owned.
//!          Utility rent is zero without a dice sum.
Money computeRent(const Board& board, SpaceIndex index, std::optional<unsigned> diceSum);

//! Fixed tax of a tax space. Zero for all other kinds.
Money taxAmount(SpaceKind kind);

} // namespace monopoly
