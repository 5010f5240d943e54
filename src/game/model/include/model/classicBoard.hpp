#pragma once

#include "model/board.hpp"
#include "model/card.hpp"

#include <vector>

namespace monopoly {

//! The classic American board with all deeds owned by the bank.
Board classicBoard();

//! The 16 Chance cards in printed order.
std::vector<Card> chanceCards();

//! The 16 Community Chest cards in printed order.
std::vector<Card> communityChestCards();

} // namespace monopoly
