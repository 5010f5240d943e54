#pragma once

#include "core/gameState.hpp"

#include <vector>

namespace monopoly {

//! Spaces visited when moving `steps` spaces forward from `from`. The last entry is the destination.
std::vector<SpaceIndex> forwardPath(SpaceIndex from, unsigned steps);
//! Spaces visited when moving `steps` spaces backward from `from`.
std::vector<SpaceIndex> backwardPath(SpaceIndex from, unsigned steps);

//! Number of forward steps from one space to another. A target behind `from` wraps; the same space is a full lap.
unsigned forwardDistance(SpaceIndex from, SpaceIndex to);

//! True if a forward path enters space 0.
bool passesGo(const std::vector<SpaceIndex>& path);

//! First space of the given kind strictly ahead of `from`.
std::optional<SpaceIndex> nearestAhead(const Board& board, SpaceIndex from, SpaceKind kind);

//! Start animating the player along the path. The position is committed by finishMove.
void startMove(GameState& state, PlayerId player, std::vector<SpaceIndex> path, MoveContext context);

//! True once the move of the player ran for stepDuration per space on the virtual clock.
bool moveFinished(const GameState& state, PlayerId player, double stepDuration);

//! Commit the destination of the move in flight and credit Go income if the path passed Go.
void finishMove(GameState& state, PlayerId player);

//! Put the player in jail. Clears the doubles streak and any move in flight.
void sendToJail(GameState& state, PlayerId player);

} // namespace monopoly
