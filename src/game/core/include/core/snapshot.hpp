#pragma once

#include "core/gameState.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace monopoly {

//! Serialise everything needed to resume the game. The delta journal is not part of a snapshot.
nlohmann::json toSnapshot(const GameState& state);

//! Rebuild a game on the classic board from a snapshot.
//! \returns Empty if the snapshot is malformed or describes an inconsistent game.
std::optional<GameState> fromSnapshot(const nlohmann::json& snapshot);

} // namespace monopoly
