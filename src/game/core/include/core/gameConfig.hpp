#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace monopoly {

//! Engine tuning. Never changes the rules of the game.
struct GameConfig {
	double stepDuration{0.3};               //!< Virtual seconds a token needs per space.
	std::optional<std::uint64_t> diceSeed;  //!< Seed of the default dice. Random if empty.
	std::optional<std::uint64_t> deckSeed;  //!< Seed of the deck shuffle at game start. Random if empty.
};

//! Parse a JSON object. Missing keys keep their default.
//! \returns Empty if the text is not a JSON object or a value has the wrong type or range.
std::optional<GameConfig> parseGameConfig(const std::string& text);

//! Read and parse a JSON configuration file.
std::optional<GameConfig> loadGameConfig(const std::filesystem::path& path);

std::string toJson(const GameConfig& config);

} // namespace monopoly
