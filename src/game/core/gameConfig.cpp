#include "core/gameConfig.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <stdexcept>
#include <sstream>

namespace monopoly {

using nlohmann::json;

static constexpr const char* KEY_STEP_DURATION = "stepDuration";
static constexpr const char* KEY_DICE_SEED     = "diceSeed";
static constexpr const char* KEY_DECK_SEED     = "deckSeed";

static std::optional<std::uint64_t> readSeed(const json& object, const char* key) {
	if (!object.contains(key) || object.at(key).is_null()) {
		return {};
	}
	if (!object.at(key).is_number_unsigned()) {
		throw std::invalid_argument(std::format("'{}' must be an unsigned integer", key));
	}
	return object.at(key).get<std::uint64_t>();
}

std::optional<GameConfig> parseGameConfig(const std::string& text) {
	try {
		const auto object = json::parse(text);
		if (!object.is_object()) {
			Logger().Log(Logging::LogLevel::Warning, "[Config] Configuration is not a JSON object.");
			return {};
		}

		GameConfig config;
		if (object.contains(KEY_STEP_DURATION)) {
			const auto& step = object.at(KEY_STEP_DURATION);
			if (!step.is_number() || step.get<double>() < 0.0) {
				Logger().Log(Logging::LogLevel::Warning, "[Config] 'stepDuration' must be a non-negative number.");
				return {};
			}
			config.stepDuration = step.get<double>();
		}

		config.diceSeed = readSeed(object, KEY_DICE_SEED);
		config.deckSeed = readSeed(object, KEY_DECK_SEED);
		return config;
	} catch (const json::exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Could not parse configuration: {}", e.what()));
	} catch (const std::invalid_argument& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Invalid configuration: {}", e.what()));
	}

	return {};
}

std::optional<GameConfig> loadGameConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Could not open {}.", path.string()));
		return {};
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	return parseGameConfig(buffer.str());
}

std::string toJson(const GameConfig& config) {
	json object{{KEY_STEP_DURATION, config.stepDuration}};
	if (config.diceSeed) {
		object[KEY_DICE_SEED] = *config.diceSeed;
	}
	if (config.deckSeed) {
		object[KEY_DECK_SEED] = *config.deckSeed;
	}
	return object.dump();
}

} // namespace monopoly
