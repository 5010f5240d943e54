#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace monopoly {

static Logging::LogConfig config;

//! Log any entry to the engine log file. Debug builds also log to the console.
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);

	const auto logPath = Logging::GetDefaultLogDir("MonopolyEngine/Core");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (ec) {
		std::cerr << std::format("[Logger] Could not create directory {}: {}. Engine will not log to file.\n", logPath.string(), ec.message());
	} else {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "engine.log"));
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

Logging::Logger Logger() {
	static std::once_flag initFlag;
	std::call_once(initFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace monopoly
