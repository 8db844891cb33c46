#include "logging.hxx"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>

namespace {
	constexpr std::array levels{
		spdlog::level::warn, spdlog::level::info, spdlog::level::debug, spdlog::level::trace};
}

void setupLogging(int verbosity)
{
	auto logger = spdlog::stderr_color_mt("git-line-history");
	spdlog::set_default_logger(std::move(logger));
	spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

	std::size_t index = verbosity < 0 ? 0 : static_cast<std::size_t>(verbosity);
	spdlog::set_level(levels[std::min(index, levels.size() - 1)]);
}
