#include "formatter.hxx"

#include "utility.hxx"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::ordered_json;

std::string JsonFormatter::render(const LineHistory& history) const
{
	json entries = json::array();
	for (const LineEvent& event: history.events()) {
		entries.push_back(json{
			{"commit_hash", event.commitId},
			{"short_hash", std::string{event.shortId()}},
			{"author", event.author},
			{"timestamp", formatTimestamp(event.time)},
			{"message", std::string{trimWhitespace(std::string_view{event.message})}},
			{"content", event.content},
			{"change_type", std::string{toString(event.change)}},
		});
	}

	json document{
		{"file_path", history.filePath()},
		{"line_number", history.lineNumber()},
		{"entries", std::move(entries)},
	};

	try {
		return document.dump(2, ' ', false, json::error_handler_t::replace);
	} catch (const json::exception& e) {
		spdlog::warn("JSON serialization failed: {}", e.what());
		return std::string{errorPlaceholder};
	}
}
