#include "formatter.hxx"

#include "utility.hxx"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {
	void emitText(YAML::Emitter& out, std::string_view key, std::string_view value)
	{
		out << YAML::Key << std::string{key} << YAML::Value;
		if (value.find('\n') != std::string_view::npos) {
			out << YAML::Literal;
		}
		out << std::string{value};
	}
} // namespace

std::string YamlFormatter::render(const LineHistory& history) const
{
	YAML::Emitter out;
	out << YAML::BeginMap;
	out << YAML::Key << "file_path" << YAML::Value << history.filePath();
	out << YAML::Key << "line_number" << YAML::Value << history.lineNumber();
	out << YAML::Key << "entries" << YAML::Value;
	if (history.empty()) {
		out << YAML::Flow;
	}
	out << YAML::BeginSeq;
	for (const LineEvent& event: history.events()) {
		out << YAML::BeginMap;
		emitText(out, "commit_hash", event.commitId);
		emitText(out, "short_hash", event.shortId());
		emitText(out, "author", event.author);
		emitText(out, "timestamp", formatTimestamp(event.time));
		emitText(out, "message", trimWhitespace(std::string_view{event.message}));
		emitText(out, "content", event.content);
		emitText(out, "change_type", toString(event.change));
		out << YAML::EndMap;
	}
	out << YAML::EndSeq;
	out << YAML::EndMap;

	if (!out.good()) {
		spdlog::warn("YAML serialization failed: {}", out.GetLastError());
		return std::string{errorPlaceholder};
	}
	return out.c_str();
}
