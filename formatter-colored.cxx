#include "formatter.hxx"

#include "utility.hxx"

#include <fmt/color.h>
#include <fmt/format.h>

namespace {
	std::string paint(bool enabled, std::string_view text, fmt::text_style style)
	{
		if (!enabled) {
			return std::string{text};
		}
		return fmt::format(style, "{}", text);
	}
} // namespace

ColoredFormatter::ColoredFormatter(FormatterOptions options)
	: options_{options}
{
}

std::string ColoredFormatter::render(const LineHistory& history) const
{
	const bool color = options_.color;

	std::string output;
	output += paint(color, history.filePath(), fmt::fg(fmt::terminal_color::cyan));
	output += ':';
	output += paint(color, std::to_string(history.lineNumber()), fmt::fg(fmt::terminal_color::yellow));
	output += '\n';

	if (history.empty()) {
		output += paint(color, "No history found", fmt::emphasis::faint);
		return output;
	}

	bool first = true;
	for (const LineEvent& event: history.events()) {
		if (!first) {
			output += "\n\n";
		}
		first = false;

		output += paint(color, event.shortId(), fmt::fg(fmt::terminal_color::bright_green));
		output += ' ';
		output += paint(color, event.author, fmt::fg(fmt::terminal_color::blue));
		output += ' ';
		output += paint(color, formatTimestamp(event.time), fmt::fg(fmt::terminal_color::white));
		output += ' ';
		output += paint(color, fmt::format("({})", toString(event.change)), fmt::fg(fmt::terminal_color::magenta));
		output += '\n';
		output += paint(color, trimWhitespace(std::string_view{event.message}), fmt::fg(fmt::terminal_color::white));

		if (!event.content.empty()) {
			output += "\n  ";
			output += paint(color, event.content, fmt::fg(fmt::terminal_color::bright_white));
		}
	}

	return output;
}
