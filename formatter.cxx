#include "formatter.hxx"

#include "utility.hxx"

#include <algorithm>
#include <array>
#include <utility>

namespace {
	constexpr std::array<std::pair<OutputFormat, std::string_view>, 4> formatNames{{
		{OutputFormat::Colored, "colored"},
		{OutputFormat::Json, "json"},
		{OutputFormat::Yaml, "yaml"},
		{OutputFormat::Table, "table"},
	}};
}

std::string_view toString(OutputFormat format)
{
	auto it = std::ranges::find(formatNames, format, &std::pair<OutputFormat, std::string_view>::first);
	return it->second;
}

std::optional<OutputFormat> outputFormatFromString(std::string_view name)
{
	const std::string lowered{toLowerCopy(trimWhitespace(name))};
	auto it = std::ranges::find(
		formatNames, std::string_view{lowered}, &std::pair<OutputFormat, std::string_view>::second);
	if (it == formatNames.end()) {
		return std::nullopt;
	}
	return it->first;
}

std::unique_ptr<OutputFormatter> makeFormatter(OutputFormat format, FormatterOptions options)
{
	switch (format) {
		case OutputFormat::Colored:
			return std::make_unique<ColoredFormatter>(options);
		case OutputFormat::Json:
			return std::make_unique<JsonFormatter>();
		case OutputFormat::Yaml:
			return std::make_unique<YamlFormatter>();
		case OutputFormat::Table:
			return std::make_unique<TableFormatter>();
	}
	return std::make_unique<ColoredFormatter>(options);
}
