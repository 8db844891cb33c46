#pragma once

#include "line-history.hxx"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

enum class OutputFormat { Colored, Json, Yaml, Table };

std::string_view toString(OutputFormat format);
std::optional<OutputFormat> outputFormatFromString(std::string_view name);

struct FormatterOptions {
	/// Emit ANSI colours, only used by ColoredFormatter
	bool color{true};
};

struct OutputFormatter {
	virtual ~OutputFormatter() = default;

	/// Serialisation failures are reported as a fixed placeholder text, never as an exception
	virtual std::string render(const LineHistory& history) const = 0;
};

class ColoredFormatter: public OutputFormatter {
public:
	explicit ColoredFormatter(FormatterOptions options = {});

	std::string render(const LineHistory& history) const override;

private:
	FormatterOptions options_;
};

class JsonFormatter: public OutputFormatter {
public:
	static constexpr std::string_view errorPlaceholder{"{}"};

	std::string render(const LineHistory& history) const override;
};

class YamlFormatter: public OutputFormatter {
public:
	static constexpr std::string_view errorPlaceholder{"Error formatting YAML"};

	std::string render(const LineHistory& history) const override;
};

class TableFormatter: public OutputFormatter {
public:
	std::string render(const LineHistory& history) const override;
};

std::unique_ptr<OutputFormatter> makeFormatter(OutputFormat format, FormatterOptions options);
