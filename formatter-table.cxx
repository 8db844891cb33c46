#include "formatter.hxx"

#include "utility.hxx"

#include <algorithm>
#include <format>
#include <vector>

namespace {
	using Row = std::vector<std::string>;

	/// Number of code points, good enough to align non-ASCII author names
	std::size_t displayWidth(std::string_view text)
	{
		return static_cast<std::size_t>(
			std::ranges::count_if(text, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
	}

	class TextTable {
	public:
		explicit TextTable(Row headers)
			: headers_{std::move(headers)}
			, widths_(headers_.size())
		{
			std::ranges::transform(headers_, widths_.begin(), displayWidth);
		}

		void addRow(Row row)
		{
			row.resize(headers_.size());
			for (std::size_t i = 0; i < row.size(); ++i) {
				widths_[i] = std::max(widths_[i], displayWidth(row[i]));
			}
			rows_.push_back(std::move(row));
		}

		std::string render() const
		{
			std::string out;
			appendSeparator(out);
			appendRow(out, headers_);
			appendSeparator(out);
			for (const Row& row: rows_) {
				appendRow(out, row);
			}
			appendSeparator(out);
			return out;
		}

	private:
		void appendSeparator(std::string& out) const
		{
			out += '+';
			for (std::size_t width: widths_) {
				out.append(width + 2, '-');
				out += '+';
			}
			out += '\n';
		}

		void appendRow(std::string& out, const Row& row) const
		{
			out += '|';
			for (std::size_t i = 0; i < row.size(); ++i) {
				out += ' ';
				out += row[i];
				out.append(widths_[i] - displayWidth(row[i]) + 1, ' ');
				out += '|';
			}
			out += '\n';
		}

		Row headers_;
		std::vector<std::size_t> widths_;
		std::vector<Row> rows_;
	};
} // namespace

std::string TableFormatter::render(const LineHistory& history) const
{
	std::string header{std::format("File: {}\nLine: {}\n\n", history.filePath(), history.lineNumber())};

	if (history.empty()) {
		return header + "No history entries";
	}

	const bool withContent = std::ranges::any_of(
		history.events(), [](const LineEvent& event) { return !event.content.empty(); });

	Row headers{"Commit", "Author", "Timestamp", "Change Type", "Message"};
	if (withContent) {
		headers.emplace_back("Content");
	}

	TextTable table{std::move(headers)};
	for (const LineEvent& event: history.events()) {
		Row row{
			std::string{event.shortId()},
			event.author,
			formatTimestamp(event.time) + " UTC",
			std::string{toString(event.change)},
			std::string{messageSummary(event.message)},
		};
		if (withContent) {
			row.push_back(event.content);
		}
		table.addRow(std::move(row));
	}

	return header + table.render();
}
