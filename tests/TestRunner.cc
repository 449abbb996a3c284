#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <cstyle/Diagnostics.hh>
#include <cstyle/Linter.hh>
#include <cstyle/Workspace.hh>
#include <cstyle/support/SourceManager.hh>

namespace
{
	[[nodiscard]] std::optional<std::string> read_text_file(std::filesystem::path const& p)
	{
		std::ifstream f(p, std::ios::binary);
		if (!f)
			return std::nullopt;

		std::string s;
		f.seekg(0, std::ios::end);
		auto const size = f.tellg();
		if (size > 0)
			s.resize(static_cast<std::size_t>(size));

		f.seekg(0, std::ios::beg);
		if (!s.empty())
			f.read(s.data(), static_cast<std::streamsize>(s.size()));

		return s;
	}

	[[nodiscard]] std::string_view trim_ws(std::string_view s) noexcept
	{
		while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
			s.remove_prefix(1);
		while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
			s.remove_suffix(1);
		return s;
	}

	// Non-empty lines that do not start with '#'.
	[[nodiscard]] std::vector<std::string> expected_lines(std::string_view text)
	{
		std::vector<std::string> lines{};

		std::size_t pos = 0;
		while (pos <= text.size())
		{
			auto end = text.find('\n', pos);
			if (end == std::string_view::npos)
				end = text.size();

			auto line = text.substr(pos, end - pos);
			if (!line.empty() && line.back() == '\r')
				line.remove_suffix(1);

			line = trim_ws(line);
			if (!line.empty() && line.front() != '#')
				lines.emplace_back(line);

			if (end == text.size())
				break;
			pos = end + 1;
		}

		return lines;
	}

	void print_mismatch(std::string_view got, std::string_view expected)
	{
		std::size_t line = 1;
		std::size_t column = 1;

		auto const n = got.size() < expected.size() ? got.size() : expected.size();
		for (std::size_t i = 0; i < n; ++i)
		{
			if (got[i] != expected[i])
			{
				std::cerr << "first difference at " << line << ':' << column << "\n";
				return;
			}

			if (got[i] == '\n')
			{
				++line;
				column = 1;
			}
			else
				++column;
		}

		std::cerr << "size mismatch: expected " << expected.size() << " bytes, got " << got.size()
				  << " bytes\n";
	}

	int run_fixed(std::string_view name, std::string_view input, std::string_view expected)
	{
		auto const result = cstyle::fix(input);

		if (result.text != expected)
		{
			std::cerr << "FAIL: " << name << "\n";
			print_mismatch(result.text, expected);
			std::cerr << "--- got\n" << result.text << "--- end\n";
			return 1;
		}

		auto const again = cstyle::fix(expected);
		if (again.text != expected || !again.report.empty())
		{
			std::cerr << "FAIL: " << name << ": expected output is not clean ("
					  << again.report.count() << " violation(s))\n";
			return 1;
		}

		return 0;
	}

	int run_err(std::string_view name, std::string input, std::vector<std::string> const& lines)
	{
		cstyle::SourceManager sources{};
		std::ostringstream diag_out{};
		cstyle::Diagnostics diag(sources, diag_out);
		diag.set_color_mode(cstyle::ColorMode::never);

		auto const id = sources.add_virtual(std::string(name), std::move(input));
		cstyle::emit_report(diag, sources, id, cstyle::scan(sources.content(id)));

		auto const diag_text = diag_out.str();

		if (diag.warning_count() == 0)
		{
			std::cerr << "expected violations but none were reported for " << name << "\n";
			return 1;
		}

		for (auto const& expected_line : lines)
		{
			if (diag_text.find(expected_line) == std::string::npos)
			{
				std::cerr << "missing expected diagnostic: " << expected_line << "\n";
				std::cerr << diag_text;
				return 1;
			}
		}

		return 0;
	}

} // namespace

int main(int argc, char** argv)
{
	if (argc != 3)
	{
		std::cerr << "usage: cstyle_test_runner <input.c> <expected.fixed|expected.err>\n";
		return 2;
	}

	auto const input_path = std::filesystem::path(argv[1]);
	auto const expected_path = std::filesystem::path(argv[2]);

	auto input = read_text_file(input_path);
	if (!input)
	{
		std::cerr << "error: failed to open input: " << input_path.string() << "\n";
		return 2;
	}

	auto expected = read_text_file(expected_path);
	if (!expected)
	{
		std::cerr << "error: failed to read expected file: " << expected_path.string() << "\n";
		return 2;
	}

	auto const name = input_path.filename().string();

	if (expected_path.extension() == ".err")
		return run_err(name, std::move(*input), expected_lines(*expected));

	return run_fixed(name, *input, *expected);
}
