#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstyle/Diagnostics.hh>
#include <cstyle/Workspace.hh>
#include <cstyle/support/Ctype.hh>
#include <cstyle/support/SourceManager.hh>

namespace
{
	struct CliOptions
	{
		std::string target{};
		std::optional<bool> fix{};

		cstyle::ColorMode color{cstyle::ColorMode::auto_detect};
		bool quiet{};
		bool show_help{};
		bool show_version{};
	};

	[[nodiscard]] std::string_view exe_basename(std::string_view p) noexcept
	{
		auto const pos = p.find_last_of("/\\");
		if (pos == std::string_view::npos)
			return p;
		return p.substr(pos + 1);
	}

	void print_help(std::ostream& os, std::string_view exe)
	{
		os << "usage: " << exe << " [options] <file_or_directory> <fix:true|false>\n\n"
		   << "Checks C sources (.c, .h) for pointer declarator spacing ('int *p')\n"
		   << "and block braces on their own line. With 'true' the files are rewritten.\n\n"
		   << "options:\n"
		   << "      --color <auto|always|never>\n"
		   << "  -q, --quiet                only print errors and the summary\n"
		   << "  -h, --help                 show this help\n"
		   << "      --version              show version\n";
	}

	void print_version(std::ostream& os, std::string_view exe)
	{
		os << exe << " (cstyle) version 0.1.0\n";
	}

	[[nodiscard]] std::optional<bool> parse_bool(std::string_view s) noexcept
	{
		auto ieq = [&](std::string_view word) {
			if (s.size() != word.size())
				return false;

			for (std::size_t i = 0; i < s.size(); ++i)
				if (ascii_tolower(s[i]) != word[i])
					return false;

			return true;
		};

		if (ieq("true"))
			return true;
		if (ieq("false"))
			return false;

		return std::nullopt;
	}

	[[nodiscard]] std::optional<std::string_view> take_value(int& i, int argc, char** argv)
	{
		if (i + 1 >= argc)
			return std::nullopt;

		++i;
		return std::string_view(argv[i]);
	}

	[[nodiscard]] std::optional<CliOptions> parse_args(int argc, char** argv)
	{
		CliOptions opt{};
		std::vector<std::string_view> positional{};

		for (int i = 1; i < argc; ++i)
		{
			std::string_view a(argv[i]);

			if (a == "-h" || a == "--help")
			{
				opt.show_help = true;
				return opt;
			}

			if (a == "--version")
			{
				opt.show_version = true;
				return opt;
			}

			if (a == "-q" || a == "--quiet")
			{
				opt.quiet = true;
				continue;
			}

			if (a == "--color")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				if (*v == "auto")
					opt.color = cstyle::ColorMode::auto_detect;
				else if (*v == "always")
					opt.color = cstyle::ColorMode::always;
				else if (*v == "never")
					opt.color = cstyle::ColorMode::never;
				else
					return std::nullopt;

				continue;
			}

			if (a.size() > 1 && a.front() == '-')
				return std::nullopt;

			positional.push_back(a);
		}

		if (positional.size() != 2)
			return std::nullopt;

		opt.target = std::string(positional[0]);
		opt.fix = parse_bool(positional[1]);
		if (!opt.fix)
			return std::nullopt;

		return opt;
	}

} // namespace

int main(int argc, char** argv)
{
	auto const exe =
		exe_basename((argc > 0) ? std::string_view(argv[0]) : std::string_view("cstyle"));

	auto parsed = parse_args(argc, argv);
	if (!parsed)
	{
		print_help(std::cerr, exe);
		return 1;
	}

	auto const& opt = *parsed;

	if (opt.show_help)
	{
		print_help(std::cout, exe);
		return 0;
	}

	if (opt.show_version)
	{
		print_version(std::cout, exe);
		return 0;
	}

	auto files_res = cstyle::collect_sources(opt.target);
	if (!files_res.ok())
	{
		std::cerr << exe << ": error: " << files_res.err() << "\n";
		return 1;
	}

	cstyle::SourceManager sources{};
	cstyle::Diagnostics diag(sources, std::cout);
	diag.set_color_mode(opt.color);

	cstyle::ProcessOptions popt{};
	popt.mode = *opt.fix ? cstyle::Mode::fix : cstyle::Mode::scan;
	popt.emit_diagnostics = !opt.quiet;

	std::size_t failures = 0;
	std::size_t found = 0;
	std::size_t fixed = 0;
	std::size_t remaining = 0;

	for (auto const& path : files_res.value())
	{
		auto res = cstyle::process_file(sources, diag, path, popt);
		if (!res.ok())
		{
			std::cerr << exe << ": error: " << res.err() << "\n";
			++failures;
			continue;
		}

		auto const& outcome = res.value();
		found += outcome.found;
		fixed += outcome.fixed;
		remaining += outcome.remaining;

		if (popt.mode == cstyle::Mode::fix && outcome.written)
			std::cout << outcome.path << ": " << outcome.fixed << " violation(s) fixed\n";
	}

	auto const checked = files_res.value().size();

	if (popt.mode == cstyle::Mode::fix)
		std::cout << exe << ": " << checked << " file(s) checked, " << fixed << " fixed, "
				  << remaining << " remaining\n";
	else
		std::cout << exe << ": " << checked << " file(s) checked, " << found
				  << " violation(s)\n";

	if (failures != 0)
		std::cerr << exe << ": " << failures << " file(s) could not be processed\n";

	return failures == 0 && remaining == 0 ? 0 : 1;
}
