#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <cstyle/Diagnostics.hh>
#include <cstyle/Linter.hh>
#include <cstyle/Workspace.hh>
#include <cstyle/support/SourceManager.hh>

namespace
{
	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool check_text(std::string const& got, std::string_view expected, std::string_view msg)
	{
		if (got == expected)
			return true;

		std::cerr << "FAIL: " << msg << "\n--- expected\n" << expected << "--- got\n" << got;
		return false;
	}

	int run_pointer_report()
	{
		cstyle::SourceManager sources{};
		std::ostringstream out{};
		cstyle::Diagnostics diag(sources, out);
		diag.set_color_mode(cstyle::ColorMode::never);

		auto const id = sources.add_virtual("t.c", "int* p;\n");
		cstyle::emit_report(diag, sources, id, cstyle::scan(sources.content(id)));

		int failures = 0;

		failures += !check_text(out.str(),
								"t.c:1:4: warning: put '*' next to the variable name [pointer-spacing]\n"
								"  |\n"
								" 1 | int* p;\n"
								"  |     ^\n"
								"  = help: attach '*' to the name (t.c:1:4)\n"
								"  |\n"
								"  | - int* p;\n"
								"  | + int *p;\n",
								"pointer diagnostic");

		failures += !check(diag.warning_count() == 1, "one warning counted");
		return failures;
	}

	int run_brace_report()
	{
		cstyle::SourceManager sources{};
		std::ostringstream out{};
		cstyle::Diagnostics diag(sources, out);
		diag.set_color_mode(cstyle::ColorMode::never);

		auto const id = sources.add_virtual("b.c", "int main() {\n}\n");
		cstyle::emit_report(diag, sources, id, cstyle::scan(sources.content(id)));

		return !check_text(out.str(),
						   "b.c:1:12: warning: '{' must be on a new line [brace-placement]\n"
						   "  |\n"
						   " 1 | int main() {\n"
						   "  |             ^\n"
						   "  = help: move '{' to its own line (b.c:1:11)\n"
						   "  |\n"
						   "  | - int main() {\n"
						   "  | + int main()\n"
						   "  | + {\n",
						   "brace diagnostic");
	}

	int run_tabs_and_separators()
	{
		cstyle::SourceManager sources{};
		std::ostringstream out{};
		cstyle::Diagnostics diag(sources, out);
		diag.set_color_mode(cstyle::ColorMode::never);

		auto const id = sources.add_virtual("s.c", "\tint* a;\n\tint* b;\n");
		cstyle::emit_report(diag, sources, id, cstyle::scan(sources.content(id)));

		auto const text = out.str();

		int failures = 0;
		failures += !check(diag.warning_count() == 2, "two warnings");
		failures += !check(text.find(" 1 |     int* a;\n") != std::string::npos, "tabs expanded");
		failures += !check(text.find("  |         ^\n") != std::string::npos,
						   "caret under the expanded column");
		failures += !check(text.find("\n\ns.c:2:5: warning:") != std::string::npos,
						   "blank line between diagnostics");
		return failures;
	}

	int run_color()
	{
		cstyle::SourceManager sources{};
		std::ostringstream out{};
		cstyle::Diagnostics diag(sources, out);

		auto const id = sources.add_virtual("c.c", "int* p;\n");
		auto const report = cstyle::scan(sources.content(id));

		int failures = 0;

		diag.set_color_mode(cstyle::ColorMode::auto_detect);
		cstyle::emit_report(diag, sources, id, report);
		failures += !check(out.str().find('\x1b') == std::string::npos,
						   "string streams are never colored in auto mode");

		out.str(std::string{});
		diag.set_color_mode(cstyle::ColorMode::always);
		failures += !check(diag.color_mode() == cstyle::ColorMode::always, "mode stored");
		cstyle::emit_report(diag, sources, id, report);
		failures += !check(out.str().find("\x1b[33m") != std::string::npos, "warning colored");

		return failures;
	}

	int run_skipped_note()
	{
		cstyle::SourceManager sources{};
		std::ostringstream out{};
		cstyle::Diagnostics diag(sources, out);
		diag.set_color_mode(cstyle::ColorMode::never);

		auto const id = sources.add_virtual("k.c", "int* p;\n");

		cstyle::Report report = cstyle::scan(sources.content(id));
		report.skipped = report.violations;

		int failures = 0;

		cstyle::emit_report(diag, sources, id, report);
		failures += !check(out.str().find("= note:") == std::string::npos,
						   "plain warnings carry no note");

		out.str(std::string{});
		cstyle::emit_skipped(diag, sources, id, report);
		failures += !check_text(out.str(),
								"\n"
								"k.c:1:4: warning: put '*' next to the variable name [pointer-spacing]\n"
								"  |\n"
								" 1 | int* p;\n"
								"  |     ^\n"
								"  = note: this fix overlaps another edit and was not applied\n"
								"  = help: attach '*' to the name (k.c:1:4)\n"
								"  |\n"
								"  | - int* p;\n"
								"  | + int *p;\n",
								"skipped fixes carry a note");
		failures += !check(diag.warning_count() == 2, "skipped fixes count as warnings");

		return failures;
	}

} // namespace

int main()
{
	int failures = 0;

	failures += run_pointer_report();
	failures += run_brace_report();
	failures += run_tabs_and_separators();
	failures += run_color();
	failures += run_skipped_note();

	if (failures == 0)
	{
		std::cout << "diagnostics tests passed\n";
		return 0;
	}

	std::cerr << failures << " diagnostics test(s) failed\n";
	return 1;
}
