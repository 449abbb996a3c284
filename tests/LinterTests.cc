#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstyle/Linter.hh>

namespace
{
	using cstyle::rules::Edit;
	using cstyle::rules::RuleId;

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	struct FixCase
	{
		std::string_view name{};
		std::string_view input{};
		std::string_view fixed{};
		std::size_t count{};
	};

	int run_fix_cases()
	{
		static constexpr FixCase cases[] = {
			{"star after type", "int* ptr;", "int *ptr;", 1},
			{"no spaces", "int*ptr;", "int *ptr;", 1},
			{"spaces both sides", "char * str;", "char *str;", 1},
			{"allman unchanged", "if (x)\n{\n    y();\n}\n", "if (x)\n{\n    y();\n}\n", 0},
			{"k&r brace", "if (x) {\n    y();\n}\n", "if (x)\n{\n    y();\n}\n", 1},
			{"both rules on one line", "char* name(int* id) {\n}\n",
			 "char *name(int *id)\n{\n}\n", 3},
			{"empty", "", "", 0},
			{"only comments", "/* int* p; if (x) { */\n", "/* int* p; if (x) { */\n", 0},
		};

		int failures = 0;

		for (auto const& c : cases)
		{
			auto const result = cstyle::fix(c.input);

			if (!check(result.text == c.fixed, c.name))
			{
				std::cerr << "  expected: " << c.fixed << "\n  got:      " << result.text << "\n";
				++failures;
			}

			failures += !check(result.report.count() == c.count,
							   std::string(c.name) + ": violation count");
			failures += !check(result.report.skipped.empty(),
							   std::string(c.name) + ": nothing skipped");
			failures += !check(cstyle::scan(result.text).empty(),
							   std::string(c.name) + ": fixed text is clean");
			failures += !check(cstyle::fix(result.text).text == result.text,
							   std::string(c.name) + ": fix is idempotent");
		}

		return failures;
	}

	int run_scan()
	{
		int failures = 0;

		std::string_view text = "int main() {\n\tchar* s = 0;\n\treturn 0;\n}\n";
		auto const report = cstyle::scan(text);

		failures += !check(report.count() == 2, "two violations");
		failures += !check(report.count(RuleId::pointer_spacing) == 1, "one pointer violation");
		failures += !check(report.count(RuleId::brace_placement) == 1, "one brace violation");
		failures += !check(report.unfixed_count() == 0, "scan skips nothing");

		if (report.count() == 2)
		{
			failures += !check(report.violations[0].rule == RuleId::brace_placement,
							   "brace comes first in the document");
			failures += !check(report.violations[1].line == 2, "pointer on line two");
		}

		failures += !check(cstyle::scan(text).count() == report.count(), "scan is repeatable");

		return failures;
	}

	int run_apply_edits()
	{
		int failures = 0;

		{
			std::vector<Edit> edits{
				Edit{0, 1, "AAA"},
				Edit{2, 3, ""},
				Edit{4, 4, "!"},
			};
			auto const out = cstyle::apply_edits("abcde", edits);
			failures += !check(out.text == "AAAbd!e", "offsets shift after growth and shrink");
			failures += !check(out.applied == 3 && out.rejected.empty(), "all applied");
		}

		{
			std::vector<Edit> edits{
				Edit{0, 3, "x"},
				Edit{2, 4, "y"},
				Edit{4, 5, "z"},
			};
			auto const out = cstyle::apply_edits("abcde", edits);
			failures += !check(out.text == "xdz", "overlapping edit dropped");
			failures += !check(out.applied == 2, "two applied");
			failures += !check(out.rejected.size() == 1 && out.rejected[0] == 1,
							   "second edit rejected");
		}

		{
			std::vector<Edit> edits{
				Edit{1, 2, "B"},
				Edit{2, 3, "C"},
			};
			auto const out = cstyle::apply_edits("abc", edits);
			failures += !check(out.text == "aBC", "adjacent edits both apply");
		}

		{
			std::vector<Edit> edits{
				Edit{1, 9, "x"},
			};
			auto const out = cstyle::apply_edits("abc", edits);
			failures += !check(out.text == "abc" && out.rejected.size() == 1,
							   "out of range edit rejected");
		}

		{
			auto const out = cstyle::apply_edits("abc", {});
			failures += !check(out.text == "abc" && out.applied == 0, "no edits");
		}

		return failures;
	}

	int run_apply_fixes()
	{
		auto violation = [](RuleId rule, cstyle::FileByte begin, cstyle::FileByte end,
							std::string suggested) {
			cstyle::rules::Violation v{};
			v.rule = rule;
			v.at = begin;
			v.begin = begin;
			v.end = end;
			v.suggested_text = std::move(suggested);
			return v;
		};

		cstyle::Report report{};
		report.violations.push_back(violation(RuleId::brace_placement, 0, 3, "X"));
		report.violations.push_back(violation(RuleId::pointer_spacing, 2, 4, "Y"));
		report.violations.push_back(violation(RuleId::pointer_spacing, 4, 5, "Z"));

		auto const result = cstyle::apply_fixes("abcdef", report);

		int failures = 0;
		failures += !check(result.text == "XdZf", "overlapping fix left out of the text");
		failures += !check(result.report.count() == 3, "all violations kept in the report");
		failures += !check(result.report.unfixed_count() == 1, "one fix skipped");

		if (result.report.unfixed_count() == 1)
		{
			auto const& s = result.report.skipped[0];
			failures += !check(s.rule == RuleId::pointer_spacing && s.begin == 2 && s.end == 4,
							   "the later-starting fix is the skipped one");
		}

		auto const clean = cstyle::apply_fixes("int* p;\n", cstyle::scan("int* p;\n"));
		failures += !check(clean.text == "int *p;\n" && clean.report.skipped.empty(),
						   "scanned fixes apply like fix()");

		return failures;
	}

} // namespace

int main()
{
	int failures = 0;

	failures += run_fix_cases();
	failures += run_scan();
	failures += run_apply_edits();
	failures += run_apply_fixes();

	if (failures == 0)
	{
		std::cout << "linter tests passed\n";
		return 0;
	}

	std::cerr << failures << " linter test(s) failed\n";
	return 1;
}
