#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <cstyle/Linter.hh>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/rules/BracePlacement.hh>

namespace
{
	using cstyle::rules::Violation;

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	[[nodiscard]] std::vector<Violation> brace_violations(std::string_view text)
	{
		auto const spans = cstyle::lex::classify(text);
		return cstyle::rules::find_brace_violations(text, spans);
	}

	[[nodiscard]] std::string brace_fix(std::string_view text)
	{
		std::vector<cstyle::rules::Edit> edits{};
		for (auto const& v : brace_violations(text))
			edits.push_back(cstyle::rules::to_edit(v));

		return cstyle::apply_edits(text, edits).text;
	}

	struct Case
	{
		std::string_view name{};
		std::string_view input{};
		std::string_view fixed{};
	};

	int run_cases()
	{
		static constexpr Case cases[] = {
			// Moved to their own line.
			{"function", "int main() {\n\treturn 0;\n}\n", "int main()\n{\n\treturn 0;\n}\n"},
			{"trailing blanks dropped", "void f(void) {  \n}\n", "void f(void)\n{\n}\n"},
			{"if", "\tif (x) {\n\t\ty();\n\t}\n", "\tif (x)\n\t{\n\t\ty();\n\t}\n"},
			{"spaces indent", "    while (n--) {\n    }\n", "    while (n--)\n    {\n    }\n"},
			{"else", "\t} else {\n", "\t} else\n\t{\n"},
			{"struct", "struct point {\n\tint x;\n};\n", "struct point\n{\n\tint x;\n};\n"},
			{"typedef struct", "typedef struct {\n\tint x;\n} p_t;\n",
			 "typedef struct\n{\n\tint x;\n} p_t;\n"},
			{"do", "do {\n} while (0);\n", "do\n{\n} while (0);\n"},
			{"switch", "switch (c) {\n}\n", "switch (c)\n{\n}\n"},
			{"no space", "if (x){\n}\n", "if (x)\n{\n}\n"},
			{"code after brace", "if (x) { y(); }\n", "if (x)\n{ y(); }\n"},
			{"comment after brace", "if (x) { // why\n}\n", "if (x)\n{ // why\n}\n"},
			{"wrapped condition", "\tif (a &&\n\t    b) {\n\t}\n", "\tif (a &&\n\t    b)\n\t{\n\t}\n"},
			{"crlf", "int main() {\r\n}\r\n", "int main()\r\n{\r\n}\r\n"},
			{"end of file", "void f(void) {", "void f(void)\n{"},
			{"pointer return", "char *f(void) {\n}\n", "char *f(void)\n{\n}\n"},

			// Left alone.
			{"already allman", "int main()\n{\n\treturn 0;\n}\n", "int main()\n{\n\treturn 0;\n}\n"},
			{"indented allman", "\tif (x)\n\t{\n\t}\n", "\tif (x)\n\t{\n\t}\n"},
			{"array initializer", "int a[] = {1, 2, 3};\n", "int a[] = {1, 2, 3};\n"},
			{"struct initializer", "struct p q = { .x = 1, .y = { 2 } };\n",
			 "struct p q = { .x = 1, .y = { 2 } };\n"},
			{"nested initializer", "int m[2][2] = {{1, 2}, {3, 4}};\n",
			 "int m[2][2] = {{1, 2}, {3, 4}};\n"},
			{"compound literal", "p = (struct pt){1, 2};\n", "p = (struct pt){1, 2};\n"},
			{"literal argument", "f((int[]){1, 2});\n", "f((int[]){1, 2});\n"},
			{"return literal", "return (struct pt){0};\n", "return (struct pt){0};\n"},
			{"string", "s = \"if (x) {\";\n", "s = \"if (x) {\";\n"},
			{"char", "c = '{';\n", "c = '{';\n"},
			{"comment", "// int main() {\n/* if (x) { */\n", "// int main() {\n/* if (x) { */\n"},
			{"directive", "#define BLOCK(x) do { x; } while (0)\n",
			 "#define BLOCK(x) do { x; } while (0)\n"},
			{"closing brace", "}\n", "}\n"},
			{"brace after comment line", "if (x)\n/* c */ {\n}\n", "if (x)\n/* c */ {\n}\n"},
		};

		int failures = 0;

		for (auto const& c : cases)
		{
			auto const got = brace_fix(c.input);
			if (!check(got == c.fixed, c.name))
			{
				std::cerr << "  expected: " << c.fixed << "\n  got:      " << got << "\n";
				++failures;
			}

			if (c.input == c.fixed)
				failures += !check(brace_violations(c.input).empty(),
								   std::string(c.name) + ": nothing reported");
		}

		return failures;
	}

	int run_details()
	{
		int failures = 0;

		{
			std::string_view text = "int main() {\n}\n";
			auto const vs = brace_violations(text);
			failures += !check(vs.size() == 1, "one violation");
			if (vs.size() == 1)
			{
				auto const& v = vs[0];
				failures += !check(v.rule == cstyle::rules::RuleId::brace_placement, "rule id");
				failures += !check(v.line == 1 && v.column == 12, "location of the brace");
				failures += !check(v.at == 11, "offset of the brace");
				failures += !check(v.original_text == " {", "original text");
				failures += !check(v.suggested_text == "\n{", "suggested text");
			}
		}

		{
			std::string_view text = "void f(void) {\n\tif (a) {\n\t\tfor (;;) {\n\t\t}\n\t}\n}\n";
			auto const fixed = brace_fix(text);
			failures += !check(brace_violations(text).size() == 3, "three nested blocks");
			failures += !check(fixed
								   == "void f(void)\n{\n\tif (a)\n\t{\n\t\tfor (;;)\n\t\t{\n"
									  "\t\t}\n\t}\n}\n",
							   "nested blocks keep their indentation");
			failures += !check(brace_violations(fixed).empty(), "fix is idempotent");
		}

		return failures;
	}

} // namespace

int main()
{
	int failures = 0;

	failures += run_cases();
	failures += run_details();

	if (failures == 0)
	{
		std::cout << "brace placement tests passed\n";
		return 0;
	}

	std::cerr << failures << " brace placement test(s) failed\n";
	return 1;
}
