#include <cstyle/rules/Violation.hh>

namespace cstyle::rules
{
	std::string_view rule_name(RuleId rule) noexcept
	{
		switch (rule)
		{
			case RuleId::pointer_spacing:
				return "pointer-spacing";
			case RuleId::brace_placement:
				return "brace-placement";
		}
		return "pointer-spacing";
	}

	std::string_view rule_message(RuleId rule) noexcept
	{
		switch (rule)
		{
			case RuleId::pointer_spacing:
				return "put '*' next to the variable name";
			case RuleId::brace_placement:
				return "'{' must be on a new line";
		}
		return "put '*' next to the variable name";
	}

	Edit to_edit(Violation const& v)
	{
		return Edit{v.begin, v.end, v.suggested_text};
	}

	bool precedes(Violation const& a, Violation const& b) noexcept
	{
		if (a.begin != b.begin)
			return a.begin < b.begin;

		return a.end < b.end;
	}

} // namespace cstyle::rules
