#ifndef CSTYLE_RULES_VIOLATION_HH
#define CSTYLE_RULES_VIOLATION_HH

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <cstyle/support/Span.hh>

namespace cstyle::rules
{
	enum class RuleId : std::uint8_t
	{
		pointer_spacing,
		brace_placement,
	};

	[[nodiscard]] std::string_view rule_name(RuleId rule) noexcept;
	[[nodiscard]] std::string_view rule_message(RuleId rule) noexcept;

	// One rule violation. [begin, end) is the byte range that suggested_text
	// replaces; at, line and column locate the offending '*' or '{'.
	struct Violation
	{
		RuleId rule{RuleId::pointer_spacing};

		FileByte at{};
		std::size_t line{1};
		std::size_t column{1};

		FileByte begin{};
		FileByte end{};

		std::string original_text{};
		std::string suggested_text{};
	};

	struct Edit
	{
		FileByte begin{};
		FileByte end{};
		std::string replacement{};
	};

	[[nodiscard]] Edit to_edit(Violation const& v);

	// Document order, then the shorter range first.
	[[nodiscard]] bool precedes(Violation const& a, Violation const& b) noexcept;

} // namespace cstyle::rules

#endif /* CSTYLE_RULES_VIOLATION_HH */
