#ifndef CSTYLE_RULES_BRACE_PLACEMENT_HH
#define CSTYLE_RULES_BRACE_PLACEMENT_HH

#include <span>
#include <string_view>
#include <vector>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/rules/CodeContext.hh>
#include <cstyle/rules/Violation.hh>

namespace cstyle::rules
{
	// A '{' that opens a block must start its own line. Initializer braces are
	// exempt, closing braces are never touched, and whatever follows the '{'
	// on its line stays with it.
	[[nodiscard]] std::vector<Violation> find_brace_violations(CodeContext const& ctx);

	[[nodiscard]] std::vector<Violation> find_brace_violations(std::string_view text,
															   std::span<const lex::Span> spans);

} // namespace cstyle::rules

#endif /* CSTYLE_RULES_BRACE_PLACEMENT_HH */
