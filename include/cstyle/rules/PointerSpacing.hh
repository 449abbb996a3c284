#ifndef CSTYLE_RULES_POINTER_SPACING_HH
#define CSTYLE_RULES_POINTER_SPACING_HH

#include <span>
#include <string_view>
#include <vector>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/rules/CodeContext.hh>
#include <cstyle/rules/Violation.hh>

namespace cstyle::rules
{
	// Declarator stars must read "T *name": one blank before the run of '*'
	// (none after '('), none inside it, none between it and the name. Every
	// run is judged on its own, so "int *a, * b" and "char * const * p" yield
	// one violation per misplaced run.
	[[nodiscard]] std::vector<Violation> find_pointer_violations(CodeContext const& ctx);

	[[nodiscard]] std::vector<Violation> find_pointer_violations(std::string_view text,
																 std::span<const lex::Span> spans);

} // namespace cstyle::rules

#endif /* CSTYLE_RULES_POINTER_SPACING_HH */
