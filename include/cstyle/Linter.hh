#ifndef CSTYLE_LINTER_HH
#define CSTYLE_LINTER_HH

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstyle/rules/Violation.hh>

namespace cstyle
{
	struct Report
	{
		// Every violation found, in document order.
		std::vector<rules::Violation> violations{};
		// Violations whose edit overlapped an earlier one and was not applied.
		std::vector<rules::Violation> skipped{};

		[[nodiscard]] std::size_t count() const noexcept { return violations.size(); }
		[[nodiscard]] std::size_t unfixed_count() const noexcept { return skipped.size(); }
		[[nodiscard]] bool empty() const noexcept { return violations.empty(); }

		[[nodiscard]] std::size_t count(rules::RuleId rule) const noexcept;
	};

	struct FixResult
	{
		std::string text{};
		Report report{};
	};

	struct AppliedEdits
	{
		std::string text{};
		std::size_t applied{};
		// Indices into the input edits that overlapped an earlier edit.
		std::vector<std::size_t> rejected{};
	};

	[[nodiscard]] Report scan(std::string_view text);
	[[nodiscard]] FixResult fix(std::string_view text);

	// Applies the edit of every violation in report to text. Violations whose
	// edit overlaps an earlier one are copied to report.skipped.
	[[nodiscard]] FixResult apply_fixes(std::string_view text, Report report);

	// Edits must be sorted by begin offset. An edit that starts before the end
	// of the last applied one is rejected; the rest are applied left to right
	// with each offset shifted by the growth of the edits before it.
	[[nodiscard]] AppliedEdits apply_edits(std::string_view text,
										   std::span<const rules::Edit> edits);

} // namespace cstyle

#endif /* CSTYLE_LINTER_HH */
