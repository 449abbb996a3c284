#include <algorithm>
#include <utility>
#include <cstyle/Linter.hh>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/rules/BracePlacement.hh>
#include <cstyle/rules/CodeContext.hh>
#include <cstyle/rules/PointerSpacing.hh>

namespace cstyle
{
	std::size_t Report::count(rules::RuleId rule) const noexcept
	{
		return static_cast<std::size_t>(
			std::count_if(violations.begin(), violations.end(),
						  [&](rules::Violation const& v) { return v.rule == rule; }));
	}

	Report scan(std::string_view text)
	{
		auto const spans = lex::classify(text);
		rules::CodeContext ctx(text, spans);

		Report report{};
		report.violations = rules::find_pointer_violations(ctx);

		auto braces = rules::find_brace_violations(ctx);
		report.violations.insert(report.violations.end(), std::make_move_iterator(braces.begin()),
								 std::make_move_iterator(braces.end()));

		std::stable_sort(report.violations.begin(), report.violations.end(), rules::precedes);
		return report;
	}

	AppliedEdits apply_edits(std::string_view text, std::span<const rules::Edit> edits)
	{
		AppliedEdits out{};
		out.text = std::string(text);

		std::ptrdiff_t shift = 0;
		FileByte last_end = 0;
		bool any = false;

		for (std::size_t i = 0; i < edits.size(); ++i)
		{
			auto const& e = edits[i];

			if (e.end < e.begin || e.end > text.size() || (any && e.begin < last_end))
			{
				out.rejected.push_back(i);
				continue;
			}

			auto const at = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(e.begin) + shift);
			out.text.replace(at, e.end - e.begin, e.replacement);

			shift += static_cast<std::ptrdiff_t>(e.replacement.size())
					 - static_cast<std::ptrdiff_t>(e.end - e.begin);
			last_end = e.end;
			any = true;
			++out.applied;
		}

		return out;
	}

	FixResult apply_fixes(std::string_view text, Report report)
	{
		FixResult result{};
		result.report = std::move(report);

		std::vector<rules::Edit> edits{};
		edits.reserve(result.report.violations.size());
		for (auto const& v : result.report.violations)
			edits.push_back(rules::to_edit(v));

		auto applied = apply_edits(text, edits);

		for (auto idx : applied.rejected)
			result.report.skipped.push_back(result.report.violations[idx]);

		result.text = std::move(applied.text);
		return result;
	}

	FixResult fix(std::string_view text)
	{
		return apply_fixes(text, scan(text));
	}

} // namespace cstyle
