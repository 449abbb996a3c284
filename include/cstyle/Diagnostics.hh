#ifndef CSTYLE_DIAGNOSTICS_HH
#define CSTYLE_DIAGNOSTICS_HH

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include <cstyle/support/SourceManager.hh>
#include <cstyle/support/Span.hh>

namespace cstyle
{
	enum class ColorMode
	{
		auto_detect,
		always,
		never,
	};

	enum class AdviceKind
	{
		note,
		help,
	};

	struct DiagnosticAdvice
	{
		AdviceKind kind{AdviceKind::note};
		std::string message{};
	};

	struct DiagnosticFixIt
	{
		SourceSpan span{};
		std::string replacement{};
		std::string message{};
	};

	// A warning at primary. Every diagnostic cstyle emits is a rule violation.
	struct Diagnostic
	{
		std::string message{};
		// Rule name shown as "[code]" after the message; empty for none.
		std::string code{};
		SourceSpan primary{};

		std::vector<DiagnosticAdvice> advices{};
		std::vector<DiagnosticFixIt> fixits{};
	};

	class Diagnostics
	{
	public:
		explicit Diagnostics(SourceManager const& sources, std::ostream& out) noexcept;

		void set_color_mode(ColorMode mode) noexcept;
		[[nodiscard]] ColorMode color_mode() const noexcept;

		void emit(Diagnostic const& diag);

		[[nodiscard]] std::size_t warning_count() const noexcept;

	private:
		void emit_header(Diagnostic const& diag);
		void emit_snippet(Diagnostic const& diag);
		void emit_fixit(DiagnosticFixIt const& fx);

		[[nodiscard]] bool use_color() const noexcept;

		SourceManager const* m_sources{};
		std::ostream* m_out{};

		ColorMode m_color_mode{ColorMode::auto_detect};

		std::size_t m_warnings{};

		bool m_need_separator{};
	};

} // namespace cstyle

#endif /* CSTYLE_DIAGNOSTICS_HH */
