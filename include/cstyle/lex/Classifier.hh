// cstyle/lex/Classifier.hh
#ifndef CSTYLE_LEX_CLASSIFIER_HH
#define CSTYLE_LEX_CLASSIFIER_HH

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <cstyle/support/Span.hh>

namespace cstyle::lex
{
	enum class SpanKind : std::uint8_t
	{
		code,
		string,
		char_literal,
		line_comment,
		block_comment,
	};

	struct Span
	{
		SpanKind kind{SpanKind::code};
		FileByte begin{};
		FileByte end{};

		[[nodiscard]] constexpr FileByte size() const noexcept { return end - begin; }
		[[nodiscard]] constexpr bool is_code() const noexcept { return kind == SpanKind::code; }

		constexpr bool operator==(const Span&) const = default;
	};

	[[nodiscard]] std::string_view span_kind_name(SpanKind kind) noexcept;

	// Splits C source text into code, literal and comment spans. The spans are
	// contiguous, never empty, and cover the whole text. Unterminated literals
	// and comments end at the end of the text.
	class Classifier
	{
	public:
		explicit Classifier(std::string_view text) noexcept;

		void reset() noexcept;

		[[nodiscard]] bool done() const noexcept { return m_off >= m_input.size(); }

		std::optional<Span> next() noexcept;

	private:
		[[nodiscard]] char cur() const noexcept;
		[[nodiscard]] char peek_char(FileByte rel = 1) const noexcept;

		void advance(FileByte n = 1) noexcept;

		void scan_code() noexcept;
		void scan_quoted(char quote) noexcept;
		void scan_line_comment() noexcept;
		void scan_block_comment() noexcept;

		std::string_view m_input{};
		FileByte m_off{};
	};

	[[nodiscard]] std::vector<Span> classify(std::string_view text);

} // namespace cstyle::lex

#endif /* CSTYLE_LEX_CLASSIFIER_HH */
