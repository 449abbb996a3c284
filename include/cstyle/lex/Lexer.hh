// cstyle/lex/Lexer.hh
#ifndef CSTYLE_LEX_LEXER_HH
#define CSTYLE_LEX_LEXER_HH

#include <span>
#include <string_view>
#include <vector>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/lex/Tokens.hh>

namespace cstyle::lex
{
	// Tokens of the code spans of a classified text. Each string or char span
	// becomes one literal token, comments are skipped, and a preprocessor line
	// becomes a single directive token.
	class Lexer
	{
	public:
		Lexer(std::string_view text, std::span<const Span> spans) noexcept;

		void reset() noexcept;

		[[nodiscard]] Token peek();
		Token next();

	private:
		Token lex_one();

		void skip_spaces() noexcept;

		Token lex_directive(FileByte begin);
		Token lex_identifier(FileByte begin);
		Token lex_number(FileByte begin);
		Token lex_punct(FileByte begin);

		[[nodiscard]] bool at_span_end() const noexcept;
		[[nodiscard]] bool at_line_start(FileByte offset) const noexcept;
		[[nodiscard]] char cur() const noexcept;
		[[nodiscard]] char peek_char(FileByte rel = 1) const noexcept;

		void advance(FileByte n = 1) noexcept;

		[[nodiscard]] Token make(TokenKind kind, FileByte begin, FileByte end) const noexcept;

		std::string_view m_input{};
		std::span<const Span> m_spans{};

		std::size_t m_span{};
		FileByte m_off{};

		bool m_has_peek{};
		Token m_peeked{};
	};

	[[nodiscard]] std::vector<Token> tokenize(std::string_view text, std::span<const Span> spans);

} // namespace cstyle::lex

#endif /* CSTYLE_LEX_LEXER_HH */
