#ifndef CSTYLE_LEX_TOKENS_HH
#define CSTYLE_LEX_TOKENS_HH

#include <cstdint>
#include <string_view>
#include <cstyle/support/Span.hh>

namespace cstyle::lex
{
	enum class TokenKind : std::uint16_t
	{
		invalid,

		eof,
		directive,

		identifier,
		number,
		string,
		char_literal,

		lparen,
		rparen,
		lbracket,
		rbracket,
		lbrace,
		rbrace,

		comma,
		semicolon,
		colon,
		question,
		dot,
		arrow,
		ellipsis,

		star,
		amp,
		eq,

		op,
	};

	enum class KeywordClass : std::uint8_t
	{
		none,

		type,
		qualifier,
		storage,
		tag,
		other,
	};

	struct Token
	{
		TokenKind kind{TokenKind::invalid};

		FileByte begin{};
		FileByte end{};

		std::string_view lexeme{};

		[[nodiscard]] constexpr bool is(TokenKind k) const noexcept { return kind == k; }
	};

	[[nodiscard]] std::string_view token_kind_name(TokenKind kind) noexcept;

	// C keyword classification. Identifiers that are not keywords map to none.
	[[nodiscard]] KeywordClass keyword_class(std::string_view word) noexcept;

	[[nodiscard]] inline bool is_plain_identifier(Token const& t) noexcept
	{
		return t.kind == TokenKind::identifier && keyword_class(t.lexeme) == KeywordClass::none;
	}

	[[nodiscard]] inline bool is_keyword(Token const& t, KeywordClass cls) noexcept
	{
		return t.kind == TokenKind::identifier && keyword_class(t.lexeme) == cls;
	}

	[[nodiscard]] inline bool is_opener(TokenKind k) noexcept
	{
		return k == TokenKind::lparen || k == TokenKind::lbracket || k == TokenKind::lbrace;
	}

	[[nodiscard]] inline bool is_closer(TokenKind k) noexcept
	{
		return k == TokenKind::rparen || k == TokenKind::rbracket || k == TokenKind::rbrace;
	}

} // namespace cstyle::lex

#endif /* CSTYLE_LEX_TOKENS_HH */
