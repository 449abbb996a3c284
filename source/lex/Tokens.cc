#include <array>
#include <cstyle/lex/Tokens.hh>

namespace cstyle::lex
{
	namespace
	{
		struct KeywordEntry
		{
			std::string_view word{};
			KeywordClass cls{KeywordClass::none};
		};

		constexpr auto keywords = std::to_array<KeywordEntry>({
			{"void", KeywordClass::type},
			{"char", KeywordClass::type},
			{"short", KeywordClass::type},
			{"int", KeywordClass::type},
			{"long", KeywordClass::type},
			{"float", KeywordClass::type},
			{"double", KeywordClass::type},
			{"signed", KeywordClass::type},
			{"unsigned", KeywordClass::type},
			{"bool", KeywordClass::type},
			{"_Bool", KeywordClass::type},
			{"_Complex", KeywordClass::type},

			{"const", KeywordClass::qualifier},
			{"volatile", KeywordClass::qualifier},
			{"restrict", KeywordClass::qualifier},
			{"__restrict", KeywordClass::qualifier},
			{"_Atomic", KeywordClass::qualifier},

			{"static", KeywordClass::storage},
			{"extern", KeywordClass::storage},
			{"auto", KeywordClass::storage},
			{"register", KeywordClass::storage},
			{"typedef", KeywordClass::storage},
			{"inline", KeywordClass::storage},
			{"_Thread_local", KeywordClass::storage},
			{"thread_local", KeywordClass::storage},

			{"struct", KeywordClass::tag},
			{"union", KeywordClass::tag},
			{"enum", KeywordClass::tag},

			{"if", KeywordClass::other},
			{"else", KeywordClass::other},
			{"for", KeywordClass::other},
			{"while", KeywordClass::other},
			{"do", KeywordClass::other},
			{"switch", KeywordClass::other},
			{"case", KeywordClass::other},
			{"default", KeywordClass::other},
			{"break", KeywordClass::other},
			{"continue", KeywordClass::other},
			{"goto", KeywordClass::other},
			{"return", KeywordClass::other},
			{"sizeof", KeywordClass::other},
			{"alignof", KeywordClass::other},
			{"_Alignof", KeywordClass::other},
			{"_Alignas", KeywordClass::other},
			{"_Generic", KeywordClass::other},
			{"_Static_assert", KeywordClass::other},
			{"static_assert", KeywordClass::other},
		});
	} // namespace

	KeywordClass keyword_class(std::string_view word) noexcept
	{
		for (auto const& k : keywords)
			if (k.word == word)
				return k.cls;

		return KeywordClass::none;
	}

	std::string_view token_kind_name(TokenKind kind) noexcept
	{
		switch (kind)
		{
			case TokenKind::invalid:
				return "invalid";
			case TokenKind::eof:
				return "eof";
			case TokenKind::directive:
				return "directive";
			case TokenKind::identifier:
				return "identifier";
			case TokenKind::number:
				return "number";
			case TokenKind::string:
				return "string";
			case TokenKind::char_literal:
				return "char";
			case TokenKind::lparen:
				return "(";
			case TokenKind::rparen:
				return ")";
			case TokenKind::lbracket:
				return "[";
			case TokenKind::rbracket:
				return "]";
			case TokenKind::lbrace:
				return "{";
			case TokenKind::rbrace:
				return "}";
			case TokenKind::comma:
				return ",";
			case TokenKind::semicolon:
				return ";";
			case TokenKind::colon:
				return ":";
			case TokenKind::question:
				return "?";
			case TokenKind::dot:
				return ".";
			case TokenKind::arrow:
				return "->";
			case TokenKind::ellipsis:
				return "...";
			case TokenKind::star:
				return "*";
			case TokenKind::amp:
				return "&";
			case TokenKind::eq:
				return "=";
			case TokenKind::op:
				return "operator";
		}
		return "invalid";
	}

} // namespace cstyle::lex
