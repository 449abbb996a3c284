#include <algorithm>
#include <string>
#include <cstyle/rules/PointerSpacing.hh>
#include <cstyle/support/Ctype.hh>

namespace cstyle::rules
{
	using lex::KeywordClass;
	using lex::TokenKind;

	namespace
	{
		constexpr auto npos = CodeContext::npos;

		struct StarChain
		{
			std::size_t first{};
			std::size_t last{};
		};

		[[nodiscard]] bool only_spaces(std::string_view s) noexcept
		{
			return std::all_of(s.begin(), s.end(), [](char c) { return is_space(c); });
		}

		[[nodiscard]] bool has_newline(std::string_view s) noexcept
		{
			return s.find('\n') != std::string_view::npos;
		}

		[[nodiscard]] bool is_name_like(lex::Token const& t) noexcept
		{
			if (t.kind != TokenKind::identifier)
				return false;

			auto cls = lex::keyword_class(t.lexeme);
			return cls == KeywordClass::none || cls == KeywordClass::qualifier;
		}

		// "(*name)(...)", "(*name)[...]", "(*)(...)", and "(*name(params))(...)".
		[[nodiscard]] bool is_grouped_declarator(CodeContext const& ctx, std::size_t open,
												 std::size_t next) noexcept
		{
			auto close = ctx.match(open);
			if (close == npos || open == 0 || !ctx.is_type_position(open - 1))
				return false;

			auto k = next;
			if (k < close && lex::is_plain_identifier(ctx.token(k)))
			{
				++k;
				while (k < close && (ctx.is(k, TokenKind::lparen) || ctx.is(k, TokenKind::lbracket))
					   && ctx.match(k) != npos)
					k = ctx.match(k) + 1;
			}

			if (k != close)
				return false;

			return ctx.is(close + 1, TokenKind::lparen) || ctx.is(close + 1, TokenKind::lbracket);
		}

		[[nodiscard]] bool is_declarator(CodeContext const& ctx, std::size_t prev, std::size_t next)
		{
			if (next >= ctx.size())
				return false;

			auto const& p = ctx.token(prev);
			auto const& n = ctx.token(next);

			switch (p.kind)
			{
				case TokenKind::identifier:
				{
					auto cls = lex::keyword_class(p.lexeme);

					if (cls == KeywordClass::type || cls == KeywordClass::qualifier)
					{
						switch (n.kind)
						{
							case TokenKind::lparen:
							case TokenKind::rparen:
							case TokenKind::lbracket:
							case TokenKind::comma:
								return true;
							default:
								return is_name_like(n);
						}
					}

					if (cls != KeywordClass::none)
						return false;

					// "(T *)" and "f(T *, int)": '*' cannot be binary before ')' or ','.
					if (n.kind == TokenKind::rparen || n.kind == TokenKind::comma)
						return true;

					if (!is_name_like(n) || !ctx.starts_declaration(prev))
						return false;

					if (lex::is_keyword(n, KeywordClass::qualifier))
						return true;

					return ctx.declarator_tail_ok(next);
				}

				case TokenKind::lparen:
					return is_grouped_declarator(ctx, prev, next);

				case TokenKind::comma:
					return lex::is_plain_identifier(n) && ctx.declarator_tail_ok(next)
						   && ctx.statement_is_declaration(prev);

				default:
					return false;
			}
		}

		[[nodiscard]] std::vector<StarChain> star_chains(CodeContext const& ctx)
		{
			std::vector<StarChain> chains{};

			for (std::size_t i = 0; i < ctx.size(); ++i)
			{
				if (!ctx.is(i, TokenKind::star))
					continue;

				auto last = i;
				while (ctx.is(last + 1, TokenKind::star) && only_spaces(ctx.gap(last, last + 1))
					   && !has_newline(ctx.gap(last, last + 1)))
					++last;

				chains.push_back(StarChain{i, last});
				i = last;
			}

			return chains;
		}

	} // namespace

	std::vector<Violation> find_pointer_violations(CodeContext const& ctx)
	{
		std::vector<Violation> out{};
		auto const text = ctx.text();

		for (auto const& chain : star_chains(ctx))
		{
			if (chain.first == 0)
				continue;

			auto const prev = chain.first - 1;
			auto const next = chain.last + 1;

			if (!is_declarator(ctx, prev, next))
				continue;

			auto const before = ctx.gap(prev, chain.first);
			auto const after = ctx.gap(chain.last, next);
			if (!only_spaces(before) || !only_spaces(after))
				continue;

			std::string suggested{};
			if (has_newline(before))
				suggested.append(before);
			else if (!ctx.is(prev, TokenKind::lparen))
				suggested.push_back(' ');

			suggested.append(chain.last - chain.first + 1, '*');

			if (has_newline(after))
				suggested.append(after);

			auto const begin = ctx.token(prev).end;
			auto const end = ctx.token(next).begin;
			auto const original = text.substr(begin, end - begin);

			if (original == suggested)
				continue;

			auto const pos = ctx.position(ctx.token(chain.first).begin);

			Violation v{};
			v.rule = RuleId::pointer_spacing;
			v.at = ctx.token(chain.first).begin;
			v.line = pos.line;
			v.column = pos.column;
			v.begin = begin;
			v.end = end;
			v.original_text = std::string(original);
			v.suggested_text = std::move(suggested);
			out.push_back(std::move(v));
		}

		return out;
	}

	std::vector<Violation> find_pointer_violations(std::string_view text,
												   std::span<const lex::Span> spans)
	{
		CodeContext ctx(text, spans);
		return find_pointer_violations(ctx);
	}

} // namespace cstyle::rules
