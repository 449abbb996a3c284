#include <string>
#include <cstyle/rules/BracePlacement.hh>
#include <cstyle/support/Ctype.hh>

namespace cstyle::rules
{
	using lex::TokenKind;

	namespace
	{
		constexpr auto npos = CodeContext::npos;

		[[nodiscard]] std::string_view leading_blanks(std::string_view line) noexcept
		{
			std::size_t n = 0;
			while (n < line.size() && is_blank(line[n]))
				++n;

			return line.substr(0, n);
		}

		// The line holding the keyword or name that owns "(...) {", else the brace's own line.
		[[nodiscard]] std::size_t controlling_line(CodeContext const& ctx, std::size_t brace)
		{
			auto line = ctx.position(ctx.token(brace).begin).line;

			auto p = ctx.prev_code(brace);
			if (p == npos || !ctx.is(p, TokenKind::rparen))
				return line;

			auto open = ctx.match(p);
			if (open == npos)
				return line;

			auto owner = ctx.prev_code(open);
			if (owner != npos && ctx.is(owner, TokenKind::identifier))
				return ctx.position(ctx.token(owner).begin).line;

			return ctx.position(ctx.token(open).begin).line;
		}

		[[nodiscard]] std::string_view line_break_for(std::string_view text, FileByte at) noexcept
		{
			auto nl = text.find('\n', at);
			if (nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r')
				return "\r\n";

			return "\n";
		}

	} // namespace

	std::vector<Violation> find_brace_violations(CodeContext const& ctx)
	{
		std::vector<Violation> out{};
		auto const text = ctx.text();

		for (std::size_t i = 0; i < ctx.size(); ++i)
		{
			if (!ctx.is(i, TokenKind::lbrace) || ctx.brace_role(i) != BraceRole::block)
				continue;

			auto const& brace = ctx.token(i);

			auto begin = brace.begin;
			while (begin > 0 && is_blank(text[begin - 1]))
				--begin;

			if (begin == 0 || text[begin - 1] == '\n')
				continue;

			// Only code on the line counts; a '{' after a lone comment is left alone.
			auto p = ctx.prev_code(i);
			if (p == npos || ctx.gap(p, i).find('\n') != std::string_view::npos)
				continue;

			auto end = brace.end;
			auto rest = end;
			while (rest < text.size() && is_blank(text[rest]))
				++rest;

			if (rest == text.size() || text[rest] == '\n'
				|| (text[rest] == '\r' && rest + 1 < text.size() && text[rest + 1] == '\n'))
				end = rest;

			auto const indent = leading_blanks(ctx.lines().line_view(controlling_line(ctx, i)));

			std::string suggested{};
			suggested.append(line_break_for(text, brace.begin));
			suggested.append(indent);
			suggested.push_back('{');

			auto const pos = ctx.position(brace.begin);

			Violation v{};
			v.rule = RuleId::brace_placement;
			v.at = brace.begin;
			v.line = pos.line;
			v.column = pos.column;
			v.begin = begin;
			v.end = end;
			v.original_text = std::string(text.substr(begin, end - begin));
			v.suggested_text = std::move(suggested);
			out.push_back(std::move(v));
		}

		return out;
	}

	std::vector<Violation> find_brace_violations(std::string_view text,
												 std::span<const lex::Span> spans)
	{
		CodeContext ctx(text, spans);
		return find_brace_violations(ctx);
	}

} // namespace cstyle::rules
