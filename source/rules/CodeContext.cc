#include <cstyle/lex/Lexer.hh>
#include <cstyle/rules/CodeContext.hh>

namespace cstyle::rules
{
	using lex::KeywordClass;
	using lex::TokenKind;

	namespace
	{
		[[nodiscard]] TokenKind opener_for(TokenKind closer) noexcept
		{
			switch (closer)
			{
				case TokenKind::rparen:
					return TokenKind::lparen;
				case TokenKind::rbracket:
					return TokenKind::lbracket;
				case TokenKind::rbrace:
					return TokenKind::lbrace;
				default:
					return TokenKind::invalid;
			}
		}

		[[nodiscard]] bool is_specifier(lex::Token const& t) noexcept
		{
			if (t.kind != TokenKind::identifier)
				return false;

			auto cls = lex::keyword_class(t.lexeme);
			return cls == KeywordClass::type || cls == KeywordClass::qualifier
				   || cls == KeywordClass::storage || cls == KeywordClass::tag;
		}

		[[nodiscard]] bool is_control_keyword(std::string_view word) noexcept
		{
			return word == "if" || word == "for" || word == "while" || word == "switch";
		}
	} // namespace

	CodeContext::CodeContext(std::string_view text, std::span<const lex::Span> spans)
		: m_text(text), m_lines(text), m_tokens(lex::tokenize(text, spans))
	{
		match_brackets();
		assign_brace_roles();
	}

	bool CodeContext::is(std::size_t i, TokenKind kind) const noexcept
	{
		return i < m_tokens.size() && m_tokens[i].kind == kind;
	}

	SourcePosition CodeContext::position(FileByte offset) const noexcept
	{
		return m_lines.position(offset);
	}

	std::size_t CodeContext::match(std::size_t i) const noexcept
	{
		return i < m_match.size() ? m_match[i] : npos;
	}

	std::size_t CodeContext::enclosing(std::size_t i) const noexcept
	{
		return i < m_enclosing.size() ? m_enclosing[i] : npos;
	}

	BraceRole CodeContext::brace_role(std::size_t i) const noexcept
	{
		return i < m_roles.size() ? m_roles[i] : BraceRole::none;
	}

	std::size_t CodeContext::prev_code(std::size_t i) const noexcept
	{
		while (i > 0)
		{
			--i;
			if (m_tokens[i].kind != TokenKind::directive)
				return i;
		}
		return npos;
	}

	std::string_view CodeContext::gap(std::size_t a, std::size_t b) const noexcept
	{
		auto const begin = m_tokens[a].end;
		auto const end = m_tokens[b].begin;
		if (end < begin)
			return {};

		return m_text.substr(begin, end - begin);
	}

	void CodeContext::match_brackets()
	{
		m_match.assign(m_tokens.size(), npos);
		m_enclosing.assign(m_tokens.size(), npos);

		std::vector<std::size_t> open{};

		for (std::size_t i = 0; i < m_tokens.size(); ++i)
		{
			auto const kind = m_tokens[i].kind;

			if (lex::is_closer(kind))
			{
				// Unbalanced input (typically from #if branches) pops the openers
				// above the nearest one of the right kind; a closer with no
				// partner at all is left unmatched.
				auto want = opener_for(kind);
				auto k = open.size();
				while (k > 0 && m_tokens[open[k - 1]].kind != want)
					--k;

				if (k > 0)
				{
					auto o = open[k - 1];
					m_match[o] = i;
					m_match[i] = o;
					open.resize(k - 1);
				}

				m_enclosing[i] = open.empty() ? npos : open.back();
				continue;
			}

			m_enclosing[i] = open.empty() ? npos : open.back();

			if (lex::is_opener(kind))
				open.push_back(i);
		}
	}

	BraceRole CodeContext::classify_brace(std::size_t i) const noexcept
	{
		auto e = m_enclosing[i];
		if (e != npos)
		{
			if (is(e, TokenKind::lparen) || is(e, TokenKind::lbracket))
				return BraceRole::initializer;

			if (is(e, TokenKind::lbrace) && m_roles[e] == BraceRole::initializer)
				return BraceRole::initializer;
		}

		auto p = prev_code(i);
		if (p == npos)
			return BraceRole::block;

		switch (m_tokens[p].kind)
		{
			case TokenKind::eq:
			case TokenKind::comma:
			case TokenKind::op:
			case TokenKind::question:
			case TokenKind::lparen:
			case TokenKind::lbracket:
			case TokenKind::star:
			case TokenKind::amp:
			case TokenKind::dot:
			case TokenKind::arrow:
				return BraceRole::initializer;

			case TokenKind::rparen:
			{
				// "(type) {" is a compound literal unless the parentheses
				// belong to a control keyword, a function name or a declarator.
				auto o = m_match[p];
				if (o == npos)
					return BraceRole::block;

				auto q = prev_code(o);
				if (q == npos)
					return BraceRole::block;

				auto const& qt = m_tokens[q];
				if (qt.kind == TokenKind::identifier)
				{
					if (lex::keyword_class(qt.lexeme) != KeywordClass::other)
						return BraceRole::block;

					return is_control_keyword(qt.lexeme) ? BraceRole::block
														 : BraceRole::initializer;
				}

				switch (qt.kind)
				{
					case TokenKind::rparen:
					case TokenKind::rbracket:
					case TokenKind::semicolon:
					case TokenKind::lbrace:
					case TokenKind::rbrace:
						return BraceRole::block;
					default:
						return BraceRole::initializer;
				}
			}

			default:
				return BraceRole::block;
		}
	}

	void CodeContext::assign_brace_roles()
	{
		m_roles.assign(m_tokens.size(), BraceRole::none);

		for (std::size_t i = 0; i < m_tokens.size(); ++i)
		{
			if (m_tokens[i].kind != TokenKind::lbrace)
				continue;

			m_roles[i] = classify_brace(i);
			if (m_match[i] != npos)
				m_roles[m_match[i]] = m_roles[i];
		}
	}

	bool CodeContext::starts_declaration(std::size_t i) const noexcept
	{
		if (i == 0)
			return true;

		auto const q = i - 1;
		auto const& qt = m_tokens[q];

		switch (qt.kind)
		{
			case TokenKind::semicolon:
			case TokenKind::directive:
				return true;

			case TokenKind::lbrace:
			case TokenKind::rbrace:
				return m_roles[q] == BraceRole::block;

			case TokenKind::identifier:
			{
				auto cls = lex::keyword_class(qt.lexeme);
				return cls == KeywordClass::storage || cls == KeywordClass::qualifier
					   || cls == KeywordClass::tag;
			}

			case TokenKind::lparen:
			{
				auto k = prev_code(q);
				if (k != npos && m_tokens[k].kind == TokenKind::identifier
					&& m_tokens[k].lexeme == "for")
					return true;

				return is_parameter_list(q);
			}

			case TokenKind::comma:
			{
				auto e = m_enclosing[q];
				return e != npos && is(e, TokenKind::lparen) && is_parameter_list(e);
			}

			default:
				return false;
		}
	}

	bool CodeContext::is_type_position(std::size_t i) const noexcept
	{
		if (i >= m_tokens.size())
			return false;

		auto const& t = m_tokens[i];
		if (t.kind != TokenKind::identifier)
			return false;

		auto cls = lex::keyword_class(t.lexeme);
		if (cls == KeywordClass::type || cls == KeywordClass::qualifier)
			return true;

		return cls == KeywordClass::none && starts_declaration(i);
	}

	bool CodeContext::is_parameter_list(std::size_t open) const noexcept
	{
		if (!is(open, TokenKind::lparen) || open == 0)
			return false;

		auto q = open - 1;
		auto const& qt = m_tokens[q];

		// (*name)(...)
		if (qt.kind == TokenKind::rparen)
		{
			auto o = m_match[q];
			return o != npos && o + 1 < q && is(o + 1, TokenKind::star);
		}

		if (!lex::is_plain_identifier(qt) || q == 0)
			return false;

		auto r = q - 1;
		while (r > 0 && is(r, TokenKind::star))
			--r;

		auto const& rt = m_tokens[r];
		if (rt.kind == TokenKind::star)
			return false;

		if (is_specifier(rt))
			return true;

		return lex::is_plain_identifier(rt) && starts_declaration(r);
	}

	bool CodeContext::declarator_tail_ok(std::size_t name) const noexcept
	{
		auto k = name + 1;
		auto saw_params = false;

		while (k < m_tokens.size()
			   && (is(k, TokenKind::lbracket) || is(k, TokenKind::lparen)) && m_match[k] != npos)
		{
			saw_params = saw_params || is(k, TokenKind::lparen);
			k = m_match[k] + 1;
		}

		if (k >= m_tokens.size())
			return false;

		switch (m_tokens[k].kind)
		{
			case TokenKind::semicolon:
			case TokenKind::comma:
			case TokenKind::eq:
			case TokenKind::rparen:
			case TokenKind::colon:
				return true;
			case TokenKind::lbrace:
				return saw_params;
			default:
				return false;
		}
	}

	bool CodeContext::statement_is_declaration(std::size_t i) const noexcept
	{
		auto e = m_enclosing[i];
		if (e != npos && m_roles[e] != BraceRole::block)
			return false;

		// Walk back to the first token of the statement holding token i.
		auto k = i;
		while (k > 0)
		{
			auto const& t = m_tokens[k - 1];

			if (t.kind == TokenKind::semicolon || t.kind == TokenKind::directive)
				break;

			if (k - 1 == e)
				break;

			if (t.kind == TokenKind::rbrace && m_roles[k - 1] == BraceRole::block)
				break;

			if (lex::is_closer(t.kind) && m_match[k - 1] != npos)
			{
				k = m_match[k - 1];
				continue;
			}

			--k;
		}

		if (k >= i)
			return false;

		auto const& first = m_tokens[k];
		if (is_specifier(first))
			return true;

		if (!lex::is_plain_identifier(first))
			return false;

		auto n = k + 1;
		while (n < i && is(n, TokenKind::star))
			++n;

		return n < i && lex::is_plain_identifier(m_tokens[n]);
	}

} // namespace cstyle::rules
