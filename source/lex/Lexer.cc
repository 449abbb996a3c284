#include <cstyle/lex/Lexer.hh>
#include <cstyle/support/Ctype.hh>

namespace cstyle::lex
{
	Lexer::Lexer(std::string_view text, std::span<const Span> spans) noexcept
		: m_input(text), m_spans(spans)
	{
	}

	void Lexer::reset() noexcept
	{
		m_span = 0;
		m_off = 0;
		m_has_peek = false;
		m_peeked = {};
	}

	Token Lexer::peek()
	{
		if (!m_has_peek)
		{
			m_peeked = lex_one();
			m_has_peek = true;
		}
		return m_peeked;
	}

	Token Lexer::next()
	{
		if (m_has_peek)
		{
			m_has_peek = false;
			return m_peeked;
		}
		return lex_one();
	}

	bool Lexer::at_span_end() const noexcept
	{
		return m_span >= m_spans.size() || m_off >= m_spans[m_span].end;
	}

	bool Lexer::at_line_start(FileByte offset) const noexcept
	{
		while (offset > 0)
		{
			auto c = m_input[offset - 1];
			if (c == '\n')
				return true;

			if (!is_blank(c))
				return false;

			--offset;
		}
		return true;
	}

	char Lexer::cur() const noexcept
	{
		if (at_span_end())
			return '\0';

		return m_input[m_off];
	}

	char Lexer::peek_char(FileByte rel) const noexcept
	{
		if (m_span >= m_spans.size())
			return '\0';

		auto idx = m_off + rel;
		if (idx >= m_spans[m_span].end)
			return '\0';

		return m_input[idx];
	}

	void Lexer::advance(FileByte n) noexcept
	{
		m_off += n;
		if (m_off > m_input.size())
			m_off = m_input.size();
	}

	Token Lexer::make(TokenKind kind, FileByte begin, FileByte end) const noexcept
	{
		Token t{};
		t.kind = kind;
		t.begin = begin;
		t.end = end;
		if (begin <= end && end <= m_input.size())
			t.lexeme = m_input.substr(begin, end - begin);

		return t;
	}

	void Lexer::skip_spaces() noexcept
	{
		while (!at_span_end() && is_space(cur()))
			advance();
	}

	Token Lexer::lex_directive(FileByte begin)
	{
		// Runs to the first newline in code that is not escaped by a backslash.
		// Newlines inside comments do not end the directive.
		auto end = begin;

		while (m_span < m_spans.size())
		{
			auto const& sp = m_spans[m_span];
			if (m_off < sp.begin)
				m_off = sp.begin;

			if (!sp.is_code())
			{
				m_off = sp.end;
				end = m_off;
				++m_span;
				continue;
			}

			while (m_off < sp.end)
			{
				auto c = m_input[m_off];
				if (c == '\n')
				{
					auto last = m_off;
					if (last > sp.begin && m_input[last - 1] == '\r')
						--last;

					if (last == sp.begin || m_input[last - 1] != '\\')
						return make(TokenKind::directive, begin, end);
				}

				++m_off;
				if (!is_space(c))
					end = m_off;
			}

			++m_span;
		}

		return make(TokenKind::directive, begin, end);
	}

	Token Lexer::lex_identifier(FileByte begin)
	{
		advance();

		while (!at_span_end() && is_ident_continue(cur()))
			advance();

		return make(TokenKind::identifier, begin, m_off);
	}

	Token Lexer::lex_number(FileByte begin)
	{
		// pp-number: digits, letters, '.', '_' and a sign after an exponent marker.
		advance();

		while (!at_span_end())
		{
			auto c = cur();

			if ((c == '+' || c == '-') && m_off > begin)
			{
				auto e = ascii_tolower(m_input[m_off - 1]);
				if (e == 'e' || e == 'p')
				{
					advance();
					continue;
				}
				break;
			}

			if (!is_ident_continue(c) && c != '.')
				break;

			advance();
		}

		return make(TokenKind::number, begin, m_off);
	}

	Token Lexer::lex_punct(FileByte begin)
	{
		auto c = cur();
		auto n = peek_char();
		auto n2 = peek_char(2);

		auto single = [&](TokenKind kind) {
			advance();
			return make(kind, begin, m_off);
		};

		auto multi = [&](TokenKind kind, FileByte len) {
			advance(len);
			return make(kind, begin, m_off);
		};

		switch (c)
		{
			case '(':
				return single(TokenKind::lparen);
			case ')':
				return single(TokenKind::rparen);
			case '[':
				return single(TokenKind::lbracket);
			case ']':
				return single(TokenKind::rbracket);
			case '{':
				return single(TokenKind::lbrace);
			case '}':
				return single(TokenKind::rbrace);
			case ',':
				return single(TokenKind::comma);
			case ';':
				return single(TokenKind::semicolon);
			case ':':
				return single(TokenKind::colon);
			case '?':
				return single(TokenKind::question);

			case '.':
				if (n == '.' && n2 == '.')
					return multi(TokenKind::ellipsis, 3);
				return single(TokenKind::dot);

			case '*':
				if (n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::star);

			case '&':
				if (n == '&' || n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::amp);

			case '=':
				if (n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::eq);

			case '-':
				if (n == '>')
					return multi(TokenKind::arrow, 2);
				if (n == '-' || n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::op);

			case '+':
			case '|':
				if (n == c || n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::op);

			case '<':
			case '>':
				if (n == c)
					return multi(TokenKind::op, n2 == '=' ? 3 : 2);
				if (n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::op);

			case '/':
			case '%':
			case '^':
			case '!':
				if (n == '=')
					return multi(TokenKind::op, 2);
				return single(TokenKind::op);

			case '#':
				if (n == '#')
					return multi(TokenKind::op, 2);
				return single(TokenKind::op);

			case '~':
				return single(TokenKind::op);
		}

		return single(TokenKind::invalid);
	}

	Token Lexer::lex_one()
	{
		for (;;)
		{
			while (m_span < m_spans.size() && m_off >= m_spans[m_span].end)
				++m_span;

			if (m_span >= m_spans.size())
				return make(TokenKind::eof, m_input.size(), m_input.size());

			auto const& sp = m_spans[m_span];
			if (m_off < sp.begin)
				m_off = sp.begin;

			switch (sp.kind)
			{
				case SpanKind::string:
					m_off = sp.end;
					return make(TokenKind::string, sp.begin, sp.end);
				case SpanKind::char_literal:
					m_off = sp.end;
					return make(TokenKind::char_literal, sp.begin, sp.end);
				case SpanKind::line_comment:
				case SpanKind::block_comment:
					m_off = sp.end;
					continue;
				case SpanKind::code:
					break;
			}

			skip_spaces();
			if (at_span_end())
				continue;

			auto begin = m_off;
			auto c = cur();

			if (c == '#' && at_line_start(begin))
				return lex_directive(begin);

			if (is_ident_start(c))
				return lex_identifier(begin);

			if (is_ascii_digit(c) || (c == '.' && is_ascii_digit(peek_char())))
				return lex_number(begin);

			return lex_punct(begin);
		}
	}

	std::vector<Token> tokenize(std::string_view text, std::span<const Span> spans)
	{
		std::vector<Token> out{};

		Lexer lexer(text, spans);
		for (;;)
		{
			auto t = lexer.next();
			if (t.kind == TokenKind::eof)
				break;

			out.push_back(t);
		}

		return out;
	}

} // namespace cstyle::lex
