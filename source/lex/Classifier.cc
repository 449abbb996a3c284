#include <cstyle/lex/Classifier.hh>

namespace cstyle::lex
{
	std::string_view span_kind_name(SpanKind kind) noexcept
	{
		switch (kind)
		{
			case SpanKind::code:
				return "code";
			case SpanKind::string:
				return "string";
			case SpanKind::char_literal:
				return "char";
			case SpanKind::line_comment:
				return "line-comment";
			case SpanKind::block_comment:
				return "block-comment";
		}
		return "code";
	}

	Classifier::Classifier(std::string_view text) noexcept : m_input(text)
	{
	}

	void Classifier::reset() noexcept
	{
		m_off = 0;
	}

	char Classifier::cur() const noexcept
	{
		if (done())
			return '\0';

		return m_input[m_off];
	}

	char Classifier::peek_char(FileByte rel) const noexcept
	{
		auto idx = m_off + rel;
		if (idx >= m_input.size())
			return '\0';

		return m_input[idx];
	}

	void Classifier::advance(FileByte n) noexcept
	{
		m_off += n;
		if (m_off > m_input.size())
			m_off = m_input.size();
	}

	void Classifier::scan_code() noexcept
	{
		while (!done())
		{
			auto c = cur();

			if (c == '"' || c == '\'')
				return;

			if (c == '/' && (peek_char() == '/' || peek_char() == '*'))
				return;

			advance();
		}
	}

	void Classifier::scan_quoted(char quote) noexcept
	{
		advance();

		auto escaped = false;
		while (!done())
		{
			auto c = cur();

			if (escaped)
			{
				escaped = false;
				advance(c == '\r' && peek_char() == '\n' ? 2 : 1);
				continue;
			}

			if (c == '\\')
			{
				escaped = true;
				advance();
				continue;
			}

			// A raw newline cannot appear in a literal; the newline stays code.
			if (c == '\n' || (c == '\r' && peek_char() == '\n'))
				return;

			advance();

			if (c == quote)
				return;
		}
	}

	void Classifier::scan_line_comment() noexcept
	{
		advance(2);

		while (!done())
		{
			auto c = cur();

			if (c == '\\' && (peek_char() == '\n' || (peek_char() == '\r' && peek_char(2) == '\n')))
			{
				advance(peek_char() == '\r' ? 3 : 2);
				continue;
			}

			if (c == '\n' || (c == '\r' && peek_char() == '\n'))
				return;

			advance();
		}
	}

	void Classifier::scan_block_comment() noexcept
	{
		advance(2);

		while (!done())
		{
			if (cur() == '*' && peek_char() == '/')
			{
				advance(2);
				return;
			}
			advance();
		}
	}

	std::optional<Span> Classifier::next() noexcept
	{
		if (done())
			return std::nullopt;

		auto begin = m_off;
		auto kind = SpanKind::code;

		switch (cur())
		{
			case '"':
				kind = SpanKind::string;
				scan_quoted('"');
				break;
			case '\'':
				kind = SpanKind::char_literal;
				scan_quoted('\'');
				break;
			case '/':
				if (peek_char() == '/')
				{
					kind = SpanKind::line_comment;
					scan_line_comment();
					break;
				}
				if (peek_char() == '*')
				{
					kind = SpanKind::block_comment;
					scan_block_comment();
					break;
				}
				advance();
				scan_code();
				break;
			default:
				scan_code();
				break;
		}

		return Span{kind, begin, m_off};
	}

	std::vector<Span> classify(std::string_view text)
	{
		std::vector<Span> spans{};

		Classifier classifier(text);
		while (auto span = classifier.next())
			spans.push_back(*span);

		return spans;
	}

} // namespace cstyle::lex
