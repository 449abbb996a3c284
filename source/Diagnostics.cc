#include <algorithm>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <cstyle/Diagnostics.hh>

#if defined(_WIN32)
#	include <io.h>
#	define CSTYLE_ISATTY _isatty
#	define CSTYLE_FILENO _fileno
#else
#	include <unistd.h>
#	define CSTYLE_ISATTY isatty
#	define CSTYLE_FILENO fileno
#endif

namespace cstyle
{
	namespace
	{
		struct Style
		{
			std::string_view reset{"\x1b[0m"};
			std::string_view bold{"\x1b[1m"};
			std::string_view dim{"\x1b[2m"};

			std::string_view red{"\x1b[31m"};
			std::string_view green{"\x1b[32m"};
		};

		constexpr std::size_t tabstop = 4;

		constexpr std::string_view warning_text = "warning";
		constexpr std::string_view warning_color = "\x1b[33m";

		[[nodiscard]] std::string_view advice_text(AdviceKind k) noexcept
		{
			switch (k)
			{
				case AdviceKind::note:
					return "note";
				case AdviceKind::help:
					return "help";
			}
			return "note";
		}

		[[nodiscard]] std::string_view advice_color(AdviceKind k) noexcept
		{
			switch (k)
			{
				case AdviceKind::note:
					return "\x1b[36m";
				case AdviceKind::help:
					return "\x1b[32m";
			}
			return "\x1b[36m";
		}

		[[nodiscard]] bool is_tty(std::ostream& out) noexcept
		{
			if (out.rdbuf() == std::cout.rdbuf())
				return CSTYLE_ISATTY(CSTYLE_FILENO(stdout)) != 0;

			if (out.rdbuf() == std::cerr.rdbuf())
				return CSTYLE_ISATTY(CSTYLE_FILENO(stderr)) != 0;

			return false;
		}

		[[nodiscard]] std::size_t digits(std::size_t v) noexcept
		{
			std::size_t d = 1;
			while (v >= 10)
			{
				v /= 10;
				++d;
			}
			return d;
		}

		void write_repeat(std::ostream& out, char ch, std::size_t n)
		{
			for (std::size_t i = 0; i < n; ++i)
				out.put(ch);
		}

		[[nodiscard]] std::size_t clamp_col(std::size_t col) noexcept
		{
			return col == 0 ? 1 : col;
		}

		[[nodiscard]] std::size_t visual_column(std::string_view line, std::size_t col_1_based) noexcept
		{
			if (col_1_based <= 1)
				return 1;

			auto visual = std::size_t{1};
			auto i = std::size_t{1};

			for (auto ch : line)
			{
				if (i >= col_1_based)
					break;

				if (ch == '\t')
					visual += tabstop - (visual - 1) % tabstop;
				else
					++visual;

				++i;
			}

			return visual;
		}

		[[nodiscard]] std::string expand_tabs(std::string_view line)
		{
			std::string out{};
			out.reserve(line.size());

			auto visual = std::size_t{1};
			for (auto ch : line)
			{
				if (ch == '\t')
				{
					auto spaces = tabstop - (visual - 1) % tabstop;
					out.append(spaces, ' ');
					visual += spaces;
					continue;
				}

				out.push_back(ch);
				++visual;
			}

			return out;
		}

		[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view s)
		{
			std::vector<std::string_view> out{};

			std::size_t pos = 0;
			for (;;)
			{
				auto nl = s.find('\n', pos);
				auto line = s.substr(pos, nl == std::string_view::npos ? nl : nl - pos);
				if (!line.empty() && line.back() == '\r')
					line.remove_suffix(1);

				out.push_back(line);
				if (nl == std::string_view::npos)
					break;

				pos = nl + 1;
			}

			return out;
		}

	} // namespace

	Diagnostics::Diagnostics(SourceManager const& sources, std::ostream& out) noexcept
		: m_sources(&sources), m_out(&out)
	{
	}

	void Diagnostics::set_color_mode(ColorMode mode) noexcept
	{
		m_color_mode = mode;
	}

	ColorMode Diagnostics::color_mode() const noexcept
	{
		return m_color_mode;
	}

	std::size_t Diagnostics::warning_count() const noexcept
	{
		return m_warnings;
	}

	bool Diagnostics::use_color() const noexcept
	{
		if (!m_out)
			return false;

		switch (m_color_mode)
		{
			case ColorMode::always:
				return true;
			case ColorMode::never:
				return false;
			case ColorMode::auto_detect:
				return is_tty(*m_out);
		}
		return false;
	}

	void Diagnostics::emit_header(Diagnostic const& diag)
	{
		auto& out = *m_out;
		Style st{};

		auto const& sp = diag.primary;
		auto name = m_sources->name(sp.id);

		if (use_color())
		{
			out << st.bold << name << st.reset << ':' << sp.begin.line << ':' << sp.begin.column
				<< ": " << st.bold << warning_color << warning_text << st.reset
				<< ": " << diag.message;
		}
		else
		{
			out << name << ':' << sp.begin.line << ':' << sp.begin.column << ": "
				<< warning_text << ": " << diag.message;
		}

		if (!diag.code.empty())
			out << " [" << diag.code << ']';

		out << '\n';
	}

	void Diagnostics::emit_snippet(Diagnostic const& diag)
	{
		auto& out = *m_out;
		Style st{};

		auto const& sp = diag.primary;
		auto const raw = m_sources->line_view(sp.id, sp.begin.line);
		if (raw.empty())
			return;

		auto const width = digits(sp.begin.line);

		auto print_bar = [&] {
			write_repeat(out, ' ', width + 1);
			if (use_color())
				out << st.dim;

			out << "|";
			if (use_color())
				out << st.reset;
		};

		print_bar();
		out << '\n';

		out << ' ' << sp.begin.line << ' ';
		if (use_color())
			out << st.dim;

		out << "|";
		if (use_color())
			out << st.reset;

		out << ' ' << expand_tabs(raw) << '\n';

		auto start_col = clamp_col(sp.begin.column);
		auto end_col = sp.single_line() ? clamp_col(sp.end.column) : start_col + 1;
		if (end_col < start_col)
			std::swap(end_col, start_col);

		auto const visual_start = visual_column(raw, start_col);
		auto const len = end_col > start_col ? (end_col - start_col) : 1;
		auto const visual_end = visual_column(raw, start_col + len);
		auto const visual_len = visual_end > visual_start ? (visual_end - visual_start) : 1;

		print_bar();
		out << ' ';
		write_repeat(out, ' ', visual_start);

		if (use_color())
			out << st.bold << warning_color;

		out << '^';
		if (visual_len > 1)
			write_repeat(out, '~', visual_len - 1);

		if (use_color())
			out << st.reset;

		out << '\n';
	}

	void Diagnostics::emit_fixit(DiagnosticFixIt const& fx)
	{
		auto& out = *m_out;
		Style st{};

		auto const name = fx.span.id != 0 ? m_sources->name(fx.span.id) : std::string_view{};
		auto const line = fx.span.begin.line;
		auto const col = fx.span.begin.column;

		auto msg = std::string_view(fx.message);
		if (msg.empty())
			msg = "apply the suggested fix";

		if (use_color())
		{
			out << "  " << st.dim << "=" << st.reset << ' ' << st.bold
				<< advice_color(AdviceKind::help) << "help" << st.reset << ": " << msg;
		}
		else
		{
			out << "  = help: " << msg;
		}

		if (fx.span.id != 0)
			out << " (" << name << ':' << line << ':' << col << ')';
		out << '\n';

		if (fx.span.id == 0 || fx.span.begin.line == 0)
			return;

		// Before/after preview of every line the edit touches.
		auto const first = fx.span.begin.line;
		auto const last = std::max(fx.span.end.line, first);

		auto const content = m_sources->content(fx.span.id);
		auto const first_start = fx.span.begin.offset - (fx.span.begin.column - 1);

		auto last_end = content.find('\n', fx.span.end.offset);
		if (last_end == std::string_view::npos)
			last_end = content.size();

		auto after = std::string{};
		after.append(content.substr(first_start, fx.span.begin.offset - first_start));
		after.append(fx.replacement);
		after.append(content.substr(fx.span.end.offset, last_end - fx.span.end.offset));

		out << "  |\n";
		for (std::size_t l = first; l <= last; ++l)
		{
			auto raw = m_sources->line_view(fx.span.id, l);
			if (use_color())
				out << "  | " << st.red << "- " << raw << st.reset << '\n';
			else
				out << "  | - " << raw << '\n';
		}

		for (auto const l : split_lines(after))
		{
			if (use_color())
				out << "  | " << st.green << "+ " << l << st.reset << '\n';
			else
				out << "  | + " << l << '\n';
		}
	}

	void Diagnostics::emit(Diagnostic const& diag)
	{
		if (!m_out || !m_sources)
			return;

		auto& out = *m_out;
		Style st{};

		if (m_need_separator)
			out << '\n';
		m_need_separator = true;

		++m_warnings;

		emit_header(diag);

		if (diag.primary.id != 0)
			emit_snippet(diag);

		for (auto const& a : diag.advices)
		{
			if (a.message.empty())
				continue;

			if (use_color())
			{
				out << "  " << st.dim << "=" << st.reset << ' ' << st.bold << advice_color(a.kind)
					<< advice_text(a.kind) << st.reset << ": " << a.message << '\n';
			}
			else
			{
				out << "  = " << advice_text(a.kind) << ": " << a.message << '\n';
			}
		}

		for (auto const& fx : diag.fixits)
			emit_fixit(fx);
	}

} // namespace cstyle
