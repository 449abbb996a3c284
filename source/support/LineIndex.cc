#include <algorithm>
#include <cstyle/support/LineIndex.hh>

namespace cstyle
{
	LineIndex::LineIndex(std::string_view text)
	{
		rebuild(text);
	}

	void LineIndex::rebuild(std::string_view text)
	{
		m_text = text;
		m_line_starts.clear();
		m_line_starts.push_back(0);

		for (FileByte i = 0; i < text.size(); ++i)
			if (text[i] == '\n')
				m_line_starts.push_back(i + 1);
	}

	std::string_view LineIndex::line_view(std::size_t line_1_based) const noexcept
	{
		if (m_text.empty() || line_1_based == 0)
			return {};

		auto idx = line_1_based - 1;
		if (idx >= m_line_starts.size())
			return {};

		auto begin = m_line_starts[idx];

		auto end = static_cast<FileByte>(m_text.size());
		if (idx + 1 < m_line_starts.size())
			end = m_line_starts[idx + 1];

		while (end > begin && (m_text[end - 1] == '\n' || m_text[end - 1] == '\r'))
			--end;

		return m_text.substr(begin, end - begin);
	}

	SourcePosition LineIndex::position(FileByte offset) const noexcept
	{
		if (m_line_starts.empty())
			return SourcePosition{offset, 1, offset + 1};

		auto off = std::min<FileByte>(offset, m_text.size());

		auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), off);
		auto line_idx = static_cast<std::size_t>(it - m_line_starts.begin());

		if (line_idx == 0)
			line_idx = 1;

		auto line_start = m_line_starts[line_idx - 1];
		auto col_1_based = static_cast<std::size_t>((off - line_start) + 1);

		return SourcePosition{off, line_idx, col_1_based};
	}

} // namespace cstyle
