#ifndef CSTYLE_SUPPORT_LINE_INDEX_HH
#define CSTYLE_SUPPORT_LINE_INDEX_HH

#include <cstddef>
#include <string_view>
#include <vector>
#include <cstyle/support/Span.hh>

namespace cstyle
{
	// Byte offsets of line starts in a text buffer. The buffer is not owned.
	class LineIndex
	{
	public:
		LineIndex() = default;
		explicit LineIndex(std::string_view text);

		void rebuild(std::string_view text);

		[[nodiscard]] std::string_view line_view(std::size_t line_1_based) const noexcept;

		[[nodiscard]] SourcePosition position(FileByte offset) const noexcept;

	private:
		std::string_view m_text{};
		std::vector<FileByte> m_line_starts{};
	};

} // namespace cstyle

#endif /* CSTYLE_SUPPORT_LINE_INDEX_HH */
