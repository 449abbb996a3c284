#include <cstyle/support/Span.hh>

namespace cstyle
{
	SourcePosition::SourcePosition(FileByte offset, std::size_t line, std::size_t column) noexcept
		: offset(offset), line(line), column(column)
	{
	}

	SourceSpan::SourceSpan(FileId id, SourcePosition begin, SourcePosition end) noexcept
		: id(id), begin(begin), end(end)
	{
	}

} // namespace cstyle
