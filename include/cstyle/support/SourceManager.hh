#ifndef CSTYLE_SUPPORT_SOURCE_MANAGER_HH
#define CSTYLE_SUPPORT_SOURCE_MANAGER_HH

#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <cstyle/support/LineIndex.hh>
#include <cstyle/support/Result.hh>
#include <cstyle/support/Span.hh>

namespace cstyle
{
	template <class SourceFileSpecifier> class SourceFile
	{
	public:
		SourceFile() = default;

		[[nodiscard]] bool is_open() const noexcept { return m_handle.is_open(); }
		void close() noexcept { m_handle.close(); }

	protected:
		template <class... Args> void init(Args&&... args) noexcept
		{
			auto& self = static_cast<SourceFileSpecifier&>(*this);
			self.m_offset = 0;
			self.open_impl(std::forward<Args>(args)...);
		}

		std::fstream m_handle{};
		FileByte m_offset{};
	};

	class ReadSourceFile : public SourceFile<ReadSourceFile>
	{
	public:
		ReadSourceFile() = default;

		explicit ReadSourceFile(std::string_view filename) noexcept;

		void open_impl(std::string_view filename) noexcept;

		// Appends the remainder of the file to dst. False on a stream error.
		bool read_all(std::string& dst) noexcept;
	};

	class WriteSourceFile : public SourceFile<WriteSourceFile>
	{
	public:
		WriteSourceFile() = default;

		explicit WriteSourceFile(std::string_view filename) noexcept;

		void open_impl(std::string_view filename) noexcept;

		[[nodiscard]] FileByte position() const noexcept;

		FileByte write(std::string_view src) noexcept;
		bool flush() noexcept;
	};

	class SourceManager
	{
	public:
		SourceManager() = default;

		SourceManager(SourceManager const&) = delete;
		SourceManager& operator=(SourceManager const&) = delete;

		SourceManager(SourceManager&&) noexcept = default;
		SourceManager& operator=(SourceManager&&) noexcept = default;

		~SourceManager();

		Result<FileId, std::string> open_read(std::string_view filename) noexcept;
		Result<FileId, std::string> open_write(std::string_view filename) noexcept;

		FileId add_virtual(std::string name, std::string contents) noexcept;

		// Writes contents to filename, truncating it. The entry is released before returning.
		Result<FileByte, std::string> write_file(std::string_view filename,
												 std::string_view contents) noexcept;

		void close(FileId id) noexcept;

		// Closes the handles of id and drops its buffer. Views into it dangle afterwards.
		void release(FileId id) noexcept;

		[[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

		[[nodiscard]] std::string_view name(FileId id) const noexcept;

		[[nodiscard]] WriteSourceFile* writer(FileId id) noexcept;

		[[nodiscard]] std::string_view content(FileId id) const noexcept;

		[[nodiscard]] std::string_view line_view(FileId id,
												 std::size_t line_1_based) const noexcept;

		[[nodiscard]] SourcePosition position_from_offset(FileId id,
														  FileByte offset) const noexcept;
		[[nodiscard]] SourceSpan
		span_from_offsets(FileId id, FileByte begin, FileByte end) const noexcept;

	private:
		struct Entry
		{
			FileId id{};
			std::string name{};

			std::unique_ptr<ReadSourceFile> read{};
			std::unique_ptr<WriteSourceFile> write{};

			std::string buffer{};
			LineIndex lines{};
		};

		[[nodiscard]] Entry* get(FileId id) noexcept;
		[[nodiscard]] Entry const* get(FileId id) const noexcept;

		FileId insert(Entry entry) noexcept;

		FileId m_next_id{1};
		std::unordered_map<FileId, Entry> m_entries{};
	};

} // namespace cstyle

#endif /* CSTYLE_SUPPORT_SOURCE_MANAGER_HH */
