#include <iterator>
#include <cstyle/support/SourceManager.hh>
#include <cstyle/support/Span.hh>

namespace cstyle
{
	ReadSourceFile::ReadSourceFile(std::string_view filename) noexcept
	{
		init(filename);
	}

	void ReadSourceFile::open_impl(std::string_view filename) noexcept
	{
		m_handle.open(std::string(filename), std::ios_base::in | std::ios_base::binary);
	}

	bool ReadSourceFile::read_all(std::string& dst) noexcept
	{
		if (!m_handle.good())
			return false;

		auto const before = dst.size();
		dst.append(std::istreambuf_iterator<char>(m_handle), std::istreambuf_iterator<char>());

		if (m_handle.bad())
			return false;

		m_offset += dst.size() - before;
		return true;
	}

	WriteSourceFile::WriteSourceFile(std::string_view filename) noexcept
	{
		init(filename);
	}

	void WriteSourceFile::open_impl(std::string_view filename) noexcept
	{
		m_handle.open(std::string(filename),
					  std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
	}

	FileByte WriteSourceFile::position() const noexcept
	{
		return m_offset;
	}

	FileByte WriteSourceFile::write(std::string_view src) noexcept
	{
		const FileByte begin = position();

		if (!m_handle.good() || src.empty())
			return begin;

		m_handle.write(src.data(), static_cast<std::streamsize>(src.size()));

		if (!m_handle.good())
			return begin;

		const FileByte end = m_offset = begin + src.size();

		return end;
	}

	bool WriteSourceFile::flush() noexcept
	{
		m_handle.flush();
		return m_handle.good();
	}

	SourceManager::~SourceManager()
	{
		for (auto& [_, e] : m_entries)
		{
			if (e.read)
				e.read->close();

			if (e.write)
				e.write->close();
		}
	}

	auto SourceManager::get(FileId id) noexcept -> Entry*
	{
		auto it = m_entries.find(id);
		if (it == m_entries.end())
			return nullptr;

		return &it->second;
	}

	auto SourceManager::get(FileId id) const noexcept -> Entry const*
	{
		auto it = m_entries.find(id);
		if (it == m_entries.end())
			return nullptr;

		return &it->second;
	}

	FileId SourceManager::insert(Entry entry) noexcept
	{
		auto const id = entry.id;
		auto [it, _] = m_entries.emplace(id, std::move(entry));

		// The index views the buffer, so it is built once the entry has its final address.
		it->second.lines.rebuild(it->second.buffer);
		return id;
	}

	Result<FileId, std::string> SourceManager::open_read(std::string_view filename) noexcept
	{
		auto entry = Entry{};
		entry.id = m_next_id++;
		entry.name = std::string(filename);

		auto rf = std::make_unique<ReadSourceFile>(filename);

		if (!rf->is_open())
			return std::string("failed to open file for reading");

		if (!rf->read_all(entry.buffer))
			return std::string("failed to read file");

		rf->close();

		entry.read = std::move(rf);
		return insert(std::move(entry));
	}

	Result<FileId, std::string> SourceManager::open_write(std::string_view filename) noexcept
	{
		auto entry = Entry{};
		entry.id = m_next_id++;
		entry.name = std::string(filename);

		auto wf = std::make_unique<WriteSourceFile>(filename);

		if (!wf->is_open())
			return std::string("failed to open file for writing");

		entry.write = std::move(wf);
		return insert(std::move(entry));
	}

	Result<FileByte, std::string> SourceManager::write_file(std::string_view filename,
															std::string_view contents) noexcept
	{
		auto id_res = open_write(filename);
		if (!id_res.ok())
			return std::move(id_res.err());

		auto const id = id_res.value();
		auto* w = writer(id);

		auto const written = w->write(contents);
		auto const flushed = w->flush();
		release(id);

		if (!flushed || written != contents.size())
			return std::string("failed to write file");

		return written;
	}

	FileId SourceManager::add_virtual(std::string name, std::string contents) noexcept
	{
		auto entry = Entry{};
		entry.id = m_next_id++;
		entry.name = std::move(name);
		entry.buffer = std::move(contents);

		return insert(std::move(entry));
	}

	void SourceManager::close(FileId id) noexcept
	{
		auto* e = get(id);
		if (!e)
			return;

		if (e->read)
			e->read->close();

		if (e->write)
			e->write->close();
	}

	void SourceManager::release(FileId id) noexcept
	{
		close(id);
		m_entries.erase(id);
	}

	std::string_view SourceManager::name(FileId id) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->name;
	}

	WriteSourceFile* SourceManager::writer(FileId id) noexcept
	{
		auto* e = get(id);
		return e && e->write ? e->write.get() : nullptr;
	}

	std::string_view SourceManager::content(FileId id) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->buffer;
	}

	std::string_view SourceManager::line_view(FileId id, std::size_t line_1_based) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->lines.line_view(line_1_based);
	}

	SourcePosition SourceManager::position_from_offset(FileId id, FileByte offset) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->lines.position(offset);
	}

	SourceSpan
	SourceManager::span_from_offsets(FileId id, FileByte begin, FileByte end) const noexcept
	{
		auto b = position_from_offset(id, begin);
		auto e = position_from_offset(id, end);
		return SourceSpan{id, b, e};
	}

} // namespace cstyle
