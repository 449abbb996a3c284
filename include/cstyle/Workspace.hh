#ifndef CSTYLE_WORKSPACE_HH
#define CSTYLE_WORKSPACE_HH

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <cstyle/Diagnostics.hh>
#include <cstyle/Linter.hh>
#include <cstyle/support/Result.hh>
#include <cstyle/support/SourceManager.hh>

namespace cstyle
{
	enum class Mode
	{
		scan,
		fix,
	};

	struct ProcessOptions
	{
		Mode mode{Mode::scan};
		bool emit_diagnostics{true};
	};

	struct FileOutcome
	{
		std::string path{};

		std::size_t found{};
		std::size_t fixed{};
		// Violations still present after processing (all of them in scan mode).
		std::size_t remaining{};

		bool written{};
	};

	[[nodiscard]] bool has_c_extension(std::string_view path) noexcept;

	// A single .c/.h file, or every .c/.h file below a directory, sorted.
	[[nodiscard]] Result<std::vector<std::string>, std::string>
	collect_sources(std::string_view path);

	// One warning per violation, with the suggested edit as a fix-it.
	void emit_report(Diagnostics& diag, SourceManager const& sources, FileId file,
					 Report const& report);

	// Skipped fixes of report, as warnings carrying a note that they were not applied.
	void emit_skipped(Diagnostics& diag, SourceManager const& sources, FileId file,
					  Report const& report);

	// Every buffer it opens is released before it returns, so one SourceManager
	// can serve a whole directory walk.
	[[nodiscard]] Result<FileOutcome, std::string>
	process_file(SourceManager& sources, Diagnostics& diag, std::string_view path,
				 ProcessOptions const& opt);

} // namespace cstyle

#endif /* CSTYLE_WORKSPACE_HH */
