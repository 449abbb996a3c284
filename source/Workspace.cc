#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <cstyle/Workspace.hh>

namespace cstyle
{
	namespace fs = std::filesystem;

	namespace
	{
		[[nodiscard]] Diagnostic make_diagnostic(SourceManager const& sources, FileId file,
												 rules::Violation const& v, bool skipped)
		{
			Diagnostic d{};
			d.message = std::string(rules::rule_message(v.rule));
			d.code = std::string(rules::rule_name(v.rule));
			d.primary = sources.span_from_offsets(file, v.at, v.at + 1);

			DiagnosticFixIt fx{};
			fx.span = sources.span_from_offsets(file, v.begin, v.end);
			fx.replacement = v.suggested_text;
			if (v.rule == rules::RuleId::pointer_spacing)
				fx.message = "attach '*' to the name";
			else
				fx.message = "move '{' to its own line";
			d.fixits.push_back(std::move(fx));

			if (skipped)
			{
				d.advices.push_back(DiagnosticAdvice{
					AdviceKind::note, "this fix overlaps another edit and was not applied"});
			}

			return d;
		}

		[[nodiscard]] std::string describe(std::string_view path, std::string const& err)
		{
			return std::string(path) + ": " + err;
		}
	} // namespace

	bool has_c_extension(std::string_view path) noexcept
	{
		return path.ends_with(".c") || path.ends_with(".h");
	}

	Result<std::vector<std::string>, std::string> collect_sources(std::string_view path)
	{
		std::error_code ec{};
		auto const root = fs::path(path);

		if (fs::is_regular_file(root, ec))
		{
			if (!has_c_extension(path))
				return std::string("'") + std::string(path) + "' is not a C source or header file";

			return std::vector<std::string>{std::string(path)};
		}

		if (!fs::is_directory(root, ec))
			return std::string("'") + std::string(path) + "' is not a file or directory";

		std::vector<std::string> out{};

		auto it = fs::recursive_directory_iterator(
			root, fs::directory_options::skip_permission_denied, ec);
		if (ec)
			return std::string("cannot read directory '") + std::string(path) + "': " + ec.message();

		for (auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec))
		{
			if (ec)
				return std::string("cannot read directory '") + std::string(path)
					   + "': " + ec.message();

			std::error_code entry_ec{};
			if (!it->is_regular_file(entry_ec))
				continue;

			auto name = it->path().string();
			if (has_c_extension(name))
				out.push_back(std::move(name));
		}

		if (out.empty())
			return std::string("no .c or .h files found in '") + std::string(path) + "'";

		std::sort(out.begin(), out.end());
		return out;
	}

	void emit_report(Diagnostics& diag, SourceManager const& sources, FileId file,
					 Report const& report)
	{
		for (auto const& v : report.violations)
			diag.emit(make_diagnostic(sources, file, v, false));
	}

	void emit_skipped(Diagnostics& diag, SourceManager const& sources, FileId file,
					  Report const& report)
	{
		for (auto const& v : report.skipped)
			diag.emit(make_diagnostic(sources, file, v, true));
	}

	Result<FileOutcome, std::string> process_file(SourceManager& sources, Diagnostics& diag,
												  std::string_view path, ProcessOptions const& opt)
	{
		auto in_res = sources.open_read(path);
		if (!in_res.ok())
			return describe(path, in_res.err());

		auto const in_id = in_res.value();
		auto const text = sources.content(in_id);

		FileOutcome outcome{};
		outcome.path = std::string(path);

		if (opt.mode == Mode::scan)
		{
			auto report = scan(text);
			outcome.found = report.count();
			outcome.remaining = report.count();

			if (opt.emit_diagnostics)
				emit_report(diag, sources, in_id, report);

			sources.release(in_id);
			return outcome;
		}

		auto result = fix(text);
		outcome.found = result.report.count();

		if (result.text != text)
		{
			auto w = sources.write_file(path, result.text);
			if (!w.ok())
			{
				sources.release(in_id);
				return describe(path, w.err());
			}

			outcome.written = true;
		}

		// Whatever survives the rewrite is reported against the new contents.
		auto const fixed_id = sources.add_virtual(std::string(path), std::move(result.text));
		auto leftover = scan(sources.content(fixed_id));

		outcome.remaining = leftover.count();
		outcome.fixed = outcome.found >= outcome.remaining ? outcome.found - outcome.remaining : 0;

		if (opt.emit_diagnostics)
		{
			emit_report(diag, sources, fixed_id, leftover);
			emit_skipped(diag, sources, in_id, result.report);
		}

		sources.release(fixed_id);
		sources.release(in_id);
		return outcome;
	}

} // namespace cstyle
