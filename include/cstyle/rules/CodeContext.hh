#ifndef CSTYLE_RULES_CODE_CONTEXT_HH
#define CSTYLE_RULES_CODE_CONTEXT_HH

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>
#include <cstyle/lex/Classifier.hh>
#include <cstyle/lex/Tokens.hh>
#include <cstyle/support/LineIndex.hh>

namespace cstyle::rules
{
	enum class BraceRole : std::uint8_t
	{
		none,
		block,
		initializer,
	};

	// Token stream of one file plus the bracket structure both rules reason
	// about. Declaration detection is heuristic: a token sequence counts as a
	// declaration when its shape is one a C parser would read as one if every
	// leading identifier named a type.
	class CodeContext
	{
	public:
		static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

		CodeContext(std::string_view text, std::span<const lex::Span> spans);

		[[nodiscard]] std::string_view text() const noexcept { return m_text; }
		[[nodiscard]] std::size_t size() const noexcept { return m_tokens.size(); }
		[[nodiscard]] lex::Token const& token(std::size_t i) const noexcept { return m_tokens[i]; }
		[[nodiscard]] bool is(std::size_t i, lex::TokenKind kind) const noexcept;

		[[nodiscard]] SourcePosition position(FileByte offset) const noexcept;
		[[nodiscard]] LineIndex const& lines() const noexcept { return m_lines; }

		// Partner of a bracket token, or npos.
		[[nodiscard]] std::size_t match(std::size_t i) const noexcept;
		// Innermost open bracket around token i, or npos at file level.
		[[nodiscard]] std::size_t enclosing(std::size_t i) const noexcept;
		[[nodiscard]] BraceRole brace_role(std::size_t i) const noexcept;

		// Previous token that is not a preprocessor directive.
		[[nodiscard]] std::size_t prev_code(std::size_t i) const noexcept;

		[[nodiscard]] std::string_view gap(std::size_t a, std::size_t b) const noexcept;

		[[nodiscard]] bool starts_declaration(std::size_t i) const noexcept;
		[[nodiscard]] bool is_type_position(std::size_t i) const noexcept;
		[[nodiscard]] bool is_parameter_list(std::size_t open) const noexcept;
		[[nodiscard]] bool declarator_tail_ok(std::size_t name) const noexcept;
		[[nodiscard]] bool statement_is_declaration(std::size_t i) const noexcept;

	private:
		void match_brackets();
		void assign_brace_roles();

		[[nodiscard]] BraceRole classify_brace(std::size_t i) const noexcept;

		std::string_view m_text{};
		LineIndex m_lines{};

		std::vector<lex::Token> m_tokens{};
		std::vector<std::size_t> m_match{};
		std::vector<std::size_t> m_enclosing{};
		std::vector<BraceRole> m_roles{};
	};

} // namespace cstyle::rules

#endif /* CSTYLE_RULES_CODE_CONTEXT_HH */
