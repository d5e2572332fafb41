#pragma once

#include <scribe/lang/lexer.hpp>
#include <scribe/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

// One syntactic unit: its tokens, the statements of its nested block (if
// any) and the comment block written directly above it.
struct Statement {
    TokenList tokens;
    std::vector<Statement> block;
    std::optional<std::string> comments;
    int comments_line = 0;

    bool has_block() const { return !block.empty(); }

    // Line of the first token, 0 for an empty statement
    int line() const;

    // All token text concatenated, as used by pattern matching
    std::string to_string() const;

    // Rendered text up to the first line break
    std::string first_line() const;
};

// Group a lexed token stream into statements with nested blocks.
// Comments that end on the line right above a statement become its
// docstring.
Result<std::vector<Statement>> build_statements(const LexResult& lexed);

// Convenience: lex + build in one call
Result<std::vector<Statement>> parse_statements(const std::string& source,
                                                const std::string& filename = "<input>");

} // namespace scribe
