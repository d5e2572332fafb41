#pragma once

#include <scribe/lang/ruby_token.hpp>
#include <scribe/result.hpp>
#include <string>
#include <vector>

namespace scribe {

struct LexResult {
    TokenList tokens;
    std::vector<Comment> comments;
};

// Lex Ruby source into tokens + preserved comments. Whitespace and line
// breaks are kept as tokens so a statement's text can be rebuilt exactly.
// Heredocs and %-literals are not recognized.
Result<LexResult> lex(const std::string& source,
                      const std::string& filename = "<input>");

} // namespace scribe
