#pragma once

#include <string>
#include <vector>

namespace scribe {

// Source position for provenance and error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

// Generic token with type parameter
template<typename T>
struct Token {
    T type;
    std::string text;
    SourcePos pos;
};

// Comment types preserved beside the token stream
enum class CommentKind {
    Line,   // # comment
    Block   // =begin ... =end
};

struct Comment {
    CommentKind kind;
    std::string text;     // content without comment markers
    SourcePos pos;
    int end_line = 0;     // last line covered (differs from pos.line for blocks)
};

} // namespace scribe
