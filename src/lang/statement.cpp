#include <scribe/lang/statement.hpp>
#include <unordered_map>
#include <unordered_set>

namespace scribe {

int Statement::line() const {
    return tokens.empty() ? 0 : tokens.front().pos.line;
}

std::string Statement::to_string() const {
    return render_tokens(tokens);
}

std::string Statement::first_line() const {
    std::string text = to_string();
    auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

namespace {

using RT = RubyTokenType;

bool opens_block(RT t) {
    switch (t) {
    case RT::KwClass:
    case RT::KwModule:
    case RT::KwDef:
    case RT::KwBegin:
    case RT::KwCase:
    case RT::KwWhile:
    case RT::KwUntil:
    case RT::KwFor:
    case RT::KwIf:
    case RT::KwUnless:
        return true;
    default:
        return false;
    }
}

// `x = if ...`, `y ||= begin ...`
bool is_assignment_op(const RubyToken& t) {
    if (t.type != RT::Op || t.text.empty() || t.text.back() != '=') return false;
    return t.text != "==" && t.text != "!=" && t.text != ">=" &&
           t.text != "<=" && t.text != "===";
}

bool is_layout(RT t) {
    return t == RT::Whitespace || t == RT::Newline || t == RT::Semicolon;
}

// A line ending in one of these continues on the next line
bool continues_line(const RubyToken& t) {
    if (t.type == RT::Comma || t.type == RT::Dot || t.type == RT::DoubleColon) return true;
    return t.type == RT::Op && t.text != "?";
}

// ---------------------------------------------------------------------------
// Statement builder
// ---------------------------------------------------------------------------

struct Builder {
    const TokenList& tokens;
    const std::vector<Comment>& comments;
    size_t pos = 0;

    std::unordered_map<int, size_t> line_comments;   // line -> standalone # comment
    std::unordered_map<int, size_t> block_comments;  // end line -> =begin block
    std::unordered_set<size_t> used_comments;

    explicit Builder(const LexResult& lexed)
        : tokens(lexed.tokens), comments(lexed.comments) {
        std::unordered_set<int> code_lines;
        for (const auto& t : tokens) {
            if (!is_layout(t.type) && t.type != RT::Eof) code_lines.insert(t.pos.line);
        }
        for (size_t i = 0; i < comments.size(); ++i) {
            const auto& c = comments[i];
            if (c.kind == CommentKind::Block) {
                block_comments[c.end_line] = i;
            } else if (code_lines.count(c.pos.line) == 0) {
                line_comments[c.pos.line] = i;
            }
        }
    }

    const RubyToken& peek() const {
        return pos < tokens.size() ? tokens[pos] : tokens.back();
    }

    bool at_end() const {
        return pos >= tokens.size() || tokens[pos].type == RT::Eof;
    }

    ScribeError error_at(const std::string& msg, const SourcePos& p) const {
        return ScribeError{ScribeError::Parse, msg, "", p.file, p.line};
    }

    void skip_layout() {
        while (!at_end() && is_layout(peek().type)) ++pos;
    }

    Result<std::vector<Statement>> parse_list(const RubyToken* opener) {
        std::vector<Statement> out;
        while (true) {
            skip_layout();
            if (at_end()) {
                if (opener) {
                    return error_at("missing 'end' for '" + opener->text + "'", opener->pos);
                }
                return Result<std::vector<Statement>>::ok(std::move(out));
            }
            if (peek().type == RT::KwEnd) {
                if (!opener) return error_at("unmatched 'end'", peek().pos);
                ++pos;
                return Result<std::vector<Statement>>::ok(std::move(out));
            }
            auto st = parse_statement();
            if (st.is_err()) return std::move(st).error();
            out.push_back(std::move(st).value());
        }
    }

    Result<Statement> parse_statement() {
        Statement st;
        const RubyToken& first = peek();
        bool has_block = opens_block(first.type);
        const RubyToken* opener = &first;
        bool loop_head = first.type == RT::KwWhile || first.type == RT::KwUntil ||
                         first.type == RT::KwFor;
        int depth = 0;

        while (!at_end()) {
            const RubyToken& t = peek();

            if (depth == 0 && (t.type == RT::Newline || t.type == RT::Semicolon)) {
                const RubyToken* last = last_significant(st.tokens);
                if (t.type == RT::Newline && last && continues_line(*last)) {
                    st.tokens.push_back(t);
                    ++pos;
                    continue;
                }
                break;
            }

            if (depth == 0 && t.type == RT::KwEnd) break;

            if (depth == 0 && t.type == RT::KwDo && !loop_head && !has_block) {
                st.tokens.push_back(t);
                ++pos;
                take_block_params(st.tokens);
                has_block = true;
                opener = &t;
                break;
            }

            if (depth == 0 && !has_block && opens_block(t.type) &&
                t.type != RT::KwClass && t.type != RT::KwModule) {
                const RubyToken* last = last_significant(st.tokens);
                if (last && (is_assignment_op(*last) || last->type == RT::LParen)) {
                    has_block = true;
                    opener = &t;
                }
            }

            if (t.type == RT::LParen || t.type == RT::LBracket || t.type == RT::LBrace) {
                ++depth;
            } else if (t.type == RT::RParen || t.type == RT::RBracket || t.type == RT::RBrace) {
                if (depth > 0) --depth;
            }

            st.tokens.push_back(t);
            ++pos;
        }

        while (!st.tokens.empty() && st.tokens.back().type == RT::Whitespace) {
            st.tokens.pop_back();
        }

        attach_comments(st);

        if (has_block) {
            auto block = parse_list(opener);
            if (block.is_err()) return std::move(block).error();
            st.block = std::move(block).value();
        }

        return Result<Statement>::ok(std::move(st));
    }

    // `do |a, b|` keeps its parameter list in the statement head
    void take_block_params(TokenList& out) {
        size_t save = pos;
        while (!at_end() && peek().type == RT::Whitespace) ++pos;
        if (at_end() || peek().type != RT::Op || (peek().text != "|" && peek().text != "||")) {
            pos = save;
            return;
        }
        for (size_t i = save; i < pos; ++i) out.push_back(tokens[i]);
        if (peek().text == "||") {
            out.push_back(peek());
            ++pos;
            return;
        }
        out.push_back(peek());
        ++pos;
        while (!at_end() && peek().type != RT::Newline) {
            bool closing = peek().type == RT::Op && peek().text == "|";
            out.push_back(peek());
            ++pos;
            if (closing) break;
        }
    }

    static const RubyToken* last_significant(const TokenList& toks) {
        for (auto it = toks.rbegin(); it != toks.rend(); ++it) {
            if (it->type != RT::Whitespace && it->type != RT::Newline) return &*it;
        }
        return nullptr;
    }

    void attach_comments(Statement& st) {
        int line = st.line();
        if (line <= 1) return;

        auto bit = block_comments.find(line - 1);
        if (bit != block_comments.end() && used_comments.count(bit->second) == 0) {
            used_comments.insert(bit->second);
            const auto& c = comments[bit->second];
            st.comments = c.text;
            st.comments_line = c.pos.line;
            return;
        }

        std::vector<size_t> run;
        for (int l = line - 1; l >= 1; --l) {
            auto it = line_comments.find(l);
            if (it == line_comments.end() || used_comments.count(it->second)) break;
            run.push_back(it->second);
        }
        if (run.empty()) return;

        std::string text;
        for (auto it = run.rbegin(); it != run.rend(); ++it) {
            if (!text.empty()) text += "\n";
            text += comments[*it].text;
            used_comments.insert(*it);
        }
        st.comments = text;
        st.comments_line = comments[run.back()].pos.line;
    }
};

} // anonymous namespace

Result<std::vector<Statement>> build_statements(const LexResult& lexed) {
    if (lexed.tokens.empty()) {
        return Result<std::vector<Statement>>::ok({});
    }
    Builder builder(lexed);
    return builder.parse_list(nullptr);
}

Result<std::vector<Statement>> parse_statements(const std::string& source,
                                                const std::string& filename) {
    auto lr = lex(source, filename);
    if (lr.is_err()) return std::move(lr).error();
    return build_statements(lr.value());
}

} // namespace scribe
