#include "../include/normalize.hpp"
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <cctype>
#include <cstring>

namespace {

struct Syntax {
    bool hash_comments{false};
    bool slash_comments{false};     // // and /* */
    bool dash_comments{false};
    bool single_quote_strings{false};   // '...' means exactly what "..." means
    bool verbatim_single_quotes{false}; // '...' is a literal kept as written
    bool triple_quotes{false};
    bool backtick_strings{false};
    bool indent_blocks{false};
    bool newline_statements{false};
    bool join_in_braces{false};
};

Syntax syntax_for(const std::string& lang) {
    Syntax s;
    if (lang.empty() || lang == "python") {
        s.hash_comments = s.single_quote_strings = s.triple_quotes = true;
        s.indent_blocks = s.newline_statements = s.join_in_braces = true;
    } else if (lang == "ruby" || lang == "bash" || lang == "shell" || lang == "yaml" ||
               lang == "toml" || lang == "perl" || lang == "r") {
        s.hash_comments = s.verbatim_single_quotes = true;
        s.newline_statements = true;
    } else if (lang == "javascript" || lang == "typescript") {
        s.slash_comments = s.single_quote_strings = s.backtick_strings = true;
        s.newline_statements = true;
    } else if (lang == "go") {
        s.slash_comments = s.verbatim_single_quotes = s.backtick_strings = true;
        s.newline_statements = true;
    } else if (lang == "kotlin" || lang == "swift" || lang == "scala") {
        s.slash_comments = s.verbatim_single_quotes = true;
        s.newline_statements = true;
    } else if (lang == "lua" || lang == "sql" || lang == "haskell") {
        s.dash_comments = s.verbatim_single_quotes = true;
        s.newline_statements = true;
    } else if (lang == "php") {
        s.slash_comments = s.hash_comments = s.verbatim_single_quotes = true;
    } else if (lang == "rust") {
        // 'a is a lifetime, not a quote
        s.slash_comments = true;
    } else {
        s.slash_comments = s.verbatim_single_quotes = true;
    }
    return s;
}

bool is_word(char ch) {
    unsigned char c = (unsigned char)ch;
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

bool is_joinable_op(char c) {
    return c != '\0' && std::strchr("+-*/%<>=!&|^~.:?@#\\", c) != nullptr;
}

// A single space survives only where dropping it would fuse two tokens.
bool needs_space(char prev, char next) {
    if (is_word(prev) && is_word(next)) return true;
    return is_joinable_op(prev) && is_joinable_op(next);
}

std::string canonical_line_endings(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    if (raw.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
    for (; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\r') {
            out += '\n';
            if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
        } else {
            out += c;
        }
    }
    return out;
}

class Normalizer {
public:
    Normalizer(std::string text, Syntax syn) : in_(std::move(text)), syn_(syn) {}

    std::string run() {
        const size_t n = in_.size();
        while (i_ < n) {
            char c = in_[i_];
            if (at_line_start_) {
                if (c == ' ') { ++col_; ++i_; continue; }
                if (c == '\t') { col_ = (col_ / 8 + 1) * 8; ++i_; continue; }
                if (c == '\f') { col_ = 0; ++i_; continue; }
                at_line_start_ = false;
                line_col_ = col_;
                if (c == '#' && !syn_.newline_statements && !syn_.hash_comments) {
                    end_line();
                    in_directive_ = true;
                }
            }
            if (c == '\n') { newline(); ++i_; continue; }
            if (c == '\\' && i_ + 1 < n && in_[i_ + 1] == '\n') {
                pending_ws_ = true;
                i_ += 2;
                at_line_start_ = false;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\f' || c == '\v') { pending_ws_ = true; ++i_; continue; }
            if (skip_comment()) continue;
            if (read_literal()) continue;
            emit(c);
            ++i_;
        }
        end_line();
        std::string out;
        for (size_t k = 0; k < lines_.size(); ++k) {
            if (k) out += '\n';
            out += lines_[k];
        }
        return out;
    }

private:
    void newline() {
        bool joined = paren_depth_ > 0 || (syn_.join_in_braces && brace_depth_ > 0);
        if (in_directive_ || (syn_.newline_statements && !joined)) {
            end_line();
            in_directive_ = false;
        } else {
            pending_ws_ = true;
        }
        at_line_start_ = true;
        col_ = 0;
    }

    void end_line() {
        if (has_code_) lines_.push_back(cur_);
        cur_.clear();
        has_code_ = false;
        pending_ws_ = false;
        last_ = '\0';
    }

    void begin_token(char first) {
        if (!has_code_) {
            if (syn_.indent_blocks) {
                while (indents_.size() > 1 && line_col_ < indents_.back()) indents_.pop_back();
                if (line_col_ > indents_.back()) indents_.push_back(line_col_);
                cur_.append(indents_.size() - 1, '\t');
            }
            has_code_ = true;
        } else if (pending_ws_ && needs_space(last_, first)) {
            cur_ += ' ';
        }
        pending_ws_ = false;
    }

    void emit(char c) {
        begin_token(c);
        cur_ += c;
        last_ = c;
        switch (c) {
            case '(': case '[': ++paren_depth_; break;
            case ')': case ']': if (paren_depth_ > 0) --paren_depth_; break;
            case '{': ++brace_depth_; break;
            case '}': if (brace_depth_ > 0) --brace_depth_; break;
            default: break;
        }
    }

    void emit_literal(const std::string& lit) {
        begin_token(lit.front());
        cur_ += lit;
        last_ = '"';
    }

    bool skip_comment() {
        const size_t n = in_.size();
        char c = in_[i_];
        char next = i_ + 1 < n ? in_[i_ + 1] : '\0';
        bool line_comment = (syn_.hash_comments && c == '#') ||
                            (syn_.slash_comments && c == '/' && next == '/') ||
                            (syn_.dash_comments && c == '-' && next == '-');
        if (line_comment) {
            while (i_ < n && in_[i_] != '\n') ++i_;
            pending_ws_ = true;
            return true;
        }
        if (syn_.slash_comments && c == '/' && next == '*') {
            size_t end = in_.find("*/", i_ + 2);
            size_t stop = end == std::string::npos ? n : end + 2;
            bool spans_lines = in_.find('\n', i_) < stop;
            i_ = stop;
            if (spans_lines) {
                newline();
                at_line_start_ = false;
            } else {
                pending_ws_ = true;
            }
            return true;
        }
        return false;
    }

    // "it\'s" and 'it\'s' and "it's" are one literal.
    static std::string unify_quotes(const std::string& body) {
        std::string out = "\"";
        for (size_t k = 0; k < body.size(); ++k) {
            char d = body[k];
            if (d == '\\' && k + 1 < body.size()) {
                if (body[k + 1] == '\'') out += '\'';
                else { out += d; out += body[k + 1]; }
                ++k;
            } else if (d == '"') {
                out += "\\\"";
            } else {
                out += d;
            }
        }
        out += '"';
        return out;
    }

    bool read_literal() {
        const size_t n = in_.size();
        char c = in_[i_];
        if (syn_.triple_quotes && (c == '"' || c == '\'') &&
            i_ + 2 < n && in_[i_ + 1] == c && in_[i_ + 2] == c) {
            const std::string delim(3, c);
            size_t j = i_ + 3;
            std::string body;
            while (j < n) {
                if (in_[j] == '\\' && j + 1 < n) {
                    body += in_[j];
                    body += in_[j + 1];
                    j += 2;
                    continue;
                }
                if (in_.compare(j, 3, delim) == 0) { j += 3; break; }
                body += in_[j++];
            }
            emit_literal("\"\"\"" + body + "\"\"\"");
            i_ = j;
            return true;
        }

        bool dq = c == '"';
        bool sq = c == '\'' && (syn_.single_quote_strings || syn_.verbatim_single_quotes);
        bool bt = c == '`' && syn_.backtick_strings;
        if (!dq && !sq && !bt) return false;

        size_t j = i_ + 1;
        std::string body;
        bool closed = false;
        while (j < n) {
            char d = in_[j];
            if (d == '\\' && j + 1 < n) {
                body += d;
                body += in_[j + 1];
                j += 2;
                continue;
            }
            if (d == c) { closed = true; ++j; break; }
            if (d == '\n' && !bt) break;
            body += d;
            ++j;
        }
        i_ = j;

        if (closed && syn_.single_quote_strings && (dq || sq)) {
            emit_literal(unify_quotes(body));
        } else {
            std::string lit(1, c);
            lit += body;
            if (closed) lit += c;
            emit_literal(lit);
        }
        return true;
    }

    std::string in_;
    Syntax syn_;
    size_t i_{0};
    std::vector<std::string> lines_;
    std::string cur_;
    bool has_code_{false};
    bool pending_ws_{false};
    bool at_line_start_{true};
    bool in_directive_{false};
    int col_{0};
    int line_col_{0};
    std::vector<int> indents_{0};
    int paren_depth_{0};
    int brace_depth_{0};
    char last_{'\0'};
};

} // namespace

std::string normalize_source(const std::string& raw, const std::string& language) {
    Normalizer n(canonical_line_endings(raw), syntax_for(language));
    return n.run();
}

std::string sha256_hex(const std::string& bytes) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string normalize_and_fingerprint(const std::string& raw, const std::string& language) {
    return "sha256:" + sha256_hex(normalize_source(raw, language));
}

bool is_fingerprint(const std::string& s) {
    static const std::string prefix = "sha256:";
    if (s.size() != prefix.size() + 64 || s.compare(0, prefix.size(), prefix) != 0) return false;
    for (size_t i = prefix.size(); i < s.size(); ++i) {
        char c = s[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}
