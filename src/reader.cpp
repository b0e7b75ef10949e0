#include "scheep/reader.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "scheep/error.hpp"

namespace scheep {
namespace {

struct position {
    std::size_t line = 1;
    std::size_t column = 1;
};

enum class token_kind { open, close, quote, string, atom, end };

struct token {
    token_kind kind = token_kind::end;
    std::string text;
    position where;
};

parse_error error_at(position where, const std::string& message, bool incomplete) {
    return parse_error("line " + std::to_string(where.line) + ", column " + std::to_string(where.column) + ": " +
                           message,
                       incomplete);
}

// Splits source text into parentheses, quote marks, string literals and
// atoms. Whitespace and `;` comments are skipped.
class lexer {
public:
    explicit lexer(std::string_view source) : source_(source) {}

    token next() {
        skip_blank();
        token tok;
        tok.where = here_;
        if (at_end()) {
            return tok;
        }

        const char c = advance();
        switch (c) {
            case '(':
                tok.kind = token_kind::open;
                return tok;
            case ')':
                tok.kind = token_kind::close;
                return tok;
            case '\'':
                tok.kind = token_kind::quote;
                return tok;
            case '"':
                tok.kind = token_kind::string;
                tok.text = string_body(tok.where);
                return tok;
            default:
                tok.kind = token_kind::atom;
                tok.text.push_back(c);
                while (!at_end() && !ends_atom(source_[offset_])) {
                    tok.text.push_back(advance());
                }
                return tok;
        }
    }

private:
    [[nodiscard]] bool at_end() const { return offset_ >= source_.size(); }

    [[nodiscard]] static bool ends_atom(char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == '\'' || c == '"' ||
               c == ';';
    }

    char advance() {
        const char c = source_[offset_++];
        if (c == '\n') {
            ++here_.line;
            here_.column = 1;
        } else {
            ++here_.column;
        }
        return c;
    }

    void skip_blank() {
        while (!at_end()) {
            const char c = source_[offset_];
            if (c == ';') {
                while (!at_end() && source_[offset_] != '\n') {
                    advance();
                }
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else {
                return;
            }
        }
    }

    // Recognised escapes: \" \\ \n.
    std::string string_body(position opened) {
        std::string text;
        while (true) {
            if (at_end()) {
                throw error_at(opened, "unterminated string", true);
            }
            const char c = advance();
            if (c == '"') {
                return text;
            }
            if (c != '\\') {
                text.push_back(c);
                continue;
            }
            if (at_end()) {
                throw error_at(opened, "unterminated string", true);
            }
            const position escape_at = here_;
            const char escaped = advance();
            if (escaped == 'n') {
                text.push_back('\n');
            } else if (escaped == '"' || escaped == '\\') {
                text.push_back(escaped);
            } else {
                throw error_at(escape_at, std::string("unknown string escape \\") + escaped, false);
            }
        }
    }

    std::string_view source_;
    std::size_t offset_ = 0;
    position here_;
};

template <typename Number>
bool parse_number(std::string_view text, Number& out) {
    if (text.size() > 1 && text.front() == '+') {
        text.remove_prefix(1);
    }
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc{} && result.ptr == end;
}

// Atoms are booleans, numbers or symbols. `...` and `else` are plain symbols
// here; the pattern matcher and the cond rewrite give them meaning. A lone
// `.` would start a dotted pair, which the evaluator does not model.
value atom_value(const token& tok) {
    const std::string& text = tok.text;
    if (text == "#t") {
        return make_boolean(true);
    }
    if (text == "#f") {
        return make_boolean(false);
    }
    if (text == ".") {
        throw error_at(tok.where, "dotted pairs are not supported", false);
    }
    if (text == "...") {
        return make_symbol(text);
    }

    std::int64_t exact = 0;
    if (parse_number(text, exact)) {
        return make_integer(exact);
    }
    const bool looks_inexact = text.find_first_of(".eE") != std::string::npos;
    double inexact = 0.0;
    if (looks_inexact && parse_number(text, inexact)) {
        return make_float(inexact);
    }
    return make_symbol(text);
}

class reader {
public:
    explicit reader(std::string_view source) : lexer_(source) {}

    std::vector<value> read_all() {
        std::vector<value> exprs;
        for (token tok = lexer_.next(); tok.kind != token_kind::end; tok = lexer_.next()) {
            exprs.push_back(read_from(tok));
        }
        return exprs;
    }

private:
    value read_from(const token& tok) {
        switch (tok.kind) {
            case token_kind::open:
                return read_list_body(tok.where);
            case token_kind::close:
                throw error_at(tok.where, "unexpected ')'", false);
            case token_kind::quote: {
                const token quoted = lexer_.next();
                if (quoted.kind == token_kind::end) {
                    throw error_at(tok.where, "quote without an expression", true);
                }
                return list_from_vector({make_symbol("quote"), read_from(quoted)});
            }
            case token_kind::string:
                return make_string(tok.text);
            case token_kind::atom:
                return atom_value(tok);
            case token_kind::end:
                break;
        }
        throw error_at(tok.where, "unexpected end of input", true);
    }

    value read_list_body(position opened) {
        std::vector<value> items;
        for (token tok = lexer_.next(); tok.kind != token_kind::close; tok = lexer_.next()) {
            if (tok.kind == token_kind::end) {
                throw error_at(opened, "unterminated list", true);
            }
            items.push_back(read_from(tok));
        }
        return list_from_vector(items);
    }

    lexer lexer_;
};

}  // namespace

value read_one(std::string_view source) {
    std::vector<value> exprs = read_all(source);
    if (exprs.size() != 1) {
        throw parse_error("expected exactly one expression, got " + std::to_string(exprs.size()), false);
    }
    return exprs.front();
}

std::vector<value> read_all(std::string_view source) {
    return reader(source).read_all();
}

}  // namespace scheep
