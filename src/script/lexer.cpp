#include "script/lexer.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include "script/script_error.hpp"

namespace toolbridge::script {

namespace {

// Longest first so that "===" wins over "==" and "=".
constexpr std::array<const char*, 49> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "?\?=",
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--", "+=",
    "-=", "*=", "/=", "%=", "&=", "|=", "^=", "**", "<<", ">>",
    "{", "}", "(", ")", "[", "]", ";", ",", "<", ">", "+", "-", "*", "/", "%", "!"};

constexpr std::array<char, 8> kSingleExtra = {'?', ':', '=', '.', '&', '|', '^', '~'};

bool is_identifier_start(const char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) != 0 || c == '_' || c == '$' || u >= 0x80;
}

bool is_identifier_part(const char c) {
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void append_utf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

}  // namespace

Lexer::Lexer(std::string source, const int first_line)
    : source_(std::move(source)), line_(first_line) {}

char Lexer::peek(const std::size_t offset) const {
    const std::size_t index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
}

void Lexer::fail(const std::string& message) const {
    throw ScriptError(make_error_object("SyntaxError",
                                        message + " (line " + std::to_string(line_) + ")"));
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        bool newline_seen = false;
        skip_trivia(newline_seen);
        if (at_end()) {
            Token end;
            end.type = TokenType::End;
            end.line = line_;
            end.newline_before = true;
            tokens.push_back(end);
            return tokens;
        }

        const int start_line = line_;
        const char c = peek();
        Token token;
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
            token = read_number();
        } else if (c == '"' || c == '\'') {
            token = read_string(c);
        } else if (c == '`') {
            token = read_template();
        } else if (is_identifier_start(c)) {
            token = read_identifier();
        } else {
            token = read_punctuator();
        }
        token.line = start_line;
        token.newline_before = newline_seen;
        tokens.push_back(std::move(token));
    }
}

void Lexer::skip_trivia(bool& newline_seen) {
    while (!at_end()) {
        const char c = peek();
        if (c == '\n') {
            newline_seen = true;
            ++line_;
            ++pos_;
        } else if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++pos_;
        } else if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n') {
                ++pos_;
            }
        } else if (c == '/' && peek(1) == '*') {
            pos_ += 2;
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                if (peek() == '\n') {
                    newline_seen = true;
                    ++line_;
                }
                ++pos_;
            }
            if (at_end()) {
                fail("Unterminated comment");
            }
            pos_ += 2;
        } else {
            return;
        }
    }
}

Token Lexer::read_number() {
    Token token;
    token.type = TokenType::Number;
    const std::size_t start = pos_;

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' ||
                          peek(1) == 'B' || peek(1) == 'o' || peek(1) == 'O')) {
        const char kind = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        const int base = kind == 'x' ? 16 : (kind == 'b' ? 2 : 8);
        pos_ += 2;
        const std::size_t digits_start = pos_;
        while (std::isxdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
        if (pos_ == digits_start) {
            fail("Invalid number literal");
        }
        const std::string digits = source_.substr(digits_start, pos_ - digits_start);
        char* end = nullptr;
        token.number = static_cast<double>(std::strtoull(digits.c_str(), &end, base));
        if (end == nullptr || *end != '\0') {
            fail("Invalid number literal");
        }
    } else {
        while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
        if (peek() == '.') {
            ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                ++pos_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            std::size_t look = 1;
            if (peek(1) == '+' || peek(1) == '-') {
                look = 2;
            }
            if (std::isdigit(static_cast<unsigned char>(peek(look))) != 0) {
                pos_ += look;
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                    ++pos_;
                }
            }
        }
        token.number = std::strtod(source_.substr(start, pos_ - start).c_str(), nullptr);
    }

    if (is_identifier_start(peek())) {
        fail("Invalid or unexpected token after number");
    }
    token.text = source_.substr(start, pos_ - start);
    return token;
}

void Lexer::read_escape(std::string& out) {
    // pos_ is on the character after the backslash.
    const char c = peek();
    ++pos_;
    switch (c) {
        case 'n': out.push_back('\n'); return;
        case 't': out.push_back('\t'); return;
        case 'r': out.push_back('\r'); return;
        case 'b': out.push_back('\b'); return;
        case 'f': out.push_back('\f'); return;
        case 'v': out.push_back('\v'); return;
        case '0': out.push_back('\0'); return;
        case '\n': ++line_; return;
        case 'x': {
            const std::string hex = source_.substr(pos_, 2);
            if (hex.size() != 2 || std::isxdigit(static_cast<unsigned char>(hex[0])) == 0 ||
                std::isxdigit(static_cast<unsigned char>(hex[1])) == 0) {
                fail("Invalid hexadecimal escape sequence");
            }
            pos_ += 2;
            append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
            return;
        }
        case 'u': {
            std::string hex;
            if (peek() == '{') {
                const std::size_t close = source_.find('}', pos_);
                if (close == std::string::npos) {
                    fail("Invalid Unicode escape sequence");
                }
                hex = source_.substr(pos_ + 1, close - pos_ - 1);
                pos_ = close + 1;
            } else {
                hex = source_.substr(pos_, 4);
                pos_ += 4;
            }
            if (hex.empty() || hex.size() > 6) {
                fail("Invalid Unicode escape sequence");
            }
            for (const char h : hex) {
                if (std::isxdigit(static_cast<unsigned char>(h)) == 0) {
                    fail("Invalid Unicode escape sequence");
                }
            }
            append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
            return;
        }
        default:
            out.push_back(c);
            return;
    }
}

Token Lexer::read_string(const char quote) {
    Token token;
    token.type = TokenType::String;
    ++pos_;
    while (true) {
        if (at_end() || peek() == '\n') {
            fail("Unterminated string literal");
        }
        const char c = peek();
        if (c == quote) {
            ++pos_;
            return token;
        }
        if (c == '\\') {
            ++pos_;
            read_escape(token.text);
            continue;
        }
        token.text.push_back(c);
        ++pos_;
    }
}

// Returns the raw source of a ${...} substitution; pos_ is just past "${".
std::string Lexer::scan_substitution() {
    const std::size_t start = pos_;
    int depth = 0;
    while (!at_end()) {
        const char c = peek();
        if (c == '\n') {
            ++line_;
        }
        if (c == '\'' || c == '"') {
            ++pos_;
            while (!at_end() && peek() != c) {
                if (peek() == '\\') {
                    ++pos_;
                }
                ++pos_;
            }
        } else if (c == '`') {
            read_template();
            continue;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth == 0) {
                std::string expression = source_.substr(start, pos_ - start);
                ++pos_;
                return expression;
            }
            --depth;
        }
        ++pos_;
    }
    fail("Unterminated template substitution");
}

Token Lexer::read_template() {
    Token token;
    token.type = TokenType::Template;
    ++pos_;
    std::string chunk;
    while (true) {
        if (at_end()) {
            fail("Unterminated template literal");
        }
        const char c = peek();
        if (c == '`') {
            ++pos_;
            token.quasis.push_back(chunk);
            return token;
        }
        if (c == '\\') {
            ++pos_;
            read_escape(chunk);
            continue;
        }
        if (c == '$' && peek(1) == '{') {
            pos_ += 2;
            token.quasis.push_back(chunk);
            chunk.clear();
            token.substitutions.push_back(scan_substitution());
            continue;
        }
        if (c == '\n') {
            ++line_;
        }
        chunk.push_back(c);
        ++pos_;
    }
}

Token Lexer::read_identifier() {
    Token token;
    token.type = TokenType::Identifier;
    const std::size_t start = pos_;
    while (!at_end() && is_identifier_part(peek())) {
        ++pos_;
    }
    token.text = source_.substr(start, pos_ - start);
    return token;
}

Token Lexer::read_punctuator() {
    Token token;
    token.type = TokenType::Punctuator;
    for (const char* candidate : kPunctuators) {
        const std::string text(candidate);
        if (source_.compare(pos_, text.size(), text) == 0) {
            // "a?.5:1" is a conditional, not optional chaining.
            if (text == "?." && std::isdigit(static_cast<unsigned char>(peek(2))) != 0) {
                continue;
            }
            token.text = text;
            pos_ += text.size();
            return token;
        }
    }
    for (const char extra : kSingleExtra) {
        if (peek() == extra) {
            token.text = std::string(1, extra);
            ++pos_;
            return token;
        }
    }
    fail(std::string("Unexpected character '") + peek() + "'");
}

}  // namespace toolbridge::script
