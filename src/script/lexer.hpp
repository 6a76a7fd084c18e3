#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace toolbridge::script {

enum class TokenType {
    Identifier,
    Number,
    String,
    Template,
    Punctuator,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    // Template literals: cooked text chunks around each ${...} source span.
    std::vector<std::string> quasis;
    std::vector<std::string> substitutions;
    int line = 1;
    bool newline_before = false;
};

// Splits snippet source into tokens. Throws ScriptError (SyntaxError) on
// malformed input.
class Lexer {
public:
    explicit Lexer(std::string source, int first_line = 1);

    std::vector<Token> tokenize();

private:
    char peek(std::size_t offset = 0) const;
    bool at_end() const { return pos_ >= source_.size(); }
    void skip_trivia(bool& newline_seen);
    Token read_number();
    Token read_string(char quote);
    Token read_template();
    Token read_identifier();
    Token read_punctuator();
    void read_escape(std::string& out);
    std::string scan_substitution();
    [[noreturn]] void fail(const std::string& message) const;

    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
};

}  // namespace toolbridge::script
