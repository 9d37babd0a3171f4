#pragma once
#include <string_view>
#include <vector>
#include "formula/token.hpp"

namespace formula {

/// Pull tokenizer. Never throws: characters it cannot classify come back as
/// one-character Punctuation tokens so the parser can report them by position.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    Token lex_string(char quote);
    Token lex_number();

    std::string_view s_;
    std::size_t i_{0};
};

/// Whole token stream, always terminated by an End token.
std::vector<Token> tokenize(std::string_view source);

} // namespace formula
