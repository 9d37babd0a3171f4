#pragma once
#include <cstddef>
#include <string>

namespace formula {

enum class TokKind {
    Number,
    String,
    Ident,
    Operator,    // + - * / % = == != <> < > <= >=
    Punctuation, // ( ) , . [ ] ? : and anything unrecognized
    Mention,     // @name
    End,
};

const char* to_string(TokKind k);

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};      // unescaped contents for String, name without '@' for Mention
    std::size_t position{0}; // byte offset of the first character
    double number{0.0};      // Number

    bool is(TokKind k, const char* t) const { return kind == k && text == t; }
};

} // namespace formula
