#include "formula/lexer.hpp"
#include <cctype>
#include <cstdlib>

namespace formula {

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::Number:      return "number";
        case TokKind::String:      return "string";
        case TokKind::Ident:       return "identifier";
        case TokKind::Operator:    return "operator";
        case TokKind::Punctuation: return "punctuation";
        case TokKind::Mention:     return "mention";
        case TokKind::End:         return "eof";
    }
    return "unknown";
}

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::lex_string(char quote) {
    std::size_t start = i_++;
    std::string text;
    while (!is_end() && s_[i_] != quote) {
        char c = s_[i_++];
        if (c == '\\' && !is_end()) {
            char e = s_[i_++];
            switch (e) {
                case 'n': text += '\n'; break;
                case 't': text += '\t'; break;
                default:  text += e; break; // \" \' \\ and anything else stand for themselves
            }
            continue;
        }
        text += c;
    }
    if (is_end()) {
        // unterminated: hand back the bare quote and resume right after it
        i_ = start + 1;
        return Token{TokKind::Punctuation, std::string(1, quote), start};
    }
    ++i_; // closing quote
    return Token{TokKind::String, std::move(text), start};
}

Token Lexer::lex_number() {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;
    if (i_ + 1 < s_.size() && s_[i_] == '.' && is_digit(s_[i_ + 1])) {
        ++i_;
        while (!is_end() && is_digit(s_[i_])) ++i_;
    }
    Token t{TokKind::Number, std::string(s_.substr(start, i_ - start)), start};
    t.number = std::strtod(t.text.c_str(), nullptr);
    return t;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return Token{TokKind::End, "", s_.size()};

    const std::size_t pos = i_;
    char c = s_[i_];
    char n = (i_ + 1 < s_.size()) ? s_[i_ + 1] : '\0';

    // two-character operators first
    if ((c == '=' && n == '=') || (c == '!' && n == '=') || (c == '<' && n == '=') ||
        (c == '>' && n == '=') || (c == '<' && n == '>')) {
        i_ += 2;
        return Token{TokKind::Operator, std::string(s_.substr(pos, 2)), pos};
    }

    switch (c) {
        case '+': case '-': case '*': case '/': case '%':
        case '=': case '<': case '>':
            ++i_;
            return Token{TokKind::Operator, std::string(1, c), pos};
        case '"':
        case '\'':
            return lex_string(c);
        default:
            break;
    }

    if (c == '@' && is_ident_start(n)) {
        std::size_t start = ++i_;
        while (!is_end() && is_ident_char(s_[i_])) ++i_;
        return Token{TokKind::Mention, std::string(s_.substr(start, i_ - start)), pos};
    }

    if (is_ident_start(c)) {
        std::size_t start = i_++;
        while (!is_end() && is_ident_char(s_[i_])) ++i_;
        return Token{TokKind::Ident, std::string(s_.substr(start, i_ - start)), pos};
    }

    if (is_digit(c)) return lex_number();

    // ( ) , . [ ] ? : and any stray character
    ++i_;
    return Token{TokKind::Punctuation, std::string(1, c), pos};
}

std::vector<Token> tokenize(std::string_view source) {
    Lexer lex(source);
    std::vector<Token> out;
    for (;;) {
        out.push_back(lex.next());
        if (out.back().kind == TokKind::End) break;
    }
    return out;
}

} // namespace formula
