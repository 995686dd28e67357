#include "tokenizer.hpp"
#include <common/decimal.hpp>
#include <cctype>
#include <cstring>

namespace trailsketch {
namespace parser {

namespace {

bool is_command_char(char c) {
    return c != '\0' && std::strchr("MmLlHhVvCcSsQqTtAaZz", c) != nullptr;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

char Tokenizer::current() const {
    if (at_end()) return '\0';
    return input_[pos_];
}

void Tokenizer::advance() {
    if (!at_end()) {
        pos_++;
    }
}

void Tokenizer::skip_whitespace() {
    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
            advance();
        } else {
            break;
        }
    }
}

Token Tokenizer::make_token(TokenType type, size_t start) {
    return Token{type, std::string(input_.substr(start, pos_ - start)), start, std::nullopt};
}

Token Tokenizer::peek() {
    if (!peeked_) {
        peeked_ = next();
    }
    return *peeked_;
}

Token Tokenizer::next() {
    if (peeked_) {
        Token t = *peeked_;
        peeked_.reset();
        return t;
    }
    return scan_token();
}

void Tokenizer::reset(size_t offset) {
    pos_ = offset < input_.size() ? offset : input_.size();
    peeked_.reset();
}

Token Tokenizer::next_flag() {
    skip_whitespace();
    size_t start = pos_;
    char c = current();
    if (c == '0' || c == '1') {
        advance();
        Token t = make_token(TokenType::Number, start);
        t.number = (c == '1') ? 1.0 : 0.0;
        return t;
    }
    if (at_end()) {
        return make_token(TokenType::EndOfFile, start);
    }
    advance();
    return make_token(TokenType::Unknown, start);
}

Token Tokenizer::scan_token() {
    skip_whitespace();

    size_t start = pos_;
    if (at_end()) {
        return make_token(TokenType::EndOfFile, start);
    }

    char c = current();

    if (c == ',') {
        advance();
        return make_token(TokenType::Comma, start);
    }

    if (is_command_char(c)) {
        advance();
        Token t = make_token(TokenType::Command, start);
        t.command = c;
        return t;
    }

    if (is_digit(c) || c == '.' || c == '-' || c == '+') {
        return scan_number();
    }

    // Unknown character
    advance();
    return make_token(TokenType::Unknown, start);
}

Token Tokenizer::scan_number() {
    size_t start = pos_;

    if (current() == '-' || current() == '+') {
        advance();
    }

    bool has_digits = false;
    while (is_digit(current())) {
        advance();
        has_digits = true;
    }

    if (current() == '.') {
        advance();
        while (is_digit(current())) {
            advance();
            has_digits = true;
        }
    }

    if (!has_digits) {
        return make_token(TokenType::Unknown, start);
    }

    // Exponent only when followed by digits, so "1e" stays a bad token
    if (current() == 'e' || current() == 'E') {
        size_t save = pos_;
        advance();
        if (current() == '-' || current() == '+') {
            advance();
        }
        if (is_digit(current())) {
            while (is_digit(current())) {
                advance();
            }
        } else {
            pos_ = save;
        }
    }

    Token t = make_token(TokenType::Number, start);
    t.number = parse_decimal(t.text);
    if (!t.number) {
        t.type = TokenType::Unknown;
    }
    return t;
}

}  // namespace parser
}  // namespace trailsketch
