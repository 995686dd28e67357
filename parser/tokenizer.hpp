#ifndef TRAILSKETCH_PARSER_TOKENIZER_HPP
#define TRAILSKETCH_PARSER_TOKENIZER_HPP

#include "token.hpp"
#include <optional>
#include <string_view>

namespace trailsketch {
namespace parser {

// Splits SVG path data into commands, numbers and commas.
// Whitespace is skipped; numbers follow the SVG grammar, so "1.5.5"
// yields 1.5 and .5, and "1-2" yields 1 and -2.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next();           // Get next token
    Token peek();           // Look ahead without consuming
    bool at_end() const;

    // Arc flags may be packed without separators ("a1 1 0 015 5"), so the
    // parser reads them one character at a time.
    Token next_flag();

    // Resume scanning at offset, dropping any look-ahead
    void reset(size_t offset);

private:
    std::string_view input_;
    size_t pos_ = 0;
    std::optional<Token> peeked_;

    void skip_whitespace();
    void advance();
    char current() const;

    Token scan_token();
    Token scan_number();
    Token make_token(TokenType type, size_t start);
};

}  // namespace parser
}  // namespace trailsketch

#endif // TRAILSKETCH_PARSER_TOKENIZER_HPP
