#ifndef TRAILSKETCH_PARSER_TOKEN_HPP
#define TRAILSKETCH_PARSER_TOKEN_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace trailsketch {
namespace parser {

enum class TokenType {
    Command,    // one of MmLlHhVvCcSsQqTtAaZz
    Number,
    Comma,
    EndOfFile,
    Unknown
};

struct Token {
    TokenType type;
    std::string text;
    size_t offset;                  // position in the path data
    std::optional<double> number;   // For Number tokens
    char command = '\0';            // For Command tokens
};

}  // namespace parser
}  // namespace trailsketch

#endif // TRAILSKETCH_PARSER_TOKEN_HPP
