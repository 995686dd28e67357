#ifndef TRAILSKETCH_PARSER_PARSER_HPP
#define TRAILSKETCH_PARSER_PARSER_HPP

#include "tokenizer.hpp"
#include <drawing/path_outline.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trailsketch {
namespace parser {

// Parses SVG path data into absolute-coordinate outlines, one per
// sub-path. Relative commands, H/V, and the S/T reflected-control
// shorthands are resolved here. Throws ParseError on malformed data.
class Parser {
public:
    explicit Parser(Tokenizer tokenizer);

    std::vector<PathOutline> parse();

private:
    Tokenizer tokenizer_;
    Token current_;

    // Pen state
    Vec2 position_;
    Vec2 subpath_start_;
    Vec2 last_control_;
    char last_command_ = '\0';

    std::vector<PathOutline> outlines_;
    std::vector<PathCommand> pending_;

    void advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    [[noreturn]] void error(const std::string& message) const;

    void skip_comma();
    bool at_number();
    double expect_number();
    bool expect_flag();
    Vec2 expect_point(bool relative);

    void parse_command(char command);
    void begin_subpath(const Vec2& start);
    void flush_subpath();
    void push(PathCommand cmd);
};

// Convenience wrapper: tokenize and parse a `d` attribute
std::vector<PathOutline> parse_path_data(std::string_view data);

// Comma/whitespace separated numbers, as in a polyline `points` attribute
std::vector<double> parse_number_list(std::string_view data);

}  // namespace parser
}  // namespace trailsketch

#endif // TRAILSKETCH_PARSER_PARSER_HPP
