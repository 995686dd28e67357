#include "parser.hpp"
#include <common/errors.hpp>
#include <cctype>

namespace trailsketch {
namespace parser {

Parser::Parser(Tokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {
    advance();
}

void Parser::advance() {
    current_ = tokenizer_.next();
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

void Parser::error(const std::string& message) const {
    std::string full = message;
    if (!current_.text.empty()) {
        full += " (got '" + current_.text + "')";
    }
    throw ParseError(full, current_.offset);
}

void Parser::skip_comma() {
    match(TokenType::Comma);
}

bool Parser::at_number() {
    skip_comma();
    return check(TokenType::Number);
}

double Parser::expect_number() {
    skip_comma();
    if (!check(TokenType::Number)) {
        error("expected number");
    }
    double value = *current_.number;
    advance();
    return value;
}

bool Parser::expect_flag() {
    skip_comma();
    tokenizer_.reset(current_.offset);
    Token flag = tokenizer_.next_flag();
    if (flag.type != TokenType::Number) {
        current_ = flag;
        error("expected arc flag 0 or 1");
    }
    advance();
    return *flag.number == 1.0;
}

Vec2 Parser::expect_point(bool relative) {
    double x = expect_number();
    double y = expect_number();
    Vec2 p(x, y);
    return relative ? position_ + p : p;
}

void Parser::flush_subpath() {
    // A lone moveto draws nothing
    if (pending_.size() > 1) {
        outlines_.emplace_back(std::move(pending_));
    }
    pending_.clear();
}

void Parser::begin_subpath(const Vec2& start) {
    flush_subpath();
    pending_.push_back(command::MoveTo{start});
    subpath_start_ = start;
    position_ = start;
    last_command_ = 'M';
}

void Parser::push(PathCommand cmd) {
    // Drawing after a closepath continues from the closed sub-path's start
    if (pending_.empty()) {
        begin_subpath(position_);
    }
    pending_.push_back(std::move(cmd));
}

std::vector<PathOutline> Parser::parse() {
    outlines_.clear();
    pending_.clear();
    position_ = vec2::zero();
    subpath_start_ = vec2::zero();
    last_command_ = '\0';

    if (check(TokenType::EndOfFile)) {
        return {};
    }

    if (!check(TokenType::Command) ||
        (current_.command != 'M' && current_.command != 'm')) {
        error("path data must begin with a moveto");
    }

    while (!check(TokenType::EndOfFile)) {
        if (!check(TokenType::Command)) {
            error("expected path command");
        }
        char cmd = current_.command;
        advance();
        parse_command(cmd);
    }

    flush_subpath();
    return std::move(outlines_);
}

void Parser::parse_command(char cmd) {
    bool relative = std::islower(static_cast<unsigned char>(cmd)) != 0;
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(cmd)));

    if (upper == 'Z') {
        // Closing nothing, or a bare moveto, draws nothing
        if (pending_.size() > 1) {
            pending_.push_back(command::ClosePath{});
        }
        position_ = subpath_start_;
        last_command_ = 'Z';
        flush_subpath();
        return;
    }

    if (upper == 'M') {
        begin_subpath(expect_point(relative));
        // Extra coordinate pairs after a moveto are implicit linetos
        while (at_number()) {
            Vec2 p = expect_point(relative);
            push(command::LineTo{p});
            position_ = p;
            last_command_ = 'L';
        }
        return;
    }

    do {
        switch (upper) {
            case 'L': {
                Vec2 p = expect_point(relative);
                push(command::LineTo{p});
                position_ = p;
                break;
            }
            case 'H': {
                double x = expect_number();
                Vec2 p(relative ? position_.x + x : x, position_.y);
                push(command::LineTo{p});
                position_ = p;
                break;
            }
            case 'V': {
                double y = expect_number();
                Vec2 p(position_.x, relative ? position_.y + y : y);
                push(command::LineTo{p});
                position_ = p;
                break;
            }
            case 'C': {
                Vec2 c1 = expect_point(relative);
                Vec2 c2 = expect_point(relative);
                Vec2 p = expect_point(relative);
                push(command::CubicTo{c1, c2, p});
                last_control_ = c2;
                position_ = p;
                break;
            }
            case 'S': {
                Vec2 c1 = (last_command_ == 'C' || last_command_ == 'S')
                    ? position_ * 2.0 - last_control_
                    : position_;
                Vec2 c2 = expect_point(relative);
                Vec2 p = expect_point(relative);
                push(command::CubicTo{c1, c2, p});
                last_control_ = c2;
                position_ = p;
                break;
            }
            case 'Q': {
                Vec2 c = expect_point(relative);
                Vec2 p = expect_point(relative);
                push(command::QuadTo{c, p});
                last_control_ = c;
                position_ = p;
                break;
            }
            case 'T': {
                Vec2 c = (last_command_ == 'Q' || last_command_ == 'T')
                    ? position_ * 2.0 - last_control_
                    : position_;
                Vec2 p = expect_point(relative);
                push(command::QuadTo{c, p});
                last_control_ = c;
                position_ = p;
                break;
            }
            case 'A': {
                double rx = expect_number();
                double ry = expect_number();
                double rotation = expect_number();
                bool large_arc = expect_flag();
                bool sweep = expect_flag();
                Vec2 p = expect_point(relative);
                push(command::ArcTo{Vec2(rx, ry), rotation, large_arc, sweep, p});
                position_ = p;
                break;
            }
            default:
                error(std::string("unsupported path command '") + cmd + "'");
        }
        last_command_ = upper;
    } while (at_number());
}

std::vector<PathOutline> parse_path_data(std::string_view data) {
    Parser parser{Tokenizer(data)};
    return parser.parse();
}

std::vector<double> parse_number_list(std::string_view data) {
    Tokenizer tokenizer(data);
    std::vector<double> numbers;
    Token token = tokenizer.next();
    while (token.type != TokenType::EndOfFile) {
        if (token.type == TokenType::Number) {
            numbers.push_back(*token.number);
        } else if (token.type != TokenType::Comma) {
            throw ParseError("expected number in list (got '" + token.text + "')", token.offset);
        }
        token = tokenizer.next();
    }
    return numbers;
}

}  // namespace parser
}  // namespace trailsketch
