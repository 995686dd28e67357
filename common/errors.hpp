#ifndef TRAILSKETCH_COMMON_ERRORS_HPP
#define TRAILSKETCH_COMMON_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace trailsketch {

// Failure kinds raised by pipeline stages. Each stage raises exactly one
// kind and callers see it unchanged.
enum class ErrorKind {
    Parse,               // malformed drawing input
    UnsupportedElement,  // drawing primitive outside the supported set
    EmptyDrawing,        // nothing to merge
    DegeneratePath,      // zero-length path cannot be normalized
    InvalidAnchor,       // anchor unusable for projection
    CorruptRoute         // malformed or out-of-range route file
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse: return "ParseError";
        case ErrorKind::UnsupportedElement: return "UnsupportedElement";
        case ErrorKind::EmptyDrawing: return "EmptyDrawing";
        case ErrorKind::DegeneratePath: return "DegeneratePath";
        case ErrorKind::InvalidAnchor: return "InvalidAnchor";
        case ErrorKind::CorruptRoute: return "CorruptRoute";
    }
    return "Unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error(ErrorKind::Parse, message) {}

    // offset: character position in the path data where parsing failed
    ParseError(const std::string& message, size_t offset)
        : Error(ErrorKind::Parse, message + " (at offset " + std::to_string(offset) + ")")
        , offset_(offset) {}

    std::optional<size_t> offset() const { return offset_; }

private:
    std::optional<size_t> offset_;
};

class UnsupportedElement : public Error {
public:
    explicit UnsupportedElement(const std::string& element)
        : Error(ErrorKind::UnsupportedElement,
                "drawing contains unsupported element <" + element + ">")
        , element_(element) {}

    const std::string& element() const { return element_; }

private:
    std::string element_;
};

class EmptyDrawing : public Error {
public:
    explicit EmptyDrawing(const std::string& message = "drawing contains no path outlines")
        : Error(ErrorKind::EmptyDrawing, message) {}
};

class DegeneratePath : public Error {
public:
    explicit DegeneratePath(const std::string& message = "path has zero length")
        : Error(ErrorKind::DegeneratePath, message) {}
};

class InvalidAnchor : public Error {
public:
    explicit InvalidAnchor(const std::string& message)
        : Error(ErrorKind::InvalidAnchor, message) {}
};

class CorruptRoute : public Error {
public:
    explicit CorruptRoute(const std::string& message)
        : Error(ErrorKind::CorruptRoute, message) {}
};

}  // namespace trailsketch

#endif // TRAILSKETCH_COMMON_ERRORS_HPP
