#include "eqpp/errors.hpp"

#include <sstream>
#include <utility>

namespace eqpp {

std::string
to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnexpectedToken:
            return "UnexpectedToken";
        case ParseErrorKind::UnterminatedGroup:
            return "UnterminatedGroup";
        case ParseErrorKind::EmptyInput:
            return "EmptyInput";
    }
    return "Unknown";
}

std::string
to_string(BindErrorKind kind) {
    switch (kind) {
        case BindErrorKind::UnknownIdentifier:
            return "UnknownIdentifier";
        case BindErrorKind::ArityMismatch:
            return "ArityMismatch";
        case BindErrorKind::UnsupportedConstruct:
            return "UnsupportedConstruct";
        case BindErrorKind::DuplicateDerivative:
            return "DuplicateDerivative";
        case BindErrorKind::DivisionByZero:
            return "DivisionByZero";
    }
    return "Unknown";
}

ParseError::ParseError(ParseErrorKind kind, std::size_t offset, const std::string &message)
  : std::runtime_error(to_string(kind) + " at offset " + std::to_string(offset) + ": " + message)
  , kind_(kind)
  , offset_(offset) {}

BindError::BindError(BindErrorKind kind,
                     std::string identifier,
                     std::size_t offset,
                     const std::string &message,
                     std::size_t expected,
                     std::size_t actual)
  : std::runtime_error(to_string(kind) + ": " + message)
  , kind_(kind)
  , identifier_(std::move(identifier))
  , offset_(offset)
  , expected_(expected)
  , actual_(actual) {}

namespace {

std::string
summarize(const std::vector<FieldError> &errors) {
    std::stringstream ss;
    ss << "Invalid request payload";
    for (const auto &e : errors) { ss << "; " << e.field << ": " << e.message; }
    return ss.str();
}

} // namespace

InvalidRequestError::InvalidRequestError(std::vector<FieldError> errors)
  : std::invalid_argument(summarize(errors))
  , errors_(std::move(errors)) {}

DimensionMismatchError::DimensionMismatchError(std::size_t index, std::size_t expected, std::size_t actual)
  : std::invalid_argument("Initial condition " + std::to_string(index) + " has length " + std::to_string(actual) +
                          ", system dimension is " + std::to_string(expected) + ".")
  , index_(index)
  , expected_(expected)
  , actual_(actual) {}

} // namespace eqpp
