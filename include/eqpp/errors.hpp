#ifndef EQPP_ERRORS_HPP
#define EQPP_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace eqpp {

//-----------------------------------------------------------------------------
// Syntax errors
//-----------------------------------------------------------------------------
enum class ParseErrorKind { UnexpectedToken, UnterminatedGroup, EmptyInput };

std::string
to_string(ParseErrorKind kind);

/**
 * @brief Raised by the lexer/parser. Carries the byte offset into the source text
 * so that a front end can underline the offending character.
 */
class ParseError : public std::runtime_error {
  public:
    ParseError(ParseErrorKind kind, std::size_t offset, const std::string &message);

    ParseErrorKind kind() const { return kind_; }
    std::size_t offset() const { return offset_; }

  private:
    ParseErrorKind kind_;
    std::size_t offset_;
};

//-----------------------------------------------------------------------------
// Semantic errors
//-----------------------------------------------------------------------------
enum class BindErrorKind { UnknownIdentifier, ArityMismatch, UnsupportedConstruct, DuplicateDerivative, DivisionByZero };

std::string
to_string(BindErrorKind kind);

class BindError : public std::runtime_error {
  public:
    BindError(BindErrorKind kind,
              std::string identifier,
              std::size_t offset,
              const std::string &message,
              std::size_t expected = 0,
              std::size_t actual = 0);

    BindErrorKind kind() const { return kind_; }
    const std::string &identifier() const { return identifier_; }
    std::size_t offset() const { return offset_; }
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

  private:
    BindErrorKind kind_;
    std::string identifier_;
    std::size_t offset_;
    std::size_t expected_;
    std::size_t actual_;
};

//-----------------------------------------------------------------------------
// Submission errors (no job is created)
//-----------------------------------------------------------------------------
struct FieldError {
    std::string field;
    std::string message;
};

class InvalidRequestError : public std::invalid_argument {
  public:
    explicit InvalidRequestError(std::vector<FieldError> errors);

    const std::vector<FieldError> &errors() const { return errors_; }

  private:
    std::vector<FieldError> errors_;
};

class DimensionMismatchError : public std::invalid_argument {
  public:
    DimensionMismatchError(std::size_t index, std::size_t expected, std::size_t actual);

    std::size_t index() const { return index_; }
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

  private:
    std::size_t index_;
    std::size_t expected_;
    std::size_t actual_;
};

//-----------------------------------------------------------------------------
// Resource errors: retryable, distinct from numerical/semantic failures
//-----------------------------------------------------------------------------
class ResourceError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;

    bool retryable() const { return true; }
};

class CapacityError : public ResourceError {
  public:
    using ResourceError::ResourceError;
};

class StoreError : public ResourceError {
  public:
    using ResourceError::ResourceError;
};

//-----------------------------------------------------------------------------
// Query errors
//-----------------------------------------------------------------------------
class JobNotFoundError : public std::out_of_range {
  public:
    explicit JobNotFoundError(const std::string &job_id)
      : std::out_of_range("job not found: " + job_id) {}
};

class JobNotReadyError : public std::runtime_error {
  public:
    JobNotReadyError(const std::string &job_id, const std::string &state)
      : std::runtime_error("job " + job_id + " has no result yet (state: " + state + ")") {}
};

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace eqpp

#endif // EQPP_ERRORS_HPP
