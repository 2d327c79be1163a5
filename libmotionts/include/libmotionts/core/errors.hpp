#pragma once

#include <stdexcept>
#include <string>

namespace libmotionts {
namespace core {

/**
 * Error types raised by libmotionts
 *
 * All errors are unrecoverable at the point of detection and propagate to the
 * caller. Each type derives from the standard exception that best describes
 * its category, so callers may catch either the specific type or the
 * standard base:
 * - std::invalid_argument: bad input (shape, content, configuration)
 * - std::logic_error: operation called in the wrong lifecycle state
 * - std::runtime_error: numerical failure
 */

/// Malformed, empty, jagged or non-finite input, or invalid options
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Caller supplied vectors of the wrong length for the trained shape
class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Paired sequences (predicted vs actual) of unequal length
class LengthMismatchError : public std::invalid_argument {
public:
	explicit LengthMismatchError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// A channel name that is not part of the schema
class ColumnNotFoundError : public std::invalid_argument {
public:
	explicit ColumnNotFoundError(const std::string &column_name)
	    : std::invalid_argument("channel '" + column_name + "' not found in schema"), column_(column_name) {
	}

	const std::string &column() const {
		return column_;
	}

private:
	std::string column_;
};

/// Operation requires a prior successful Fit()
class NotFittedError : public std::logic_error {
public:
	explicit NotFittedError(const std::string &message) : std::logic_error(message) {
	}
};

/// Least-squares system could not be solved even after regularization
class SingularMatrixError : public std::runtime_error {
public:
	explicit SingularMatrixError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace core
} // namespace libmotionts
