#pragma once

#include <stdexcept>
#include <string>

namespace seasonkit::core {

/**
 * @brief Input data or configuration that cannot be decomposed
 * (non-finite or non-positive values, bad window settings, unknown options).
 */
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief A seasonal period outside the range the series can support.
 */
class InvalidPeriodError : public std::invalid_argument {
public:
	explicit InvalidPeriodError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Parallel sequences (periods/windows, timestamps/values) of different length.
 */
class MismatchedLengthError : public std::invalid_argument {
public:
	explicit MismatchedLengthError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief A weighted regression system without a unique solution.
 *
 * Raised by the polynomial solver; the smoother resolves it by refitting at a
 * lower degree, so it does not escape a decomposition.
 */
class NumericalInstabilityError : public std::runtime_error {
public:
	explicit NumericalInstabilityError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace seasonkit::core
