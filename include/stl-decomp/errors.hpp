#pragma once

#include <stdexcept>
#include <string>

namespace stldecomp {

/**
 * @brief Raised when smoother or decomposition parameters are invalid or contradictory.
 *
 * Thrown while settings are constructed or resolved, never during the numeric iteration.
 */
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Raised when input data does not have the shape a stage requires.
 *
 * Covers mismatched lengths, too little history for the periodicity and
 * timestamps that are not strictly increasing.
 */
class InputShapeError : public std::invalid_argument {
public:
	explicit InputShapeError(const std::string &message) : std::invalid_argument(message) {
	}
};

} // namespace stldecomp
