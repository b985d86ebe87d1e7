#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file error.hpp
 * @brief Error codes and exception types for objbridge
 */

/**
 * @brief Error codes
 */
typedef enum : int32_t {
    OB_SUCCESS = 0,
    OB_ERROR_NO_RUNTIME = -1,
    OB_ERROR_CLASS_NOT_FOUND = -2,
    OB_ERROR_SELECTOR_NOT_FOUND = -3,
    OB_ERROR_NIL_RECEIVER = -4,
    OB_ERROR_ENCODING_MISMATCH = -5,
    OB_ERROR_ARITY_MISMATCH = -6,
    OB_ERROR_NUMERIC_OVERFLOW = -7,
    OB_ERROR_INVALID_ARGUMENT = -8,
    OB_ERROR_INVALID_HANDLE = -9,
    OB_ERROR_OWNERSHIP_VIOLATION = -10,
    OB_ERROR_INVALID_DECLARATION = -11,
    OB_ERROR_CLASS_EXISTS = -12,
    OB_ERROR_ANCESTRY_MISMATCH = -13,
    OB_ERROR_NOT_SUPPORTED = -14
} OBError;

/**
 * @brief Get default error message for error code
 *
 * @param code Error code
 * @return Constant string with error message
 */
const char* ob_error_message(OBError code);

namespace objbridge {

/**
 * @brief Exception class for objbridge errors
 */
class OBException : public std::runtime_error {
private:
    OBError code_;

public:
    OBException(OBError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    OBError code() const noexcept { return code_; }
};

/**
 * @brief A selector or class could not be resolved for the target
 *
 * Raised for a missing selector along the whole ancestry chain, a nil
 * receiver on a selector that is not nil-tolerant, or an unknown class.
 * Recoverable: the caller may retry or degrade.
 */
class ResolutionError : public OBException {
public:
    using OBException::OBException;
};

/**
 * @brief An argument or return value is not representable in the target type
 *
 * The foreign call is never attempted when this is thrown.
 */
class ConversionError : public OBException {
public:
    using OBException::OBException;
};

/**
 * @brief A declaration handed to the class builder is malformed
 */
class GenerationError : public OBException {
public:
    using OBException::OBException;
};

/**
 * @brief Thrown by the opt-in throwing ownership violation handler
 */
class OwnershipViolationError : public OBException {
public:
    explicit OwnershipViolationError(const std::string& message)
        : OBException(OB_ERROR_OWNERSHIP_VIOLATION, message) {}
};

} // namespace objbridge
