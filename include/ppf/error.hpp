/**
 * @file error.hpp
 * @brief ppf error handling.
 *
 * Every fallible operation returns an Error code; results are delivered
 * through output parameters.
 */

#ifndef PPF_ERROR_HPP
#define PPF_ERROR_HPP

namespace ppf {

/**
 * @brief Error codes returned by decoding and query operations.
 */
enum class Error {
    Ok = 0,                      ///< Success
    StreamExhausted = -1,        ///< Read requested past end of data
    MalformedPacketCount = -2,   ///< Byte count not divisible by item size
    UnsupportedArrayName = -3,   ///< Array name without a known size formula
    ArrayNameCountMismatch = -4, ///< Name buffer does not hold NPPARY names
    ArrayNotFound = -5,          ///< Requested array missing from a dump
    InconsistentDimensions = -6, ///< Dumps disagree on an array length
    EmptyCollection = -7,        ///< Query needs at least one dump
    IoError = -8,                ///< Source could not be opened or read
    MalformedText = -9           ///< Text field is not valid UTF-8
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::StreamExhausted:
        return "Stream exhausted";
    case Error::MalformedPacketCount:
        return "Malformed packet count";
    case Error::UnsupportedArrayName:
        return "Unsupported array name";
    case Error::ArrayNameCountMismatch:
        return "Array name count mismatch";
    case Error::ArrayNotFound:
        return "Array not found";
    case Error::InconsistentDimensions:
        return "Inconsistent dimensions across dumps";
    case Error::EmptyCollection:
        return "Empty collection";
    case Error::IoError:
        return "I/O error";
    case Error::MalformedText:
        return "Malformed text";
    default:
        return "Unknown error";
    }
}

} // namespace ppf

#endif // PPF_ERROR_HPP
