/**
 * @file error.hpp
 * @brief LERC decoder error handling.
 *
 * Every decoding routine returns an Error code. Builds with exceptions
 * enabled additionally get an exception hierarchy and throw_if_error()
 * for the convenience API in lerc.hpp.
 */

#ifndef LERCDEC_ERROR_HPP
#define LERCDEC_ERROR_HPP

#include "config.hpp"

#if !LERCDEC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace lercdec {

/**
 * @brief Error codes returned by all fallible operations.
 */
enum class Error {
    Ok = 0,                   ///< Success
    InvalidArg = -1,          ///< Invalid argument
    Overflow = -2,            ///< Output buffer overflow
    Underflow = -3,           ///< Buffer underflow (not enough data)
    InvalidData = -4,         ///< Invalid/corrupted data
    InvalidHeader = -5,       ///< Bad magic key or header fields
    UnsupportedVersion = -6,  ///< Codec version not supported
    UnsupportedDataType = -7, ///< Unknown pixel data type
    ChecksumMismatch = -8,    ///< Fletcher32 checksum mismatch
    InvalidMask = -9,         ///< Malformed validity mask
    InvalidBitStuffing = -10, ///< Malformed bit-stuffed block
    InvalidHuffman = -11,     ///< Malformed Huffman code table or stream
    InvalidFpl = -12,         ///< Malformed float-point lossless stream
    InvalidDimensions = -13   ///< Width or height not positive
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
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::InvalidHeader:
        return "Invalid Lerc2 header";
    case Error::UnsupportedVersion:
        return "Unsupported Lerc2 version";
    case Error::UnsupportedDataType:
        return "Unsupported data type";
    case Error::ChecksumMismatch:
        return "Checksum mismatch";
    case Error::InvalidMask:
        return "Invalid validity mask";
    case Error::InvalidBitStuffing:
        return "Invalid bit-stuffed data";
    case Error::InvalidHuffman:
        return "Invalid Huffman data";
    case Error::InvalidFpl:
        return "Invalid float-point lossless data";
    case Error::InvalidDimensions:
        return "Invalid dimensions";
    default:
        return "Unknown error";
    }
}

#if !LERCDEC_NO_EXCEPTIONS

/**
 * @brief Base exception for LERC decoding errors.
 */
class LercException : public std::runtime_error {
public:
    explicit LercException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public LercException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : LercException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for output buffer overflow.
 */
class OverflowException : public LercException {
public:
    explicit OverflowException(const std::string& message)
        : LercException(message, Error::Overflow) {}
};

/**
 * @brief Exception for truncated input.
 */
class UnderflowException : public LercException {
public:
    explicit UnderflowException(const std::string& message)
        : LercException(message, Error::Underflow) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 *
 * Covers every format violation; code() keeps the precise Error.
 */
class InvalidDataException : public LercException {
public:
    explicit InvalidDataException(const std::string& message, Error code = Error::InvalidData)
        : LercException(message, code) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (no-op for Error::Ok)
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const char* context) {
    if (error == Error::Ok) [[likely]] {
        return;
    }

    std::string message = std::string(context) + ": " + error_string(error);
    switch (error) {
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::Underflow:
        throw UnderflowException(message);
    default:
        throw InvalidDataException(message, error);
    }
}

#endif // !LERCDEC_NO_EXCEPTIONS

} // namespace lercdec

#endif // LERCDEC_ERROR_HPP
