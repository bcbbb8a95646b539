#pragma once

#include "gree_protocol/types.hpp"

#include <exception>
#include <string>

namespace gree_protocol {

/**
 * @brief Base exception class for all protocol and transport errors
 */
class GreeError : public std::exception {
public:
    GreeError(ErrorCode code, const std::string& message) : code_(code), message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const noexcept { return code_; }

protected:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief No response arrived within the caller's window; the caller may retry
 */
class TimeoutError : public GreeError {
public:
    explicit TimeoutError(const std::string& message)
        : GreeError(ErrorCode::TIMEOUT, "Timeout: " + message) {}

protected:
    TimeoutError(ErrorCode code, const std::string& message) : GreeError(code, message) {}
};

/**
 * @brief The device did not answer a bind request in time
 */
class BindingTimeoutError : public TimeoutError {
public:
    explicit BindingTimeoutError(const std::string& message)
        : TimeoutError(ErrorCode::BINDING_TIMEOUT, "Binding timeout: " + message) {}
};

/**
 * @brief Ciphertext malformed, bad padding, or the wrong key was used
 *
 * Retrying with the same key fails identically.
 */
class DecryptionError : public GreeError {
public:
    explicit DecryptionError(const std::string& message)
        : GreeError(ErrorCode::DECRYPTION_FAILURE, "Decryption error: " + message) {}
};

/**
 * @brief Response decrypted but has an unexpected type or malformed fields
 */
class ProtocolError : public GreeError {
public:
    explicit ProtocolError(const std::string& message)
        : GreeError(ErrorCode::PROTOCOL_VIOLATION, "Protocol error: " + message) {}
};

/**
 * @brief Socket level failure reported by the transport
 */
class TransportError : public GreeError {
public:
    explicit TransportError(const std::string& message)
        : GreeError(ErrorCode::TRANSPORT_FAILURE, "Transport error: " + message) {}

protected:
    TransportError(ErrorCode code, const std::string& message) : GreeError(code, message) {}
};

/**
 * @brief Terminal error for receives on a closed and drained stream
 */
class StreamClosedError : public TransportError {
public:
    explicit StreamClosedError(const std::string& message)
        : TransportError(ErrorCode::STREAM_CLOSED, "Stream closed: " + message) {}
};

/**
 * @brief An operation requiring a device key was attempted without one
 */
class NotBoundError : public GreeError {
public:
    explicit NotBoundError(const std::string& message)
        : GreeError(ErrorCode::NOT_BOUND, "Device not bound: " + message) {}
};

} // namespace gree_protocol
