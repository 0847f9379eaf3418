#pragma once

#include <stdexcept>
#include <string>

namespace omotes {

/**
 * Base exception for all OMOTES SDK errors.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if a required field was absent and no default was available.
     */
    virtual bool is_missing_field() const { return false; }

    /**
     * Returns true if a field was present but of an incompatible kind.
     */
    virtual bool is_wrong_field_type() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if a wire message could not be decoded.
     */
    virtual bool is_decode_error() const { return false; }

    /**
     * Returns true if a configuration source could not be loaded.
     */
    virtual bool is_config_error() const { return false; }
};

/**
 * Thrown when a workflow configuration does not contain a required field
 * and no default value is available.
 */
class MissingFieldException : public ClientError {
public:
    explicit MissingFieldException(const std::string& message)
        : ClientError(message) {}

    bool is_missing_field() const override { return true; }
};

/**
 * Thrown when a workflow configuration contains a value of the wrong type
 * for some parameter and no default value is available.
 */
class WrongFieldTypeException : public ClientError {
public:
    explicit WrongFieldTypeException(const std::string& message)
        : ClientError(message) {}

    bool is_wrong_field_type() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when a timestamp cannot be parsed.
 */
class InvalidTimestampError : public ClientError {
public:
    explicit InvalidTimestampError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when bytes received from the message bus are not a valid
 * protobuf message of the expected kind.
 */
class MessageDecodeError : public ClientError {
public:
    MessageDecodeError(const std::string& message, const std::string& message_type)
        : ClientError(message), message_type_(message_type) {}

    const std::string& message_type() const { return message_type_; }

    bool is_decode_error() const override { return true; }

private:
    std::string message_type_;
};

/**
 * Thrown when a configuration file cannot be read or parsed.
 */
class ConfigError : public ClientError {
public:
    explicit ConfigError(const std::string& message)
        : ClientError(message) {}

    bool is_config_error() const override { return true; }
};

} // namespace omotes
