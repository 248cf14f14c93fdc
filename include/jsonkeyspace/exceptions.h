#pragma once

#include <stdexcept>
#include <string>
#include <optional> // For optional error_code in base exception

namespace jsonkeyspace {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_PATH = 1001,
    PATH_NOT_FOUND = 1002,
    CONNECTION_FAILED = 2001,
    INVALID_ARGUMENT = 4001,
    WRONG_ARITY = 4002,
    NUMERIC_OVERFLOW = 4003,
    JSON_PARSING_ERROR = 6001,
    UNKNOWN_ERROR = 9999
};

// Base exception for the library
class JsonKeyspaceException : public std::runtime_error {
public:
    explicit JsonKeyspaceException(const std::string& message, std::optional<ErrorCode> code = std::nullopt)
        : std::runtime_error(message), error_code_(code) {}

    std::optional<ErrorCode> error_code() const { return error_code_; }

private:
    std::optional<ErrorCode> error_code_;
};

// -- Path Related Exceptions --
class InvalidPathException : public JsonKeyspaceException {
public:
    explicit InvalidPathException(const std::string& message)
        : JsonKeyspaceException("Invalid Path: " + message, ErrorCode::INVALID_PATH) {}
};

// Raised by commands whose path must resolve (RESP, DEBUG MEMORY)
class PathNotFoundException : public JsonKeyspaceException {
public:
    PathNotFoundException(const std::string& key, const std::string& path_str)
        : JsonKeyspaceException("Path not found for key '" + key + "': " + path_str, ErrorCode::PATH_NOT_FOUND) {}
};


// -- JSON Processing Exceptions --
class JsonParsingException : public JsonKeyspaceException {
public:
    explicit JsonParsingException(const std::string& message)
        : JsonKeyspaceException("JSON Parsing Error: " + message, ErrorCode::JSON_PARSING_ERROR) {}
};


// -- Command Argument Exceptions --
class InvalidArgumentException : public JsonKeyspaceException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : JsonKeyspaceException("Invalid Argument: " + message, ErrorCode::INVALID_ARGUMENT) {}
};

class WrongArityException : public JsonKeyspaceException {
public:
    explicit WrongArityException(const std::string& command)
        : JsonKeyspaceException("wrong number of arguments for '" + command + "' command", ErrorCode::WRONG_ARITY) {}
};

class NumericOverflowException : public JsonKeyspaceException {
public:
    explicit NumericOverflowException(const std::string& message)
        : JsonKeyspaceException("Numeric Overflow: " + message, ErrorCode::NUMERIC_OVERFLOW) {}
};


// -- Redis Communication Exceptions --
class ConnectionException : public JsonKeyspaceException {
public:
    explicit ConnectionException(const std::string& message)
        : JsonKeyspaceException("Redis Connection Error: " + message, ErrorCode::CONNECTION_FAILED) {}
};

} // namespace jsonkeyspace
