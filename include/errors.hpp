#pragma once
#include <stdexcept>
#include <string>

// Bad command line; reported with usage, exit code 2.
class ArgumentError : public std::runtime_error {
public:
    explicit ArgumentError(const std::string& message)
        : std::runtime_error(message) {}
};

class InputOpenError : public std::runtime_error {
public:
    explicit InputOpenError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised mid-stream; whatever was counted so far is dropped.
class InputReadError : public std::runtime_error {
public:
    explicit InputReadError(const std::string& message)
        : std::runtime_error(message) {}
};

// Any write/flush failure except the reader closing the pipe.
class OutputWriteError : public std::runtime_error {
public:
    explicit OutputWriteError(const std::string& message)
        : std::runtime_error(message) {}
};
