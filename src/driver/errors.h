#pragma once

#include <stdexcept>
#include <string>

enum ErrorKind {
    ERR_ARGUMENT,
    ERR_INPUT_NOT_FOUND,
    ERR_UNSUPPORTED_EXTENSION,
    ERR_INVALID_COMBINATION,
    ERR_COMPILE,
    ERR_ENVIRONMENT,
    ERR_IO,
    ERR_UNIMPLEMENTED,
};

const char* errorKindName(ErrorKind kind);

struct DriverError {
    ErrorKind kind;
    std::string message;
};

// Thrown by backends. Everything but UnimplementedFeature is recovered by the dispatcher.
class BackendError : public std::runtime_error {
    ErrorKind errorKind;

protected:
    BackendError(ErrorKind kind, const std::string& message) : std::runtime_error(message), errorKind(kind) {
    }

public:
    ErrorKind kind() const { return errorKind; }
};

class CompileError : public BackendError {
public:
    explicit CompileError(const std::string& message) : BackendError(ERR_COMPILE, message) {
    }
};

class EnvironmentError : public BackendError {
public:
    explicit EnvironmentError(const std::string& message) : BackendError(ERR_ENVIRONMENT, message) {
    }
};

class IOError : public BackendError {
public:
    explicit IOError(const std::string& message) : BackendError(ERR_IO, message) {
    }
};

class UnimplementedFeature : public BackendError {
public:
    explicit UnimplementedFeature(const std::string& message) : BackendError(ERR_UNIMPLEMENTED, message) {
    }
};
