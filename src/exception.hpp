#pragma once

#include <stdexcept>
#include <string>

class BorealisException : public std::runtime_error {
public:
    explicit BorealisException(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed version, dependency or output format strings.
class FormatError : public BorealisException {
public:
    using BorealisException::BorealisException;
};

// Required package metadata missing, or an unknown field in strict mode.
class MetadataError : public BorealisException {
public:
    using BorealisException::BorealisException;
};

class NoConfigFoundError : public BorealisException {
public:
    using BorealisException::BorealisException;
};

// Bad command line or an undefined capability name.
class UsageError : public BorealisException {
public:
    using BorealisException::BorealisException;
};
