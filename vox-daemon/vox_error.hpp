#pragma once

#include <stdexcept>
#include <string>

enum class VoxErrorKind {
    None,
    Validation,
    Provider,
    ZeroMatch,
    Concatenation,
    Filter,
    Cancelled,
    Archive,
    Storage,
};

const char* toString(VoxErrorKind kind);

// Base for every stage failure thrown inside the engine. The orchestrator
// catches these and turns them into a failed SynthesisResult.
class VoxError : public std::runtime_error {
public:
    VoxError(VoxErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    VoxErrorKind kind() const { return kind_; }

private:
    VoxErrorKind kind_;
};

class VoxValidationError : public VoxError {
public:
    explicit VoxValidationError(const std::string& what) : VoxError(VoxErrorKind::Validation, what) {}
};

class VoxConcatenationError : public VoxError {
public:
    explicit VoxConcatenationError(const std::string& what) : VoxError(VoxErrorKind::Concatenation, what) {}
};

class VoxFilterError : public VoxError {
public:
    explicit VoxFilterError(const std::string& what) : VoxError(VoxErrorKind::Filter, what) {}
};

class VoxArchiveError : public VoxError {
public:
    explicit VoxArchiveError(const std::string& what) : VoxError(VoxErrorKind::Archive, what) {}
};

class VoxStorageError : public VoxError {
public:
    explicit VoxStorageError(const std::string& what) : VoxError(VoxErrorKind::Storage, what) {}
};

class VoxCancelledError : public VoxError {
public:
    VoxCancelledError() : VoxError(VoxErrorKind::Cancelled, "Synthesis was cancelled") {}
};
