#pragma once
#include <stdexcept>
#include <string>

namespace yieldguard {

// ---------------------------------------------------------------------------
// Error taxonomy.
//
//   ConfigurationError      startup parameters missing/invalid. Fatal.
//   ValidationError         bad caller input (negative amount, unknown mode).
//   CollaboratorUnavailable network / feed failure. Logged, step skipped.
//   StorageWriteError       audit persistence failed. Driver retries.
//   LedgerInvariantError    internal defect. Never caught by the driver.
// ---------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class UnknownModeError : public ValidationError {
public:
    explicit UnknownModeError(const std::string& name)
        : ValidationError("unknown spending mode: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class CollaboratorUnavailable : public std::runtime_error {
public:
    explicit CollaboratorUnavailable(const std::string& msg)
        : std::runtime_error(msg) {}
};

class StorageWriteError : public std::runtime_error {
public:
    explicit StorageWriteError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class LedgerInvariantError : public std::logic_error {
public:
    explicit LedgerInvariantError(const std::string& msg)
        : std::logic_error(msg) {}
};

} // namespace yieldguard
