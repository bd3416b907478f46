#pragma once

#include "capabilities.hpp"

#include <stdexcept>
#include <string>

namespace acti {

// Input file does not exist.
class FileNotFoundError : public std::runtime_error {
public:
    explicit FileNotFoundError(const std::string& path)
        : std::runtime_error("File not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Corrupt or unsupported container / record stream.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A backend was asked for an operation outside its capability set.
class CapabilityUnsupportedError : public std::runtime_error {
public:
    CapabilityUnsupportedError(const std::string& backendName, Capability capability)
        : std::runtime_error("Backend '" + backendName + "' does not support " + capabilityName(capability)),
          capability_(capability) {}

    Capability capability() const { return capability_; }

private:
    Capability capability_;
};

// Registry lookup or registration failure.
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Input too short for the requested algorithm to produce any output.
class InsufficientDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace acti
