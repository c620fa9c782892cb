#pragma once

#include <stdexcept>
#include <string>

// Read, write or flush failure on a file or stream
class IoError: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

// The cooperative interrupt flag was observed while collecting entries
class InterruptedError: public std::runtime_error {
    public:
        InterruptedError(): std::runtime_error("Interrupted") {}
};

// A pack index file is structurally invalid
class PackIndexError: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

// Wraps whatever went wrong while opening one of the source pack indices
class OpenIndexError: public std::runtime_error {
    public:
        explicit OpenIndexError(const std::string &cause):
            std::runtime_error("Failed to open pack index: " + cause) {}
};

// Malformed git config or a repository layout we cannot handle
class ConfigError: public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};
