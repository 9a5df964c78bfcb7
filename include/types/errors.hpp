#pragma once

#include <stdexcept>
#include <string>

namespace bob {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct VersionError : Error {
    using Error::Error;
};

struct NetworkError : Error {
    long status = 0;

    explicit NetworkError(const std::string& what, const long status = 0) : Error(what), status(status) {}
};

struct IntegrityError : Error {
    using Error::Error;
};

struct ToolchainError : Error {
    using Error::Error;
};

struct SubprocessError : Error {
    std::string command;
    int exitCode = -1; // -1 when terminated by a signal

    SubprocessError(const std::string& what, std::string command, const int exitCode)
        : Error(what), command(std::move(command)), exitCode(exitCode) {}
};

struct FileBusyError : Error {
    using Error::Error;
};

}
