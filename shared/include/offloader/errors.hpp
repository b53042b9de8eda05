#pragma once

#include <stdexcept>
#include <string>

// errors carry a machine readable code in front of the message: "<code>: <message>"
std::string error_code(const std::exception &e);

class MountError : public std::runtime_error {
public:
    enum class Kind {
        Unreachable,
        AuthFailed,
        Busy,
        NotFound
    };

    MountError(const Kind &kind, const std::string &message);

    Kind getKind() const;
    static std::string kindName(const Kind &kind);

private:
    Kind kind;
};

class EnumerationError : public std::runtime_error {
public:
    enum class Kind {
        Empty,
        Unreadable
    };

    EnumerationError(const Kind &kind, const std::string &message);

    Kind getKind() const;
    static std::string kindName(const Kind &kind);

private:
    Kind kind;
};

class TransferError : public std::runtime_error {
public:
    enum class Kind {
        IOError,
        SystemicIOError,
        VerificationMismatch
    };

    TransferError(const Kind &kind, const std::string &message);

    Kind getKind() const;
    static std::string kindName(const Kind &kind);

private:
    Kind kind;
};
