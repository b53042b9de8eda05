#include "offloader/errors.hpp"

std::string error_code(const std::exception &e) {
    std::string what = e.what();
    size_t pos = what.find(':');
    if (pos == std::string::npos || what.find(' ') < pos) {
        return "";
    }
    return what.substr(0, pos);
}

MountError::MountError(const Kind &kind, const std::string &message) : std::runtime_error(kindName(kind) + ": " + message), kind(kind) {
}

MountError::Kind MountError::getKind() const {
    return this->kind;
}

std::string MountError::kindName(const Kind &kind) {
    switch (kind) {
        case Kind::Unreachable: return "unreachable";
        case Kind::AuthFailed: return "auth_failed";
        case Kind::Busy: return "busy";
        case Kind::NotFound: return "not_found";
    }
    return "mount_error";
}

EnumerationError::EnumerationError(const Kind &kind, const std::string &message) : std::runtime_error(kindName(kind) + ": " + message), kind(kind) {
}

EnumerationError::Kind EnumerationError::getKind() const {
    return this->kind;
}

std::string EnumerationError::kindName(const Kind &kind) {
    switch (kind) {
        case Kind::Empty: return "empty";
        case Kind::Unreadable: return "unreadable";
    }
    return "enumeration_error";
}

TransferError::TransferError(const Kind &kind, const std::string &message) : std::runtime_error(kindName(kind) + ": " + message), kind(kind) {
}

TransferError::Kind TransferError::getKind() const {
    return this->kind;
}

std::string TransferError::kindName(const Kind &kind) {
    switch (kind) {
        case Kind::IOError: return "io_error";
        case Kind::SystemicIOError: return "systemic_io_error";
        case Kind::VerificationMismatch: return "verify_mismatch";
    }
    return "transfer_error";
}
