#ifndef TUTOR_STORE_ERROR_HPP
#define TUTOR_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tutor {

// Categories surfaced to the request layer so it can pick a user-facing message
enum class ErrorKind {
    Io = 0,
    Integrity,
    MalformedInput,
    InvalidName,
    Package
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io: return "I/O failure";
        case ErrorKind::Integrity: return "Integrity fault";
        case ErrorKind::MalformedInput: return "Malformed input";
        case ErrorKind::InvalidName: return "Invalid name";
        case ErrorKind::Package: return "Package error";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message, const std::string& context = "")
        : StoreError(ErrorKind::Io, message, context) {}

    ErrorKind kind() const { return kind_; }
    // Path, hash or line the error refers to (may be empty)
    const std::string& context() const { return context_; }

protected:
    StoreError(ErrorKind kind, const std::string& message, const std::string& context)
        : std::runtime_error(message)
        , kind_(kind)
        , context_(context) {}

private:
    ErrorKind kind_;
    std::string context_;
};

// Server-side data is inconsistent (unresolvable submission, cyclic chain, unsafe hash)
class IntegrityError : public StoreError {
public:
    explicit IntegrityError(const std::string& message, const std::string& context = "")
        : StoreError(ErrorKind::Integrity, "Integrity fault: " + message, context) {}
};

// A trusted data file does not have the expected format
class FormatError : public StoreError {
public:
    explicit FormatError(const std::string& message, const std::string& context = "")
        : StoreError(ErrorKind::MalformedInput, "Malformed input: " + message, context) {}
};

class InvalidNameError : public StoreError {
public:
    explicit InvalidNameError(const std::string& message, const std::string& context = "")
        : StoreError(ErrorKind::InvalidName, "Invalid name: " + message, context) {}
};

class PackageError : public StoreError {
public:
    explicit PackageError(const std::string& message, const std::string& context = "")
        : StoreError(ErrorKind::Package, "Package error: " + message, context) {}
};

} // namespace tutor

#endif // TUTOR_STORE_ERROR_HPP
