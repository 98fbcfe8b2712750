#ifndef PARACLIENT_ERRORS_HPP
#define PARACLIENT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ParaClient {

/**
 * @brief Base class for all ParaClient exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief Malformed CBOR, unsupported call formats, malformed envelopes and
 * failed authenticated decryption.
 */
class CodecError : public RuntimeError {
public:
    explicit CodecError(const std::string& message) : RuntimeError(message) {}
    explicit CodecError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Signing failures and malformed key material.
 */
class SignatureError : public RuntimeError {
public:
    explicit SignatureError(const std::string& message) : RuntimeError(message) {}
    explicit SignatureError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Malformed addresses, runtime identifiers and chain contexts.
 */
class AddressError : public InvalidArgument {
public:
    explicit AddressError(const std::string& message) : InvalidArgument(message) {}
    explicit AddressError(const char* message) : InvalidArgument(message) {}
};

/**
 * @brief Multisig configuration and authentication policy failures.
 */
class MultisigError : public RuntimeError {
public:
    enum class Kind {
        ZeroThreshold,
        DuplicateSigner,
        ZeroWeight,
        WeightOverflow,
        ImpossibleThreshold,
        InsufficientWeight,
        InvalidSignatureAt,
        DuplicateIndex,
        IndexOutOfRange,
        MismatchedSignatureSet
    };

    static constexpr size_t NO_INDEX = static_cast<size_t>(-1);

    MultisigError(Kind kind, const std::string& message, size_t index = NO_INDEX)
        : RuntimeError(message), kind_(kind), index_(index) {}

    Kind kind() const noexcept { return kind_; }

    // Offending signer position, or NO_INDEX when the error is not tied to one.
    size_t index() const noexcept { return index_; }

private:
    Kind kind_;
    size_t index_;
};

/**
 * @brief Transaction structure, signing and verification failures.
 */
class TransactionError : public RuntimeError {
public:
    explicit TransactionError(const std::string& message) : RuntimeError(message) {}
    explicit TransactionError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Unreadable or invalid network configuration.
 */
class ConfigError : public RuntimeError {
public:
    explicit ConfigError(const std::string& message) : RuntimeError(message) {}
    explicit ConfigError(const char* message) : RuntimeError(message) {}
};

} // namespace ParaClient

#endif // PARACLIENT_ERRORS_HPP
