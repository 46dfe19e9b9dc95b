#pragma once

#include <stdexcept>
#include <string>

namespace soapx {

// Error classification shared by every exception thrown from soapx
enum class ErrorKind {
    LEGACY_CALL_SHAPE,
    INSUFFICIENT_CONFIGURATION,
    MISSING_CONTRACT,
    INVALID_ARGUMENT,
    NO_PENDING_INVOCATION,
    VERIFICATION_FAILED,
    UNKNOWN_OPERATION,
    CONTRACT_INVALID,
    CONFIGURATION_INVALID,
    TRANSPORT_FAILED,
    SOAP_FAULT,
    HTTP_ERROR
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Configuration contains neither a WSDL location nor endpoint + namespace
class InitializationError : public Error {
public:
    explicit InitializationError(const std::string& message)
        : Error(ErrorKind::INSUFFICIENT_CONFIGURATION, message) {}

protected:
    InitializationError(ErrorKind kind, const std::string& message)
        : Error(kind, message) {}
};

// Configuration was handed over as something other than a mapping of options
class LegacyInitializationError : public InitializationError {
public:
    explicit LegacyInitializationError(const std::string& message)
        : InitializationError(ErrorKind::LEGACY_CALL_SHAPE, message) {}
};

class MissingContractError : public Error {
public:
    explicit MissingContractError(const std::string& message)
        : Error(ErrorKind::MISSING_CONTRACT, message) {}
};

class InvocationArgumentError : public Error {
public:
    explicit InvocationArgumentError(const std::string& message)
        : Error(ErrorKind::INVALID_ARGUMENT, message) {}
};

class NoPendingInvocationError : public Error {
public:
    explicit NoPendingInvocationError(const std::string& message)
        : Error(ErrorKind::NO_PENDING_INVOCATION, message) {}
};

class VerificationError : public Error {
public:
    explicit VerificationError(const std::string& message)
        : Error(ErrorKind::VERIFICATION_FAILED, message) {}
};

class UnknownOperationError : public Error {
public:
    explicit UnknownOperationError(const std::string& message)
        : Error(ErrorKind::UNKNOWN_OPERATION, message) {}
};

class ContractError : public Error {
public:
    explicit ContractError(const std::string& message)
        : Error(ErrorKind::CONTRACT_INVALID, message) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::CONFIGURATION_INVALID, message) {}
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error(ErrorKind::TRANSPORT_FAILED, message) {}
};

} // namespace soapx
