#include "soapx/errors.hpp"

namespace soapx {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LEGACY_CALL_SHAPE: return "legacy_call_shape";
        case ErrorKind::INSUFFICIENT_CONFIGURATION: return "insufficient_configuration";
        case ErrorKind::MISSING_CONTRACT: return "missing_contract";
        case ErrorKind::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorKind::NO_PENDING_INVOCATION: return "no_pending_invocation";
        case ErrorKind::VERIFICATION_FAILED: return "verification_failed";
        case ErrorKind::UNKNOWN_OPERATION: return "unknown_operation";
        case ErrorKind::CONTRACT_INVALID: return "contract_invalid";
        case ErrorKind::CONFIGURATION_INVALID: return "configuration_invalid";
        case ErrorKind::TRANSPORT_FAILED: return "transport_failed";
        case ErrorKind::SOAP_FAULT: return "soap_fault";
        case ErrorKind::HTTP_ERROR: return "http_error";
    }
    return "unknown";
}

} // namespace soapx
