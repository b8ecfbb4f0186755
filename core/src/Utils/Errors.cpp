#include "filett/Errors.h"

namespace FileTT {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Protocol:         return "protocol_error";
        case ErrorCode::Authentication:   return "authentication_error";
        case ErrorCode::ResourceNotFound: return "resource_not_found";
        case ErrorCode::Transport:        return "transport_error";
        case ErrorCode::Internal:         return "internal_error";
        default:                          return "internal_error";
    }
}

} // namespace FileTT
