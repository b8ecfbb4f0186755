#include "filett/Types.h"
#include <algorithm>
#include <cctype>

namespace FileTT {

static std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

// ═══════════════════════════════════════════════════════════
// TransferState
// ═══════════════════════════════════════════════════════════

const char* transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::Pending:    return "pending";
        case TransferState::InProgress: return "in_progress";
        case TransferState::Completed:  return "completed";
        case TransferState::Canceled:   return "canceled";
        case TransferState::Failed:     return "failed";
        default:                        return "pending";
    }
}

TransferState transferStateFromString(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "in_progress") return TransferState::InProgress;
    if (lower == "completed")   return TransferState::Completed;
    if (lower == "canceled")    return TransferState::Canceled;
    if (lower == "failed")      return TransferState::Failed;
    return TransferState::Pending;
}

const char* transferDirectionToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Upload:   return "upload";
        case TransferDirection::Download: return "download";
        default:                          return "upload";
    }
}

// ═══════════════════════════════════════════════════════════
// PakeRole
// ═══════════════════════════════════════════════════════════

const char* pakeRoleToString(PakeRole role) {
    switch (role) {
        case PakeRole::Initiator: return "initiator";
        case PakeRole::Responder: return "responder";
        case PakeRole::Symmetric: return "symmetric";
        default:                  return "initiator";
    }
}

PakeRole pakeRoleFromString(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "responder" || lower == "b") return PakeRole::Responder;
    if (lower == "symmetric" || lower == "s") return PakeRole::Symmetric;
    return PakeRole::Initiator;
}

uint8_t pakeRoleTag(PakeRole role) {
    switch (role) {
        case PakeRole::Initiator: return 'A';
        case PakeRole::Responder: return 'B';
        case PakeRole::Symmetric: return 'S';
        default:                  return 'A';
    }
}

PakeRole pakePeerRole(PakeRole role) {
    switch (role) {
        case PakeRole::Initiator: return PakeRole::Responder;
        case PakeRole::Responder: return PakeRole::Initiator;
        default:                  return PakeRole::Symmetric;
    }
}

// ═══════════════════════════════════════════════════════════
// CodecMode / PresenceResult
// ═══════════════════════════════════════════════════════════

const char* codecModeToString(CodecMode mode) {
    switch (mode) {
        case CodecMode::Encrypted: return "encrypted";
        case CodecMode::Plaintext: return "plaintext";
        default:                   return "encrypted";
    }
}

const char* presenceResultToString(PresenceResult result) {
    switch (result) {
        case PresenceResult::Success:          return "success";
        case PresenceResult::AlreadyConnected: return "already_connected";
        case PresenceResult::InvalidArgument:  return "invalid_argument";
        default:                               return "unknown";
    }
}

} // namespace FileTT
