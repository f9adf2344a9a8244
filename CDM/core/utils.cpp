#include "utils.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "ok";
    case ErrorCode::Usage: return "usage error";
    case ErrorCode::Planning: return "planning error";
    case ErrorCode::StateMismatch: return "state mismatch";
    case ErrorCode::Transfer: return "transfer error";
    case ErrorCode::IncompleteTransfer: return "incomplete transfer";
    case ErrorCode::ChunkFailed: return "chunk failed";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::Hook: return "hook error";
    case ErrorCode::Merge: return "merge error";
    case ErrorCode::Io: return "i/o error";
    }
    return "unknown error";
}
