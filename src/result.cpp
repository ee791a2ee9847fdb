#include "heartbeat/result.h"

namespace heartbeat {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "success";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::DuplicateCode: return "duplicate code";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Persistence: return "persistence";
        case ErrorCode::MalformedRecord: return "malformed record";
    }
    return "unknown";
}

} // namespace heartbeat
