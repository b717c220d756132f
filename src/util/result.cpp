#include "util/result.hpp"

namespace uplink {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::InputValidation: return "input_validation";
        case ErrorKind::AuthRequired:    return "auth_required";
        case ErrorKind::Transient:       return "transient";
        case ErrorKind::RateLimited:     return "rate_limited";
        case ErrorKind::SessionExpired:  return "session_expired";
        case ErrorKind::UploadFailed:    return "upload_failed";
        case ErrorKind::Cancelled:       return "cancelled";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::StorageError:    return "storage_error";
        case ErrorKind::CorruptData:     return "corrupt_data";
    }
    return "unknown";
}

} // namespace uplink
