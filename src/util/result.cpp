#include "packguard/result.hpp"

namespace packguard {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:                return "Ok";
        case ErrorKind::kInvalidPackId:       return "InvalidPackId";
        case ErrorKind::kArchiveUnreadable:   return "ArchiveUnreadable";
        case ErrorKind::kStructuralViolation: return "StructuralViolation";
        case ErrorKind::kExtractionFailed:    return "ExtractionFailed";
        case ErrorKind::kContentRejected:     return "ContentRejected";
        case ErrorKind::kInstallFailed:       return "InstallFailed";
        case ErrorKind::kDownloadFailed:      return "DownloadFailed";
        case ErrorKind::kChecksumMismatch:    return "ChecksumMismatch";
        case ErrorKind::kCancelled:           return "Cancelled";
        case ErrorKind::kConfig:              return "Config";
        case ErrorKind::kIo:                  return "Io";
    }
    return "Unknown";
}

} // namespace packguard
