#include <dircat/security/errors.hpp>

namespace dircat {

const char* error_kind_name(SecurityErrorKind kind) {
    switch (kind) {
        case SecurityErrorKind::ForbiddenScheme: return "ForbiddenScheme";
        case SecurityErrorKind::DomainNotAllowed: return "DomainNotAllowed";
        case SecurityErrorKind::PrivateOrLoopbackAddress: return "PrivateOrLoopbackAddress";
        case SecurityErrorKind::MalformedInput: return "MalformedInput";
        case SecurityErrorKind::LocalPathsDisabled: return "LocalPathsDisabled";
        case SecurityErrorKind::PathTraversal: return "PathTraversal";
        case SecurityErrorKind::HardlinkDetected: return "HardlinkDetected";
        case SecurityErrorKind::SymlinkNotAllowed: return "SymlinkNotAllowed";
        case SecurityErrorKind::FileChanged: return "FileChanged";
        case SecurityErrorKind::PatternTooLong: return "PatternTooLong";
        case SecurityErrorKind::TooManyWildcards: return "TooManyWildcards";
        case SecurityErrorKind::InvalidReference: return "InvalidReference";
        case SecurityErrorKind::JsonTooDeep: return "JsonTooDeep";
        case SecurityErrorKind::ArrayTooLarge: return "ArrayTooLarge";
        case SecurityErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case SecurityErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
        case SecurityErrorKind::ClipboardDisabled: return "ClipboardDisabled";
        case SecurityErrorKind::ResolutionFailed: return "ResolutionFailed";
        case SecurityErrorKind::Timeout: return "Timeout";
        case SecurityErrorKind::NotFound: return "NotFound";
        case SecurityErrorKind::IoOther: return "IoOther";
    }
    return "Unknown";
}

int http_status_for(SecurityErrorKind kind) {
    switch (kind) {
        case SecurityErrorKind::ForbiddenScheme:
        case SecurityErrorKind::DomainNotAllowed:
        case SecurityErrorKind::PrivateOrLoopbackAddress:
        case SecurityErrorKind::LocalPathsDisabled:
        case SecurityErrorKind::PathTraversal:
        case SecurityErrorKind::HardlinkDetected:
        case SecurityErrorKind::SymlinkNotAllowed:
        case SecurityErrorKind::FileChanged:
        case SecurityErrorKind::ClipboardDisabled:
            return 403;

        case SecurityErrorKind::MalformedInput:
        case SecurityErrorKind::PatternTooLong:
        case SecurityErrorKind::TooManyWildcards:
        case SecurityErrorKind::InvalidReference:
        case SecurityErrorKind::JsonTooDeep:
        case SecurityErrorKind::ArrayTooLarge:
        case SecurityErrorKind::ResolutionFailed:
        case SecurityErrorKind::NotFound:
            return 400;

        case SecurityErrorKind::PayloadTooLarge:
        case SecurityErrorKind::ResourceLimitExceeded:
            return 413;

        case SecurityErrorKind::Timeout:
            return 504;

        case SecurityErrorKind::IoOther:
            return 500;
    }
    return 500;
}

} // namespace dircat
