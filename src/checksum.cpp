#include "checksum.hpp"

namespace chkr {

Status status_of(const Outcome& outcome) {
    return is_match(outcome) ? Status::Ok : Status::Mismatch;
}

Status status_of(const VerifyResult& result) {
    return result ? status_of(*result) : Status::Error;
}

const char* to_string(VerifyError e) {
    switch (e) {
        case VerifyError::NotFound: return "NotFound";
        case VerifyError::OpenFailed: return "OpenFailed";
        case VerifyError::ReadFailed: return "ReadFailed";
        case VerifyError::DigestFailed: return "DigestFailed";
    }
    return "Unknown";
}

const char* to_string(Status s) {
    switch (s) {
        case Status::Ok: return "Ok";
        case Status::Mismatch: return "Mismatch";
        case Status::Error: return "Error";
    }
    return "Unknown";
}

} // namespace chkr
