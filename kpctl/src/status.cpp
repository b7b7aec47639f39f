#include "status.hpp"

namespace kpctl {

const char* status_name(Status status) {
    switch (status) {
    case Status::Ok:
        return "ok";
    case Status::NotFound:
        return "not found";
    case Status::ChecksumMismatch:
        return "checksum mismatch";
    case Status::ContentionBusy:
        return "device busy";
    case Status::TransitionStalled:
        return "transition stalled";
    case Status::RefcountTimeout:
        return "refcount timeout";
    case Status::UnsupportedRemediation:
        return "signaling unsupported";
    case Status::VersionMismatch:
        return "kernel version mismatch";
    case Status::ToolFailure:
        return "tool failure";
    }
    return "unknown";
}

}  // namespace kpctl
