#pragma once

namespace kpctl {

enum class Status {
    Ok,
    NotFound,
    ChecksumMismatch,
    ContentionBusy,
    TransitionStalled,
    RefcountTimeout,
    UnsupportedRemediation,
    VersionMismatch,
    ToolFailure,
};

const char* status_name(Status status);

// Exit code for a command that finished with |status|
inline int exit_code(Status status) {
    return status == Status::Ok ? 0 : 1;
}

}  // namespace kpctl
