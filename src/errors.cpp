#include "errors.hpp"
#include <utility>

namespace wtenv {

Error::Error(ErrorKind kind, const std::string& message, ErrorContext ctx)
    : std::runtime_error(message), kind_(kind), ctx_(std::move(ctx)) {}

Error& Error::with_conflict(ConflictKind c) {
    conflict_ = c;
    return *this;
}

Error& Error::with_pending(std::vector<PendingWork> pending) {
    pending_ = std::move(pending);
    return *this;
}

Error& Error::with_failures(std::vector<SubFailure> failures) {
    failures_ = std::move(failures);
    return *this;
}

Error& Error::with_secondary(std::vector<SubFailure> secondary) {
    secondary_ = std::move(secondary);
    return *this;
}

Error& Error::with_environment(const std::string& name) {
    if (ctx_.environment.empty())
        ctx_.environment = name;
    return *this;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:
        return "invalid-input";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::ToolFailure:
        return "tool-failure";
    case ErrorKind::ToolUnavailable:
        return "tool-unavailable";
    case ErrorKind::TemplateFailure:
        return "template-failure";
    case ErrorKind::Partial:
        return "partial";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Config:
        return "config";
    case ErrorKind::UnsupportedVersion:
        return "unsupported-version";
    }
    return "unknown";
}

const char* to_string(ConflictKind kind) {
    switch (kind) {
    case ConflictKind::None:
        return "none";
    case ConflictKind::NameRegistered:
        return "name-registered";
    case ConflictKind::DirectoryExists:
        return "directory-exists";
    case ConflictKind::BranchCheckedOut:
        return "branch-checked-out";
    case ConflictKind::OutstandingWork:
        return "outstanding-work";
    }
    return "unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:
    case ErrorKind::Config:
        return 2;
    case ErrorKind::NotFound:
        return 3;
    case ErrorKind::Conflict:
        return 4;
    case ErrorKind::ToolFailure:
        return 5;
    case ErrorKind::ToolUnavailable:
        return 6;
    case ErrorKind::TemplateFailure:
        return 7;
    case ErrorKind::Partial:
        return 8;
    case ErrorKind::Io:
    case ErrorKind::UnsupportedVersion:
        return 9;
    }
    return 1;
}

} // namespace wtenv
