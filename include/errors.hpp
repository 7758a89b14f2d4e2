#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>
#include <vector>

namespace wtenv {

/**
 * @brief Error taxonomy shared by every component.
 *
 * The presentation layer maps each kind to a distinct process exit code so
 * scripts can branch on the outcome.
 */
enum class ErrorKind {
    InvalidInput,
    Conflict,
    NotFound,
    ToolFailure,
    ToolUnavailable,
    TemplateFailure,
    Partial,
    Io,
    Config,
    UnsupportedVersion
};

/** @brief Refinement of ErrorKind::Conflict. */
enum class ConflictKind { None, NameRegistered, DirectoryExists, BranchCheckedOut, OutstandingWork };

/** @brief Structured location of a failure. Empty fields are not applicable. */
struct ErrorContext {
    std::string environment;
    std::string repository;
    std::string step;
    std::string path;
    std::string detail; ///< Captured tool stderr or engine message.
};

/** @brief Unsaved work that blocks a non-forced delete. */
struct PendingWork {
    std::string repository;
    std::string kind; ///< "uncommitted" or "unpushed"
    int count = 0;
};

/** @brief One failed sub-operation of a larger transaction. */
struct SubFailure {
    std::string repository;
    std::string step;
    std::string path;
    std::string message;
};

/**
 * @brief Exception type thrown by the wtenv core.
 *
 * `what()` is a short technical summary; all structured details needed to
 * build a user-facing message are available through the accessors.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message, ErrorContext ctx = {});

    ErrorKind kind() const noexcept { return kind_; }
    ConflictKind conflict() const noexcept { return conflict_; }
    const ErrorContext& context() const noexcept { return ctx_; }
    const std::vector<PendingWork>& pending_work() const noexcept { return pending_; }
    const std::vector<SubFailure>& failures() const noexcept { return failures_; }
    const std::vector<SubFailure>& secondary() const noexcept { return secondary_; }

    Error& with_conflict(ConflictKind c);
    Error& with_pending(std::vector<PendingWork> pending);
    Error& with_failures(std::vector<SubFailure> failures);
    Error& with_secondary(std::vector<SubFailure> secondary);
    Error& with_environment(const std::string& name);

  private:
    ErrorKind kind_;
    ConflictKind conflict_ = ConflictKind::None;
    ErrorContext ctx_;
    std::vector<PendingWork> pending_;
    std::vector<SubFailure> failures_;
    std::vector<SubFailure> secondary_;
};

const char* to_string(ErrorKind kind);
const char* to_string(ConflictKind kind);

/**
 * @brief Process exit code associated with an error kind.
 *
 * 2 invalid input/config, 3 not found, 4 conflict, 5 tool failure,
 * 6 tool unavailable, 7 template failure, 8 partial, 9 io/version.
 */
int exit_code_for(ErrorKind kind);

} // namespace wtenv

#endif // ERRORS_HPP
