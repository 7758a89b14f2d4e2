#include "undo_log.hpp"
#include "logger.hpp"

namespace wtenv {

std::vector<SubFailure> UndoLog::rollback() {
    std::vector<SubFailure> failures;
    auto record = [&](const Entry& entry, const std::string& msg) {
        log_error("rollback action failed",
                  {{"step", entry.step}, {"path", entry.path}, {"error", msg}});
        failures.push_back(SubFailure{entry.repository, entry.step, entry.path, msg});
    };
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        log_info("rollback", {{"step", it->step}, {"repo", it->repository}, {"path", it->path}});
        try {
            it->action();
        } catch (const Error& e) {
            std::string msg = e.what();
            if (!e.context().detail.empty())
                msg += ": " + e.context().detail;
            record(*it, msg);
        } catch (const std::exception& e) {
            record(*it, e.what());
        }
    }
    entries_.clear();
    return failures;
}

} // namespace wtenv
