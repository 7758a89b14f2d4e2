#ifndef UNDO_LOG_HPP
#define UNDO_LOG_HPP
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "errors.hpp"

namespace wtenv {

/**
 * @brief Ordered compensating actions for a multi-step transaction.
 *
 * rollback() runs the actions newest first. Every action runs even if an
 * earlier one failed; failures are returned to the caller.
 */
class UndoLog {
  public:
    struct Entry {
        std::string step;
        std::string repository;
        std::string path;
        std::function<void()> action;
    };

    void push(Entry entry) { entries_.push_back(std::move(entry)); }

    /** @brief Run all actions in reverse order and clear the log. */
    std::vector<SubFailure> rollback();

    /** @brief Forget all actions; the transaction succeeded. */
    void commit() { entries_.clear(); }

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

  private:
    std::vector<Entry> entries_;
};

} // namespace wtenv

#endif // UNDO_LOG_HPP
