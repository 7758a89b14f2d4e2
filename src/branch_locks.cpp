#include "branch_locks.hpp"
#include <set>

namespace wtenv {

BranchLockTable& BranchLockTable::instance() {
    static BranchLockTable table;
    return table;
}

std::mutex& BranchLockTable::mutex_for(const std::string& key) {
    std::lock_guard<std::mutex> lk(table_mtx_);
    auto& slot = table_[key];
    if (!slot)
        slot = std::make_unique<std::mutex>();
    return *slot;
}

LockSet BranchLockTable::lock_branches(const std::vector<std::pair<std::string, std::string>>& pairs) {
    std::set<std::string> keys;
    for (const auto& [base, branch] : pairs)
        keys.insert("branch\n" + base + "\n" + branch);
    LockSet locks;
    locks.reserve(keys.size());
    for (const auto& key : keys)
        locks.emplace_back(mutex_for(key));
    return locks;
}

std::unique_lock<std::mutex> BranchLockTable::lock_base(const std::string& base_path) {
    return std::unique_lock<std::mutex>(mutex_for("clone\n" + base_path));
}

} // namespace wtenv
