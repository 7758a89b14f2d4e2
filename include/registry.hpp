#ifndef REGISTRY_HPP
#define REGISTRY_HPP
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "environment.hpp"

namespace wtenv {
namespace fs = std::filesystem;

/**
 * @brief Durable name -> Environment mapping stored as one JSON document.
 *
 * Every call re-reads the file, so several processes may share it. Mutations
 * hold the in-process mutex and the `<registry>.lock` file, re-read, apply
 * the change and replace the file atomically (temp file, fsync, rename).
 * Environments keep insertion order.
 */
class EnvironmentRegistry {
  public:
    explicit EnvironmentRegistry(fs::path path,
                                 std::chrono::milliseconds lock_timeout = std::chrono::seconds(10));

    const fs::path& path() const { return path_; }

    bool exists(const std::string& name) const;

    /** @throws wtenv::Error NotFound. */
    Environment get(const std::string& name) const;

    std::optional<Environment> find(const std::string& name) const;

    /** @throws wtenv::Error Conflict/NameRegistered if the name is taken. */
    void add(const Environment& env);

    /** @throws wtenv::Error NotFound. */
    void remove(const std::string& name);

    std::vector<Environment> list_all() const;
    std::vector<std::string> list_names() const;

  private:
    nlohmann::ordered_json load_document() const;
    void save_document(const nlohmann::ordered_json& doc) const;
    void mutate(const std::function<void(nlohmann::ordered_json&)>& fn);

    fs::path path_;
    std::chrono::milliseconds lock_timeout_;
    mutable std::mutex mtx_;
};

} // namespace wtenv

#endif // REGISTRY_HPP
