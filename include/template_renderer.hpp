#ifndef TEMPLATE_RENDERER_HPP
#define TEMPLATE_RENDERER_HPP
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "environment.hpp"

namespace wtenv {
namespace fs = std::filesystem;

/** @brief Immutable view of an environment handed to templates. */
struct TemplateContext {
    std::string env_name;
    fs::path env_path;
    std::string created_at;
    std::vector<RepoInstance> repos;
    std::vector<SymlinkEntry> symlinks;
};

/**
 * @brief Renders Jinja-style templates with inja.
 *
 * Templates see `env_name`, `env_path`, `created_at`, `repos` (list of
 * `{name, branch, path}` in request order), `repo_names` (sorted, usable
 * with `in`), `symlinks` (list of `{source, target}`) and the callback
 * `has_repo(name)`.
 */
class TemplateRenderer {
  public:
    /**
     * @brief Evaluate a presence condition.
     *
     * @return `true` when @p when is absent or every name in it is in
     *         @p present.
     */
    static bool should_render(const std::optional<std::vector<std::string>>& when,
                              const std::set<std::string>& present);

    /**
     * @brief Render the template at @p source.
     *
     * Includes resolve relative to the template's directory.
     *
     * @throws wtenv::Error TemplateFailure with the template path and the
     *         engine message for a missing file, syntax error or undefined
     *         variable.
     */
    std::string render(const fs::path& source, const TemplateContext& ctx) const;

    /** @brief The data object templates are rendered against. */
    static nlohmann::json template_data(const TemplateContext& ctx);
};

} // namespace wtenv

#endif // TEMPLATE_RENDERER_HPP
