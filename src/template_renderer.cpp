#include "template_renderer.hpp"
#include <inja/inja.hpp>
#include <algorithm>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

namespace wtenv {

bool TemplateRenderer::should_render(const std::optional<std::vector<std::string>>& when,
                                     const std::set<std::string>& present) {
    if (!when)
        return true;
    return std::all_of(when->begin(), when->end(),
                       [&](const std::string& repo) { return present.count(repo) > 0; });
}

nlohmann::json TemplateRenderer::template_data(const TemplateContext& ctx) {
    nlohmann::json data;
    data["env_name"] = ctx.env_name;
    data["env_path"] = ctx.env_path.string();
    data["created_at"] = ctx.created_at;
    data["repos"] = nlohmann::json::array();
    std::set<std::string> names;
    for (const auto& r : ctx.repos) {
        data["repos"].push_back(
            {{"name", r.name}, {"branch", r.branch}, {"path", r.worktree_path.string()}});
        names.insert(r.name);
    }
    data["repo_names"] = std::vector<std::string>(names.begin(), names.end());
    data["symlinks"] = nlohmann::json::array();
    for (const auto& s : ctx.symlinks)
        data["symlinks"].push_back({{"source", s.source}, {"target", s.target}});
    return data;
}

std::string TemplateRenderer::render(const fs::path& source, const TemplateContext& ctx) const {
    ErrorContext ectx;
    ectx.environment = ctx.env_name;
    ectx.step = "template";
    ectx.path = source.string();
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        ectx.detail = "template file not found";
        throw Error(ErrorKind::TemplateFailure, "template not found: " + source.string(), ectx);
    }

    nlohmann::json data = template_data(ctx);
    std::set<std::string> present;
    for (const auto& r : ctx.repos)
        present.insert(r.name);

    try {
        inja::Environment env{source.parent_path().string() + "/"};
        env.set_throw_at_missing_includes(true);
        env.add_callback("has_repo", 1, [present](inja::Arguments& args) {
            return present.count(args.at(0)->get<std::string>()) > 0;
        });
        inja::Template tpl = env.parse_template(source.filename().string());
        return env.render(tpl, data);
    } catch (const inja::InjaError& e) {
        ectx.detail = e.what();
        log_debug("template failed", {{"template", source.string()}, {"error", e.what()}});
        throw Error(ErrorKind::TemplateFailure, "cannot render " + source.string(), ectx);
    } catch (const nlohmann::json::exception& e) {
        ectx.detail = e.what();
        throw Error(ErrorKind::TemplateFailure, "cannot render " + source.string(), ectx);
    }
}

} // namespace wtenv
