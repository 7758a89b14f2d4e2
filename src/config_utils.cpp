#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <system_error>
#include "errors.hpp"

namespace wtenv {

namespace {

using nlohmann::json;

[[noreturn]] void config_error(const std::string& msg, const std::string& detail = {}) {
    ErrorContext ctx;
    ctx.step = "config";
    ctx.detail = detail;
    throw Error(ErrorKind::Config, msg, ctx);
}

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return nullptr;
    case YAML::NodeType::Scalar:
        return node.as<std::string>();
    case YAML::NodeType::Sequence: {
        json arr = json::array();
        for (const auto& item : node)
            arr.push_back(yaml_to_json(item));
        return arr;
    }
    case YAML::NodeType::Map: {
        json obj = json::object();
        for (auto it = node.begin(); it != node.end(); ++it)
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        return obj;
    }
    }
    return nullptr;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string as_string(const json& v, const std::string& where) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_integer() || v.is_number_unsigned())
        return std::to_string(v.get<long long>());
    config_error(where + " must be a string");
}

bool as_bool(const json& v, const std::string& where) {
    if (v.is_boolean())
        return v.get<bool>();
    if (v.is_string()) {
        std::string s = lower(v.get<std::string>());
        if (s == "true" || s == "yes" || s == "on" || s == "1")
            return true;
        if (s == "false" || s == "no" || s == "off" || s == "0")
            return false;
    }
    config_error(where + " must be a boolean");
}

std::size_t as_size(const json& v, const std::string& where) {
    if (v.is_number_unsigned())
        return v.get<std::size_t>();
    if (v.is_number_integer() && v.get<long long>() >= 0)
        return static_cast<std::size_t>(v.get<long long>());
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (!s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
            return static_cast<std::size_t>(std::stoull(s));
    }
    config_error(where + " must be a non-negative integer");
}

std::vector<std::string> as_string_list(const json& v, const std::string& where) {
    if (!v.is_array())
        config_error(where + " must be a list");
    std::vector<std::string> out;
    for (const auto& item : v)
        out.push_back(as_string(item, where));
    return out;
}

std::optional<std::vector<std::string>> optional_when(const json& rule, const std::string& where) {
    if (!rule.contains("when") || rule.at("when").is_null())
        return std::nullopt;
    return as_string_list(rule.at("when"), where + ".when");
}

fs::path resolve_path(const std::string& raw, const fs::path& base) {
    fs::path p = expand_user(raw);
    if (p.is_relative() && !base.empty())
        p = base / p;
    return p.lexically_normal();
}

// Destinations must stay inside the environment root.
bool is_contained_relative(const std::string& rel) {
    if (rel.empty())
        return false;
    fs::path p(rel);
    if (p.is_absolute())
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

} // namespace

Config default_config() {
    Config cfg;
    cfg.base_repos_dir = expand_user("~/.local/share/wtenv/repos");
    cfg.environments_dir = expand_user("~/wtenv-envs");
    cfg.registry_path = expand_user("~/.local/share/wtenv/registry.json");
    cfg.logging.file = expand_user("~/.local/share/wtenv/wtenv.log");
    return cfg;
}

fs::path expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~')
        return fs::path(path);
    if (path.size() > 1 && path[1] != '/')
        return fs::path(path);
    const char* home = std::getenv("HOME");
    if (!home)
        return fs::path(path);
    return fs::path(std::string(home) + path.substr(1));
}

bool is_valid_repo_name(const std::string& name) {
    if (name.empty())
        return false;
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalnum(first) && first != '_')
        return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

bool load_yaml_config(const std::string& path, json& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        out = yaml_to_json(root);
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, json& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        ifs >> out;
        return true;
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

Config config_from_json(const json& doc, const fs::path& config_dir) {
    Config cfg = default_config();
    if (doc.is_null())
        return cfg;
    if (!doc.is_object())
        config_error("configuration root must be a mapping");

    if (doc.contains("base_repos_dir") && !doc["base_repos_dir"].is_null())
        cfg.base_repos_dir = resolve_path(as_string(doc["base_repos_dir"], "base_repos_dir"), config_dir);
    if (doc.contains("environments_dir") && !doc["environments_dir"].is_null())
        cfg.environments_dir =
            resolve_path(as_string(doc["environments_dir"], "environments_dir"), config_dir);
    if (doc.contains("registry_path") && !doc["registry_path"].is_null())
        cfg.registry_path = resolve_path(as_string(doc["registry_path"], "registry_path"), config_dir);
    if (doc.contains("git_executable") && !doc["git_executable"].is_null())
        cfg.git_executable = as_string(doc["git_executable"], "git_executable");

    if (doc.contains("logging") && !doc["logging"].is_null()) {
        const json& lg = doc["logging"];
        if (!lg.is_object())
            config_error("logging must be a mapping");
        if (lg.contains("file"))
            cfg.logging.file = lg["file"].is_null()
                                   ? fs::path()
                                   : resolve_path(as_string(lg["file"], "logging.file"), config_dir);
        if (lg.contains("level")) {
            std::string name = as_string(lg["level"], "logging.level");
            if (!parse_log_level(name, cfg.logging.level))
                config_error("unknown logging.level '" + name + "'");
        }
        if (lg.contains("max_size"))
            cfg.logging.max_size = as_size(lg["max_size"], "logging.max_size");
        if (lg.contains("max_files"))
            cfg.logging.max_files = as_size(lg["max_files"], "logging.max_files");
        if (lg.contains("json"))
            cfg.logging.json = as_bool(lg["json"], "logging.json");
        if (lg.contains("compress"))
            cfg.logging.compress = as_bool(lg["compress"], "logging.compress");
    }

    if (doc.contains("repositories") && !doc["repositories"].is_null()) {
        const json& repos = doc["repositories"];
        if (!repos.is_object())
            config_error("repositories must be a mapping of name to {url}");
        for (auto it = repos.begin(); it != repos.end(); ++it) {
            const std::string where = "repositories." + it.key();
            if (!it.value().is_object())
                config_error(where + " must be a mapping with a url");
            RepoConfig rc;
            if (it.value().contains("url") && !it.value()["url"].is_null())
                rc.url = as_string(it.value()["url"], where + ".url");
            cfg.repositories[it.key()] = rc;
        }
    }

    auto rule_list = [&](const char* key) -> const json* {
        if (!doc.contains(key) || doc[key].is_null())
            return nullptr;
        if (!doc[key].is_array())
            config_error(std::string(key) + " must be a list");
        return &doc[key];
    };

    if (const json* list = rule_list("templates")) {
        for (std::size_t i = 0; i < list->size(); ++i) {
            const json& r = (*list)[i];
            const std::string where = "templates[" + std::to_string(i) + "]";
            if (!r.is_object() || !r.contains("source") || !r.contains("destination"))
                config_error(where + " needs source and destination");
            cfg.templates.push_back(TemplateRule{
                resolve_path(as_string(r["source"], where + ".source"), config_dir),
                as_string(r["destination"], where + ".destination"), optional_when(r, where)});
        }
    }
    if (const json* list = rule_list("copy_files")) {
        for (std::size_t i = 0; i < list->size(); ++i) {
            const json& r = (*list)[i];
            const std::string where = "copy_files[" + std::to_string(i) + "]";
            if (!r.is_object() || !r.contains("source") || !r.contains("destination"))
                config_error(where + " needs source and destination");
            cfg.copy_files.push_back(CopyRule{
                resolve_path(as_string(r["source"], where + ".source"), config_dir),
                as_string(r["destination"], where + ".destination"), optional_when(r, where)});
        }
    }
    if (const json* list = rule_list("symlinks")) {
        for (std::size_t i = 0; i < list->size(); ++i) {
            const json& r = (*list)[i];
            const std::string where = "symlinks[" + std::to_string(i) + "]";
            if (!r.is_object() || !r.contains("source") || !r.contains("target"))
                config_error(where + " needs source and target");
            if (!r.contains("when") || r["when"].is_null())
                config_error(where + ".when is required for symlinks");
            cfg.symlinks.push_back(SymlinkRule{as_string(r["source"], where + ".source"),
                                               as_string(r["target"], where + ".target"),
                                               as_string_list(r["when"], where + ".when")});
        }
    }

    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (base_repos_dir.empty() || environments_dir.empty() || registry_path.empty())
        config_error("base_repos_dir, environments_dir and registry_path must be set");
    if (git_executable.empty())
        config_error("git_executable must not be empty");
    for (const auto& [name, repo] : repositories) {
        if (!is_valid_repo_name(name))
            config_error("invalid repository name '" + name + "'");
        if (repo.url.empty())
            config_error("repository '" + name + "' has no url");
    }
    auto check_when = [](const std::optional<std::vector<std::string>>& when,
                         const std::string& where) {
        if (when && when->empty())
            config_error(where + ": when must list at least one repository");
    };
    for (const auto& t : templates) {
        if (!is_contained_relative(t.destination))
            config_error("template destination '" + t.destination +
                         "' must be a relative path inside the environment");
        check_when(t.when, "template " + t.destination);
    }
    for (const auto& c : copy_files) {
        if (!is_contained_relative(c.destination))
            config_error("copy destination '" + c.destination +
                         "' must be a relative path inside the environment");
        check_when(c.when, "copy " + c.destination);
    }
    for (const auto& s : symlinks) {
        if (!is_contained_relative(s.source) || !is_contained_relative(s.target))
            config_error("symlink " + s.source + " -> " + s.target +
                         " must use relative paths inside the environment");
        if (s.when.empty())
            config_error("symlink " + s.target + ": when must list at least one repository");
    }
}

std::vector<std::string> Config::warnings() const {
    std::vector<std::string> out;
    auto check = [&](const std::vector<std::string>& when, const std::string& what) {
        for (const auto& repo : when) {
            if (repositories.find(repo) == repositories.end())
                out.push_back(what + " names unknown repository '" + repo +
                              "' and will never be applied");
        }
    };
    for (const auto& t : templates) {
        if (t.when)
            check(*t.when, "template " + t.destination);
    }
    for (const auto& c : copy_files) {
        if (c.when)
            check(*c.when, "copy " + c.destination);
    }
    for (const auto& s : symlinks)
        check(s.when, "symlink " + s.target);
    return out;
}

Config load_config(const fs::path& path) {
    json doc;
    std::string error;
    bool ok = path.extension() == ".json" ? load_json_config(path.string(), doc, error)
                                          : load_yaml_config(path.string(), doc, error);
    if (!ok)
        config_error("cannot load " + path.string() + ": " + error, error);
    fs::path dir = path.parent_path();
    if (dir.empty())
        dir = fs::current_path();
    Config cfg = config_from_json(doc, fs::absolute(dir));
    cfg.source_path = fs::absolute(path);
    for (const auto& w : cfg.warnings())
        log_warning(w, {{"config", cfg.source_path.string()}});
    return cfg;
}

fs::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return fs::path(xdg) / "wtenv" / "config.yaml";
    return expand_user("~/.config/wtenv/config.yaml");
}

std::optional<fs::path> find_config_file(const std::optional<fs::path>& explicit_path,
                                         const fs::path& cwd) {
    std::error_code ec;
    if (explicit_path) {
        fs::path p = expand_user(explicit_path->string());
        if (!fs::exists(p, ec))
            config_error("configuration file not found: " + p.string());
        return p;
    }
    fs::path local = cwd / ".wtenv.yaml";
    if (fs::exists(local, ec))
        return local;
    fs::path global = default_config_path();
    if (fs::exists(global, ec))
        return global;
    return std::nullopt;
}

std::string default_config_text() {
    const std::string config_dir = default_config_path().parent_path().string();
    return "# wtenv configuration\n"
           "\n"
           "# Where base repositories are cloned (worktree sources)\n"
           "# base_repos_dir: ~/.local/share/wtenv/repos\n"
           "\n"
           "# Where environments are created\n"
           "# environments_dir: ~/wtenv-envs\n"
           "\n"
           "# Environment registry\n"
           "# registry_path: ~/.local/share/wtenv/registry.json\n"
           "\n"
           "# git_executable: git\n"
           "\n"
           "# logging:\n"
           "#   file: ~/.local/share/wtenv/wtenv.log\n"
           "#   level: INFO\n"
           "#   max_size: 1048576\n"
           "#   max_files: 3\n"
           "#   json: false\n"
           "#   compress: false\n"
           "\n"
           "# Repository definitions, keyed by the name used in commands and templates\n"
           "repositories: {}\n"
           "  # example:\n"
           "  #   url: git@github.com:your-org/example-repo.git\n"
           "\n"
           "# Templates rendered into environments\n"
           "templates: []\n"
           "  # - source: " + config_dir + "/templates/AGENTS.md.j2\n"
           "  #   destination: AGENTS.md\n"
           "  #   when: [repo1, repo2]   # optional\n"
           "\n"
           "# Static files copied verbatim\n"
           "copy_files: []\n"
           "  # - source: " + config_dir + "/files/.editorconfig\n"
           "  #   destination: .editorconfig\n"
           "\n"
           "# Symlinks between repositories (when is required)\n"
           "symlinks: []\n"
           "  # - source: repo1/shared_module\n"
           "  #   target: repo2/src/shared_module\n"
           "  #   when: [repo1, repo2]\n";
}

void init_config(const fs::path& path, bool force) {
    std::error_code ec;
    if (fs::exists(path, ec) && !force) {
        ErrorContext ctx;
        ctx.path = path.string();
        ctx.step = "init";
        throw Error(ErrorKind::Conflict,
                    "configuration already exists at " + path.string() + " (use --force)", ctx);
    }
    fs::create_directories(path.parent_path() / "templates", ec);
    if (ec)
        throw Error(ErrorKind::Io, "cannot create " + path.parent_path().string() + ": " + ec.message());
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw Error(ErrorKind::Io, "cannot write " + path.string());
    ofs << default_config_text();
    if (!ofs)
        throw Error(ErrorKind::Io, "cannot write " + path.string());
}

nlohmann::ordered_json config_to_json(const Config& cfg) {
    nlohmann::ordered_json j;
    auto when_json = [](const std::optional<std::vector<std::string>>& when) {
        return when ? nlohmann::ordered_json(*when) : nlohmann::ordered_json();
    };
    j["config_file"] = cfg.source_path.string();
    j["base_repos_dir"] = cfg.base_repos_dir.string();
    j["environments_dir"] = cfg.environments_dir.string();
    j["registry_path"] = cfg.registry_path.string();
    j["git_executable"] = cfg.git_executable;
    j["repositories"] = nlohmann::ordered_json::object();
    for (const auto& [name, repo] : cfg.repositories)
        j["repositories"][name] = {{"url", repo.url}};
    j["templates"] = nlohmann::ordered_json::array();
    for (const auto& t : cfg.templates)
        j["templates"].push_back({{"source", t.source.string()},
                                  {"destination", t.destination},
                                  {"when", when_json(t.when)}});
    j["copy_files"] = nlohmann::ordered_json::array();
    for (const auto& c : cfg.copy_files)
        j["copy_files"].push_back({{"source", c.source.string()},
                                   {"destination", c.destination},
                                   {"when", when_json(c.when)}});
    j["symlinks"] = nlohmann::ordered_json::array();
    for (const auto& s : cfg.symlinks)
        j["symlinks"].push_back({{"source", s.source}, {"target", s.target}, {"when", s.when}});
    return j;
}

} // namespace wtenv
