#include "environment.hpp"
#include <cctype>

namespace wtenv {

const RepoInstance* Environment::find_repo(const std::string& repo) const {
    for (const auto& r : repos) {
        if (r.name == repo)
            return &r;
    }
    return nullptr;
}

std::set<std::string> Environment::repo_names() const {
    std::set<std::string> names;
    for (const auto& r : repos)
        names.insert(r.name);
    return names;
}

SyncState classify(const RepoStatus& status) {
    if (status.error)
        return SyncState::Error;
    if (status.uncommitted > 0)
        return SyncState::Uncommitted;
    if (status.ahead > 0)
        return SyncState::Ahead;
    return SyncState::Clean;
}

const char* to_string(SyncState state) {
    switch (state) {
    case SyncState::Clean:
        return "clean";
    case SyncState::Ahead:
        return "ahead";
    case SyncState::Uncommitted:
        return "uncommitted";
    case SyncState::Error:
        return "error";
    }
    return "error";
}

bool is_valid_environment_name(const std::string& name) {
    if (name.empty())
        return false;
    auto word = [](unsigned char c) { return std::isalnum(c) || c == '_'; };
    if (!word(static_cast<unsigned char>(name[0])))
        return false;
    for (unsigned char c : name) {
        if (!word(c) && c != '-')
            return false;
    }
    return true;
}

std::optional<RepoRequest> parse_repo_branch(const std::string& spec, std::string* error) {
    auto pos = spec.find(':');
    if (pos == std::string::npos) {
        if (error)
            *error = "expected repo:branch, got '" + spec + "'";
        return std::nullopt;
    }
    RepoRequest req{spec.substr(0, pos), spec.substr(pos + 1)};
    if (req.repo.empty() || req.branch.empty()) {
        if (error)
            *error = "repository and branch must both be non-empty in '" + spec + "'";
        return std::nullopt;
    }
    return req;
}

nlohmann::ordered_json to_json(const Environment& env) {
    nlohmann::ordered_json j;
    j["name"] = env.name;
    j["path"] = env.path.string();
    j["created_at"] = env.created_at;
    j["repos"] = nlohmann::ordered_json::array();
    for (const auto& r : env.repos) {
        j["repos"].push_back(
            {{"name", r.name}, {"branch", r.branch}, {"worktree_path", r.worktree_path.string()}});
    }
    j["generated_files"] = env.generated_files;
    j["symlinks"] = nlohmann::ordered_json::array();
    for (const auto& s : env.symlinks)
        j["symlinks"].push_back({{"source", s.source}, {"target", s.target}});
    if (env.pr_info) {
        const PrInfo& pr = *env.pr_info;
        j["pr_info"] = {{"number", pr.number},     {"url", pr.url},
                        {"title", pr.title},       {"author", pr.author},
                        {"head_ref", pr.head_ref}, {"repo_name", pr.repo_name}};
    }
    return j;
}

Environment environment_from_json(const nlohmann::ordered_json& j) {
    Environment env;
    env.name = j.at("name").get<std::string>();
    env.path = j.at("path").get<std::string>();
    env.created_at = j.value("created_at", std::string());
    for (const auto& r : j.value("repos", nlohmann::ordered_json::array())) {
        env.repos.push_back(RepoInstance{r.at("name").get<std::string>(),
                                         r.at("branch").get<std::string>(),
                                         r.at("worktree_path").get<std::string>()});
    }
    if (j.contains("generated_files"))
        env.generated_files = j.at("generated_files").get<std::vector<std::string>>();
    for (const auto& s : j.value("symlinks", nlohmann::ordered_json::array()))
        env.symlinks.push_back(
            SymlinkEntry{s.at("source").get<std::string>(), s.at("target").get<std::string>()});
    if (j.contains("pr_info") && !j.at("pr_info").is_null()) {
        const auto& p = j.at("pr_info");
        PrInfo pr;
        pr.number = p.value("number", 0);
        pr.url = p.value("url", std::string());
        pr.title = p.value("title", std::string());
        pr.author = p.value("author", std::string());
        pr.head_ref = p.value("head_ref", std::string());
        pr.repo_name = p.value("repo_name", std::string());
        env.pr_info = pr;
    }
    return env;
}

} // namespace wtenv
