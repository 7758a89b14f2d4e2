#include "github_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace wtenv {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_suffix(std::string s, const std::string& suffix) {
    if (s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
        s.erase(s.size() - suffix.size());
    return s;
}

} // namespace

std::optional<std::string> parse_github_repo(const std::string& url) {
    const std::string ssh = "git@github.com:";
    if (url.rfind(ssh, 0) == 0) {
        std::string path = strip_suffix(url.substr(ssh.size()), ".git");
        auto slash = path.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= path.size() ||
            path.find('/', slash + 1) != std::string::npos)
            return std::nullopt;
        return path;
    }
    static const std::regex https_re(R"(^https?://github\.com/([^/]+/[^/]+?)(?:\.git)?/?$)");
    std::smatch m;
    if (std::regex_match(url, m, https_re))
        return m[1].str();
    return std::nullopt;
}

std::optional<ParsedPr> parse_pr_url(const std::string& url) {
    static const std::regex pr_re(R"(^https?://github\.com/([^/]+)/([^/]+)/pull/(\d+)(?:/.*)?$)");
    std::smatch m;
    if (!std::regex_match(url, m, pr_re))
        return std::nullopt;
    ParsedPr pr;
    pr.owner = m[1].str();
    pr.repo = m[2].str();
    try {
        pr.number = std::stoi(m[3].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return pr;
}

std::optional<ParsedPr> parse_pr_shorthand(const std::string& shorthand,
                                           const std::map<std::string, RepoConfig>& repos) {
    static const std::regex short_re(R"(^([A-Za-z0-9_.-]+)#(\d+)$)");
    std::smatch m;
    if (!std::regex_match(shorthand, m, short_re))
        return std::nullopt;
    auto it = repos.find(m[1].str());
    if (it == repos.end())
        return std::nullopt;
    auto full = parse_github_repo(it->second.url);
    if (!full)
        return std::nullopt;
    auto slash = full->find('/');
    ParsedPr pr;
    pr.owner = full->substr(0, slash);
    pr.repo = full->substr(slash + 1);
    try {
        pr.number = std::stoi(m[2].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return pr;
}

std::optional<ParsedPr> parse_pr_reference(const std::string& reference,
                                           const std::map<std::string, RepoConfig>& repos) {
    if (auto pr = parse_pr_url(reference))
        return pr;
    if (reference.find('#') != std::string::npos)
        return parse_pr_shorthand(reference, repos);
    return std::nullopt;
}

std::optional<std::string> find_config_repo_name(const ParsedPr& pr,
                                                 const std::map<std::string, RepoConfig>& repos) {
    const std::string wanted = lower(pr.full_name());
    for (const auto& [name, repo] : repos) {
        auto full = parse_github_repo(repo.url);
        if (full && lower(*full) == wanted)
            return name;
    }
    return std::nullopt;
}

PrInfo fetch_pr_metadata(const ParsedPr& pr, const std::string& gh_executable) {
    ErrorContext ctx;
    ctx.step = "pr-metadata";
    ctx.repository = pr.full_name();
    auto res = procutil::run_process({gh_executable, "pr", "view", std::to_string(pr.number),
                                      "--repo", pr.full_name(), "--json",
                                      "number,title,author,headRefName,url"});
    if (!res.launched) {
        ctx.detail = res.launch_error;
        throw Error(ErrorKind::ToolUnavailable,
                    "gh CLI not found; install it from https://cli.github.com/", ctx);
    }
    if (res.exit_code != 0) {
        ctx.detail = res.err;
        log_error("gh pr view failed", {{"pr", pr.full_name() + "#" + std::to_string(pr.number)},
                                        {"stderr", res.err}});
        throw Error(ErrorKind::ToolFailure, "gh pr view exited with " + std::to_string(res.exit_code),
                    ctx);
    }
    try {
        auto j = nlohmann::json::parse(res.out);
        PrInfo info;
        info.number = j.at("number").get<int>();
        info.title = j.at("title").get<std::string>();
        info.author = j.at("author").at("login").get<std::string>();
        info.head_ref = j.at("headRefName").get<std::string>();
        info.url = j.at("url").get<std::string>();
        return info;
    } catch (const nlohmann::json::exception& e) {
        ctx.detail = e.what();
        throw Error(ErrorKind::ToolFailure, "unexpected gh output", ctx);
    }
}

} // namespace wtenv
