#include "registry.hpp"
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <fstream>
#include <system_error>
#include <utility>
#include "errors.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include "version.hpp"

namespace wtenv {

using nlohmann::ordered_json;

namespace {

Error io_error(const std::string& msg, const fs::path& path, const std::string& detail = {}) {
    ErrorContext ctx;
    ctx.step = "registry";
    ctx.path = path.string();
    ctx.detail = detail;
    return Error(ErrorKind::Io, msg, ctx);
}

void write_all(int fd, const std::string& data, const fs::path& path) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw io_error("cannot write registry", path, std::strerror(errno));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // namespace

EnvironmentRegistry::EnvironmentRegistry(fs::path path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), lock_timeout_(lock_timeout) {}

ordered_json EnvironmentRegistry::load_document() const {
    std::error_code ec;
    if (!fs::exists(path_, ec))
        return ordered_json{{"version", WTENV_REGISTRY_VERSION},
                            {"environments", ordered_json::object()}};
    std::ifstream ifs(path_);
    if (!ifs)
        throw io_error("cannot open registry", path_);
    ordered_json doc;
    try {
        ifs >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw io_error("registry is not valid JSON", path_, e.what());
    }
    if (!doc.is_object())
        throw io_error("registry root is not an object", path_);
    // Documents written before versioning carry no tag and use the v1 layout.
    if (!doc.contains("version"))
        doc["version"] = WTENV_REGISTRY_VERSION;
    if (!doc["version"].is_number_integer() ||
        doc["version"].get<int>() != WTENV_REGISTRY_VERSION) {
        ErrorContext ctx;
        ctx.step = "registry";
        ctx.path = path_.string();
        ctx.detail = doc["version"].dump();
        throw Error(ErrorKind::UnsupportedVersion,
                    "unsupported registry version " + doc["version"].dump(), ctx);
    }
    if (!doc.contains("environments") || doc["environments"].is_null())
        doc["environments"] = ordered_json::object();
    if (!doc["environments"].is_object())
        throw io_error("registry environments is not an object", path_);
    return doc;
}

void EnvironmentRegistry::save_document(const ordered_json& doc) const {
    std::error_code ec;
    fs::path dir = path_.parent_path();
    fs::path tmp = path_;
    tmp += ".tmp." + std::to_string(getpid());
    const std::string text = doc.dump(2) + "\n";
    {
        procutil::UniqueFd fd(open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!fd)
            throw io_error("cannot create temporary registry file", tmp, std::strerror(errno));
        try {
            write_all(fd.get(), text, tmp);
        } catch (const Error&) {
            fd.reset();
            fs::remove(tmp, ec);
            throw;
        }
        if (fsync(fd.get()) != 0) {
            std::string why = std::strerror(errno);
            fd.reset();
            fs::remove(tmp, ec);
            throw io_error("cannot sync registry", tmp, why);
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        throw io_error("cannot replace registry", path_, ec.message());
    }
    procutil::UniqueFd dfd(open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dfd && fsync(dfd.get()) != 0)
        log_debug("directory sync failed", {{"path", dir.string()}, {"error", std::strerror(errno)}});
}

void EnvironmentRegistry::mutate(const std::function<void(ordered_json&)>& fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec)
        throw io_error("cannot create registry directory", path_.parent_path(), ec.message());
    fs::path lock_path = path_;
    lock_path += ".lock";
    procutil::LockFileGuard lock(lock_path, lock_timeout_);
    if (!lock.locked) {
        std::string holder = lock.holder ? " by pid " + std::to_string(lock.holder) : "";
        throw io_error("registry is locked" + holder, lock_path);
    }
    ordered_json doc = load_document();
    fn(doc);
    save_document(doc);
}

bool EnvironmentRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return load_document()["environments"].contains(name);
}

std::optional<Environment> EnvironmentRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    ordered_json doc = load_document();
    auto& envs = doc["environments"];
    if (!envs.contains(name))
        return std::nullopt;
    try {
        return environment_from_json(envs[name]);
    } catch (const nlohmann::json::exception& e) {
        throw io_error("malformed registry entry '" + name + "'", path_, e.what());
    }
}

Environment EnvironmentRegistry::get(const std::string& name) const {
    auto env = find(name);
    if (!env) {
        ErrorContext ctx;
        ctx.environment = name;
        throw Error(ErrorKind::NotFound, "environment '" + name + "' not found", ctx);
    }
    return *env;
}

void EnvironmentRegistry::add(const Environment& env) {
    mutate([&](ordered_json& doc) {
        auto& envs = doc["environments"];
        if (envs.contains(env.name)) {
            ErrorContext ctx;
            ctx.environment = env.name;
            ctx.step = "commit";
            throw Error(ErrorKind::Conflict, "environment '" + env.name + "' already exists", ctx)
                .with_conflict(ConflictKind::NameRegistered);
        }
        envs[env.name] = to_json(env);
    });
    log_info("registered environment", {{"env", env.name}});
}

void EnvironmentRegistry::remove(const std::string& name) {
    mutate([&](ordered_json& doc) {
        auto& envs = doc["environments"];
        if (!envs.contains(name)) {
            ErrorContext ctx;
            ctx.environment = name;
            throw Error(ErrorKind::NotFound, "environment '" + name + "' not found", ctx);
        }
        envs.erase(name);
    });
    log_info("unregistered environment", {{"env", name}});
}

std::vector<Environment> EnvironmentRegistry::list_all() const {
    std::lock_guard<std::mutex> lk(mtx_);
    ordered_json doc = load_document();
    std::vector<Environment> out;
    for (auto it = doc["environments"].begin(); it != doc["environments"].end(); ++it) {
        try {
            out.push_back(environment_from_json(it.value()));
        } catch (const nlohmann::json::exception& e) {
            throw io_error("malformed registry entry '" + it.key() + "'", path_, e.what());
        }
    }
    return out;
}

std::vector<std::string> EnvironmentRegistry::list_names() const {
    std::lock_guard<std::mutex> lk(mtx_);
    ordered_json doc = load_document();
    std::vector<std::string> out;
    for (auto it = doc["environments"].begin(); it != doc["environments"].end(); ++it)
        out.push_back(it.key());
    return out;
}

} // namespace wtenv
