#include "config_resolver.hpp"

#include "config_file.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

const char* to_string(Source source) {
    switch (source) {
        case Source::Cli: return "cli";
        case Source::Environment: return "environment";
        case Source::File: return "file";
        case Source::Default: return "default";
    }
    return "unknown";
}

namespace {

class Merger {
public:
    Merger(const PartialConfig& cli, const PartialConfig& env,
           const std::optional<PartialConfig>& file, std::map<std::string, Source>& sources)
        : cli_(cli), env_(env), file_(file), sources_(sources) {}

    // First present value in priority order, else the fallback.
    template <typename T>
    T pick(const char* key, std::optional<T> PartialConfig::*field, const T& fallback) {
        if (auto v = lookup(key, field)) return *v;
        sources_[key] = Source::Default;
        return fallback;
    }

    template <typename T>
    std::optional<T> pick_optional(const char* key, std::optional<T> PartialConfig::*field,
                                   const std::optional<T>& fallback) {
        if (auto v = lookup(key, field)) return v;
        if (fallback) sources_[key] = Source::Default;
        return fallback;
    }

    template <typename T>
    std::optional<T> lookup(const char* key, std::optional<T> PartialConfig::*field) {
        if (cli_.*field) {
            sources_[key] = Source::Cli;
            return cli_.*field;
        }
        if (env_.*field) {
            sources_[key] = Source::Environment;
            return env_.*field;
        }
        if (file_ && (*file_).*field) {
            sources_[key] = Source::File;
            return (*file_).*field;
        }
        return std::nullopt;
    }

private:
    const PartialConfig& cli_;
    const PartialConfig& env_;
    const std::optional<PartialConfig>& file_;
    std::map<std::string, Source>& sources_;
};

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Removes the temporary unless released after a successful rename.
struct TmpGuard {
    std::string path;
    int fd = -1;

    ~TmpGuard() {
        if (fd >= 0) ::close(fd);
        if (!path.empty()) ::unlink(path.c_str());
    }
};

} // namespace

std::expected<TracedConfig, ConfigError>
ConfigResolver::resolve_traced(const PartialConfig& cli, const PartialConfig& env,
                               const std::optional<PartialConfig>& file, const ConfigRecord& defaults) {
    TracedConfig out;
    Merger m(cli, env, file, out.sources);

    // The credential never falls back to the default record.
    auto api_key = m.lookup("api_key", &PartialConfig::api_key);
    if (!api_key) {
        return std::unexpected(ConfigError::missing_credential());
    }

    ConfigRecord& r = out.record;
    r.api_key = std::move(*api_key);
    r.endpoint = m.pick("endpoint", &PartialConfig::endpoint, defaults.endpoint);
    r.model = m.pick("model", &PartialConfig::model, defaults.model);
    r.max_tokens = m.pick("max_tokens", &PartialConfig::max_tokens, defaults.max_tokens);
    r.temperature = m.pick("temperature", &PartialConfig::temperature, defaults.temperature);
    r.top_p = m.pick("top_p", &PartialConfig::top_p, defaults.top_p);
    r.frequency_penalty = m.pick("frequency_penalty", &PartialConfig::frequency_penalty,
                                 defaults.frequency_penalty);
    r.presence_penalty = m.pick("presence_penalty", &PartialConfig::presence_penalty,
                                defaults.presence_penalty);
    r.stop_sequence = m.pick_optional("stop_sequence", &PartialConfig::stop_sequence,
                                      defaults.stop_sequence);
    r.timeout_seconds = m.pick("timeout", &PartialConfig::timeout_seconds, defaults.timeout_seconds);
    r.organization = m.pick_optional("organization", &PartialConfig::organization,
                                     defaults.organization);

    if (auto valid = r.validate(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return out;
}

std::expected<ConfigRecord, ConfigError>
ConfigResolver::resolve(const PartialConfig& cli, const PartialConfig& env,
                        const std::optional<PartialConfig>& file, const ConfigRecord& defaults) {
    auto traced = resolve_traced(cli, env, file, defaults);
    if (!traced) return std::unexpected(std::move(traced.error()));
    return std::move(traced->record);
}

std::expected<PartialConfig, ConfigError> ConfigResolver::load_from_file(const fs::path& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    // Any failed existence check counts as no file.
    if (ec || st.type() == fs::file_type::not_found) {
        return PartialConfig{};
    }
    if (fs::is_directory(st)) {
        return std::unexpected(ConfigError::io(path.string(), "is a directory"));
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(ConfigError::io(path.string(), errno_message("cannot open")));
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return std::unexpected(ConfigError::io(path.string(), "read failed"));
    }

    return config_file::parse(ss.str(), path.string());
}

std::expected<void, ConfigError> ConfigResolver::save_to_file(const ConfigRecord& record,
                                                              const fs::path& path) {
    auto content = config_file::serialize(record);
    if (!content) return std::unexpected(std::move(content.error()));

    const std::string target = path.string();
    fs::path dir = path.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(ConfigError::io(dir.string(), "cannot create directory: " + ec.message()));
    }

    // Same directory as the target so rename() stays on one filesystem.
    std::string tmpl_str = (dir / (path.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> tmpl(tmpl_str.begin(), tmpl_str.end());
    tmpl.push_back('\0');

    TmpGuard tmp;
    tmp.fd = mkstemp(tmpl.data());
    if (tmp.fd < 0) {
        return std::unexpected(ConfigError::io(target, errno_message("cannot create temporary file")));
    }
    tmp.path.assign(tmpl.data());

    // mkstemp creates the file 0600; it holds the credential.
    const char* p = content->data();
    size_t left = content->size();
    while (left > 0) {
        ssize_t n = ::write(tmp.fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(ConfigError::io(target, errno_message("write")));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(tmp.fd) < 0) {
        return std::unexpected(ConfigError::io(target, errno_message("fsync")));
    }
    int fd = tmp.fd;
    tmp.fd = -1;
    if (::close(fd) < 0) {
        return std::unexpected(ConfigError::io(target, errno_message("close")));
    }

    if (::rename(tmp.path.c_str(), target.c_str()) < 0) {
        return std::unexpected(ConfigError::io(target, errno_message("rename")));
    }
    tmp.path.clear();
    return {};
}

std::expected<fs::path, ConfigError> ConfigResolver::default_path(const Environment& env) {
    auto dir = platform::config_dir(env.xdg_config_home, env.home);
    if (dir.empty()) {
        return std::unexpected(ConfigError::no_home());
    }
    return fs::path(dir) / kFileName;
}
