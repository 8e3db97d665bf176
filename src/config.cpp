// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Configuration layering and validation
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/config.h"
#include "dlproxy/console.h"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

namespace dlproxy::config {

namespace detail {

template <typename T>
T parseNumber(std::string_view key, std::string_view value) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigError("Invalid value for " + std::string(key) + ": '" +
                          std::string(value) + "'");
    }
    return out;
}

inline bool parseBool(std::string_view key, std::string_view value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigError("Invalid value for " + std::string(key) + ": '" +
                      std::string(value) + "'");
}

// Flags that take a value, keyed by the config field they set
inline void applyFlag(Config& cfg, std::string_view flag, const std::string& value) {
    if (flag == "--host")                     cfg.host = value;
    else if (flag == "--port")                cfg.port = parseNumber<int>("port", value);
    else if (flag == "--threads")             cfg.threads = parseNumber<int>("threads", value);
    else if (flag == "--log-level")           cfg.logLevel = value;
    else if (flag == "--max-redirects")       cfg.maxRedirects = parseNumber<int>("maxRedirects", value);
    else if (flag == "--connect-timeout-ms")  cfg.connectTimeoutMs = parseNumber<int>("connectTimeoutMs", value);
    else if (flag == "--idle-timeout-ms")     cfg.idleTimeoutMs = parseNumber<int>("idleTimeoutMs", value);
    else if (flag == "--max-body-bytes")      cfg.maxBodyBytes = parseNumber<std::uint64_t>("maxBodyBytes", value);
    else if (flag == "--max-header-bytes")    cfg.maxHeaderBytes = parseNumber<std::uint32_t>("maxHeaderBytes", value);
    else if (flag == "--buffer-size")         cfg.bufferSize = parseNumber<std::size_t>("bufferSize", value);
    else if (flag == "--default-name")        cfg.defaultName = value;
    else if (flag == "--ca-file")             cfg.caFile = value;
    else throw ConfigError("Unknown option: " + std::string(flag));
}

} // namespace detail

// ═══════════════════════════════════════════
//  Conversions
// ═══════════════════════════════════════════

fetch::RequestOptions Config::requestOptions() const {
    return {
        .connectTimeoutMs = connectTimeoutMs,
        .idleTimeoutMs = idleTimeoutMs,
        .maxRedirects = maxRedirects,
        .maxBodyBytes = maxBodyBytes,
        .maxHeaderBytes = maxHeaderBytes,
        .userAgent = userAgent,
        .verifyTls = verifyTls,
        .caFile = caFile,
    };
}

http::ServerOptions Config::serverOptions() const {
    return {.threads = threads, .relayBufferSize = bufferSize};
}

proxy::Options Config::proxyOptions() const {
    return {.defaultName = defaultName, .upstream = requestOptions()};
}

// ═══════════════════════════════════════════
//  Layers
// ═══════════════════════════════════════════

void applyJson(Config& cfg, const nlohmann::json& patch) {
    if (!patch.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    nlohmann::json merged = toJson(cfg);
    auto unknown = unknownKeys(merged, patch);
    if (!unknown.empty()) {
        throw ConfigError("Unknown configuration key: " + unknown.front());
    }

    merged.merge_patch(patch);
    try {
        cfg = fromJson<Config>(merged);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

void loadFile(Config& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json patch;
    try {
        patch = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }
    applyJson(cfg, patch);
    console::debug("Loaded configuration from", path);
}

void applyEnv(Config& cfg, const EnvLookup& env) {
    auto lookup = [&env](const char* name) -> const char* {
        return env ? env(name) : std::getenv(name);
    };

    // PORT is what most hosting platforms hand out; DLPROXY_PORT wins over it
    if (const char* v = lookup("PORT"))                    cfg.port = detail::parseNumber<int>("PORT", v);
    if (const char* v = lookup("DLPROXY_PORT"))            cfg.port = detail::parseNumber<int>("DLPROXY_PORT", v);
    if (const char* v = lookup("DLPROXY_HOST"))            cfg.host = v;
    if (const char* v = lookup("DLPROXY_THREADS"))         cfg.threads = detail::parseNumber<int>("DLPROXY_THREADS", v);
    if (const char* v = lookup("DLPROXY_LOG_LEVEL"))       cfg.logLevel = v;
    if (const char* v = lookup("DLPROXY_MAX_REDIRECTS"))   cfg.maxRedirects = detail::parseNumber<int>("DLPROXY_MAX_REDIRECTS", v);
    if (const char* v = lookup("DLPROXY_CONNECT_TIMEOUT_MS")) {
        cfg.connectTimeoutMs = detail::parseNumber<int>("DLPROXY_CONNECT_TIMEOUT_MS", v);
    }
    if (const char* v = lookup("DLPROXY_IDLE_TIMEOUT_MS")) {
        cfg.idleTimeoutMs = detail::parseNumber<int>("DLPROXY_IDLE_TIMEOUT_MS", v);
    }
    if (const char* v = lookup("DLPROXY_MAX_BODY_BYTES")) {
        cfg.maxBodyBytes = detail::parseNumber<std::uint64_t>("DLPROXY_MAX_BODY_BYTES", v);
    }
    if (const char* v = lookup("DLPROXY_MAX_HEADER_BYTES")) {
        cfg.maxHeaderBytes = detail::parseNumber<std::uint32_t>("DLPROXY_MAX_HEADER_BYTES", v);
    }
    if (const char* v = lookup("DLPROXY_VERIFY_TLS"))      cfg.verifyTls = detail::parseBool("DLPROXY_VERIFY_TLS", v);
}

void validate(const Config& cfg) {
    if (cfg.port < 1 || cfg.port > 65535) {
        throw ConfigError("port must be within 1..65535, got " + std::to_string(cfg.port));
    }
    if (cfg.threads < 1) {
        throw ConfigError("threads must be at least 1");
    }
    if (cfg.maxHeaderBytes == 0) {
        throw ConfigError("maxHeaderBytes must be positive");
    }
    if (cfg.bufferSize == 0) {
        throw ConfigError("bufferSize must be positive");
    }
    if (cfg.connectTimeoutMs < 0 || cfg.idleTimeoutMs < 0) {
        throw ConfigError("timeouts must not be negative");
    }
    if (cfg.maxRedirects < 0) {
        throw ConfigError("maxRedirects must not be negative");
    }
    if (!console::parseLevel(cfg.logLevel)) {
        throw ConfigError("Unknown logLevel: " + cfg.logLevel);
    }
}

// ═══════════════════════════════════════════
//  Command line
// ═══════════════════════════════════════════

Invocation parseArgs(int argc, const char* const* argv, const EnvLookup& env) {
    Invocation inv;
    std::vector<std::pair<std::string, std::string>> flags;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            inv.command = Command::Help;
            return inv;
        }
        if (arg == "--no-color" || arg == "--insecure") {
            flags.emplace_back(arg, "");
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            std::string value;
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg.erase(eq);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw ConfigError("Missing value for " + arg);
            }
            flags.emplace_back(arg, value);
            continue;
        }
        positional.push_back(arg);
    }

    // ── Command ──
    std::size_t next = 0;
    if (!positional.empty()) {
        if (positional[0] == "serve") {
            next = 1;
        } else if (positional[0] == "link") {
            inv.command = Command::Link;
            next = 1;
        } else if (positional[0] == "help") {
            inv.command = Command::Help;
            return inv;
        }
    }

    if (inv.command == Command::Link) {
        for (auto& [flag, value] : flags) {
            if (flag == "--base") inv.base = value;
            else if (flag == "--name") inv.name = value;
            else throw ConfigError("Unknown option for link: " + flag);
        }
        if (positional.size() != next + 1) {
            throw ConfigError("link expects exactly one upstream URL");
        }
        if (inv.base.empty()) {
            throw ConfigError("link requires --base");
        }
        inv.upstream = positional[next];
        return inv;
    }

    if (positional.size() > next) {
        throw ConfigError("Unexpected argument: " + positional[next]);
    }

    // ── Layers ──
    for (auto& [flag, value] : flags) {
        if (flag == "--config") inv.configFile = value;
    }
    if (!inv.configFile.empty()) {
        loadFile(inv.config, inv.configFile);
    }
    applyEnv(inv.config, env);
    for (auto& [flag, value] : flags) {
        if (flag == "--config") continue;
        if (flag == "--no-color") inv.config.logColors = false;
        else if (flag == "--insecure") inv.config.verifyTls = false;
        else detail::applyFlag(inv.config, flag, value);
    }

    validate(inv.config);
    return inv;
}

std::string usage() {
    return
        "Usage:\n"
        "  dlproxy [serve] [options]\n"
        "  dlproxy link --base URL [--name NAME] UPSTREAM\n"
        "  dlproxy --help\n"
        "\n"
        "Serve options:\n"
        "  --config FILE             JSON configuration file\n"
        "  --host ADDR               listen address (default 0.0.0.0)\n"
        "  --port N                  listen port (default 8080)\n"
        "  --threads N               event loop threads (default 4)\n"
        "  --log-level LEVEL         debug | info | warn | error | silent\n"
        "  --max-redirects N         redirect hop cap (default 10)\n"
        "  --connect-timeout-ms N    resolve, connect and TLS deadline\n"
        "  --idle-timeout-ms N       per-read upstream deadline, 0 disables\n"
        "  --max-body-bytes N        upstream body cap, 0 unlimited\n"
        "  --max-header-bytes N      upstream response head cap (default 65536)\n"
        "  --buffer-size N           relay buffer bytes\n"
        "  --default-name NAME       filename when name is missing\n"
        "  --ca-file FILE            extra CA bundle for upstream TLS\n"
        "  --insecure                skip upstream certificate checks\n"
        "  --no-color                plain log output\n"
        "\n"
        "Environment: PORT, DLPROXY_HOST, DLPROXY_PORT, DLPROXY_THREADS,\n"
        "  DLPROXY_LOG_LEVEL, DLPROXY_MAX_REDIRECTS, DLPROXY_CONNECT_TIMEOUT_MS,\n"
        "  DLPROXY_IDLE_TIMEOUT_MS, DLPROXY_MAX_BODY_BYTES, DLPROXY_MAX_HEADER_BYTES,\n"
        "  DLPROXY_VERIFY_TLS\n";
}

} // namespace dlproxy::config
