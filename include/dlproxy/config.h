#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/config.h — Settings from defaults, JSON file, env, flags
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto inv = config::parseArgs(argc, argv);   // throws ConfigError
//    if (inv.command == config::Command::Serve) {
//        auto app = http::createServer(inv.config.serverOptions());
//        ...
//    }
//
//  Layers, later wins: defaults, --config FILE, environment, flags.
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "http.h"
#include "fetch.h"
#include "proxy.h"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace dlproxy::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;
    int threads = 4;
    int connectTimeoutMs = 15000;
    int idleTimeoutMs = 60000;
    int maxRedirects = 10;
    std::uint64_t maxBodyBytes = 0;
    std::uint32_t maxHeaderBytes = 65536;
    std::size_t bufferSize = 65536;
    std::string defaultName = "download";
    std::string userAgent = "dlproxy/1.0";
    bool verifyTls = true;
    std::string caFile;
    std::string logLevel = "info";
    bool logColors = true;

    DLPROXY_SERIALIZE(Config, host, port, threads, connectTimeoutMs, idleTimeoutMs,
                      maxRedirects, maxBodyBytes, maxHeaderBytes, bufferSize, defaultName,
                      userAgent, verifyTls, caFile, logLevel, logColors)

    fetch::RequestOptions requestOptions() const;
    http::ServerOptions serverOptions() const;
    proxy::Options proxyOptions() const;
};

enum class Command { Serve, Link, Help };

// ── A parsed command line ──
struct Invocation {
    Command command = Command::Serve;
    Config config;
    std::string configFile;

    // link
    std::string base;
    std::string name;
    std::string upstream;
};

// Environment lookup; empty means std::getenv
using EnvLookup = std::function<const char*(const char*)>;

// ── Merge a JSON object into cfg; unknown keys and bad types throw ──
void applyJson(Config& cfg, const nlohmann::json& patch);

// ── Read and merge a JSON file ──
void loadFile(Config& cfg, const std::string& path);

// ── PORT and DLPROXY_* variables ──
void applyEnv(Config& cfg, const EnvLookup& env = {});

// ── Throws ConfigError naming the first bad key ──
void validate(const Config& cfg);

// ── Full layering for argv; the returned config is validated ──
Invocation parseArgs(int argc, const char* const* argv, const EnvLookup& env = {});

std::string usage();

} // namespace dlproxy::config
