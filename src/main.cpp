// ═══════════════════════════════════════════════════════════════════
//  src/main.cpp — dlproxy executable
// ═══════════════════════════════════════════════════════════════════
//
//  dlproxy serve --port 8080
//  dlproxy link --base https://dl.example/ --name report.pdf https://files.example/t/8f3a
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/dlproxy.h"

#include <iostream>

using namespace dlproxy;

namespace {

int serve(const config::Config& cfg) {
    console::setLevel(console::parseLevel(cfg.logLevel).value_or(console::Level::Info));
    console::setColors(cfg.logColors);

    auto app = http::createServer(cfg.serverOptions());
    app.use(middleware::requestLogger());
    app.all("*", proxy::createHandler(cfg.proxyOptions()));

    lifecycle::enableGracefulShutdown(app);

    app.listen(cfg.host, cfg.port, [&] {
        console::success("dlproxy listening on", cfg.host + ":" + std::to_string(app.port()),
                         "with", cfg.threads, "threads");
        if (!cfg.verifyTls) {
            console::warn("Upstream certificate verification is disabled");
        }
    });

    console::success("Server stopped.");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto inv = config::parseArgs(argc, argv);

        switch (inv.command) {
            case config::Command::Help:
                std::cout << config::usage();
                return 0;
            case config::Command::Link:
                std::cout << proxy::buildLink(inv.base, inv.upstream, inv.name) << "\n";
                return 0;
            case config::Command::Serve:
                return serve(inv.config);
        }
    } catch (const config::ConfigError& e) {
        console::error(e.what());
        std::cerr << config::usage();
        return 2;
    } catch (const std::exception& e) {
        console::error("Fatal:", e.what());
        return 1;
    }
    return 0;
}
