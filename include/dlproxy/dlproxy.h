#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/dlproxy.h — Umbrella header for the download proxy
// ═══════════════════════════════════════════════════════════════════
//
//  #include "dlproxy/dlproxy.h"
//  using namespace dlproxy;
//
//  This single include gives you everything:
//    • http::createServer(), Request, Response, BodySource
//    • fetch::asyncStream(), fetch::stream(), fetch::get()
//    • proxy::createHandler(), proxy::buildLink()
//    • config::parseArgs(), Config
//    • console::log(), error(), warn(), info(), debug()
//    • middleware::requestLogger()
//    • lifecycle::enableGracefulShutdown()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"

// HTTP Server & Middleware
#include "http.h"
#include "middleware.h"
#include "lifecycle.h"

// URLs and header values
#include "url.h"
#include "encoding.h"

// Upstream client and the proxy itself
#include "fetch.h"
#include "proxy.h"
#include "config.h"
