#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/encoding.h — Header-safe filename encoding
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    res.set("Content-Disposition", encoding::attachment("report.pdf"));
//    // attachment; filename*=UTF-8''report.pdf
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <string_view>

namespace dlproxy::encoding {

// ── JavaScript encodeURIComponent over the UTF-8 bytes of `str` ──
//    Leaves A-Z a-z 0-9 - _ . ! ~ * ' ( ) as-is.
std::string encodeURIComponent(std::string_view str);

// ── RFC 5987 value-chars: encodeURIComponent plus ' ( ) * ──
std::string encodeRFC5987(std::string_view str);

// ── attachment; filename*=UTF-8''<encodeRFC5987(filename)> ──
std::string attachment(std::string_view filename);

} // namespace dlproxy::encoding
