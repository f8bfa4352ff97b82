#pragma once

// ============================================================
// symbol_codec.hpp -- Boundary to the optical symbol encoder/scanner
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

struct SymbolOptions {
    u32  box_size         = 10;   // pixels per module
    u32  border           = 4;    // quiet zone, in modules
    char error_correction = 'L';  // L, M, Q or H
};

// Renders one payload string as a scannable image and recovers payload
// strings from a scanned image. Implementations live outside qrcp.
class SymbolCodec {
public:
    virtual ~SymbolCodec() = default;

    // Encoded image file bytes (e.g. PNG). Throws on failure.
    virtual std::vector<u8> encode_symbol(const std::string& payload,
                                          const SymbolOptions& opts) = 0;

    // Zero or more payloads found in the image, in no particular order
    virtual std::vector<std::string> decode_symbols(const std::vector<u8>& image) = 0;

    // Image file extension produced by encode_symbol, with leading dot
    virtual std::string image_extension() const { return ".png"; }
};
