//===----------------------------------------------------------------------===//
//                         GateWire
//
// utils/utf8.hpp
//
// UTF-8 / ASCII validation
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace gatewire {

inline bool IsAscii(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        if (data[i] & 0x80) return false;
    }
    return true;
}

// Rejects overlong forms, surrogates and code points above U+10FFFF
inline bool IsValidUtf8(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint8_t c = data[i];
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t n;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            n = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            n = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            n = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        // Continuation bytes i+1 .. i+n must exist
        if (i + n >= len) {
            return false;
        }
        for (size_t k = 1; k <= n; k++) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        static const uint32_t MIN_CODE_POINT[] = {0, 0x80, 0x800, 0x10000};
        if (cp < MIN_CODE_POINT[n] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += n + 1;
    }
    return true;
}

} // namespace gatewire
