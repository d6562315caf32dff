#include "Core/Process/ExeName.hpp"
#include <cstdint>

namespace {
    constexpr uint32_t kReplacementChar = 0xFFFD;

    inline bool isHighSurrogate(uint32_t u) { return u >= 0xD800 && u <= 0xDBFF; }
    inline bool isLowSurrogate(uint32_t u) { return u >= 0xDC00 && u <= 0xDFFF; }

    void appendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back((char)cp);
        }
        else if (cp < 0x800) {
            out.push_back((char)(0xC0 | (cp >> 6)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000) {
            out.push_back((char)(0xE0 | (cp >> 12)));
            out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
        }
        else {
            out.push_back((char)(0xF0 | (cp >> 18)));
            out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
        }
    }
}

std::string FindProcess::DecodeExeName(const char16_t* buf, size_t capacity) {
    if (!buf) return {};

    // fine stringa = primo 0; se manca, tutto il buffer
    size_t end = 0;
    while (end < capacity && buf[end] != 0) ++end;

    std::string out;
    out.reserve(end);
    for (size_t i = 0; i < end; ++i) {
        uint32_t u = buf[i];
        if (isHighSurrogate(u)) {
            if (i + 1 < end && isLowSurrogate(buf[i + 1])) {
                u = 0x10000 + ((u - 0xD800) << 10) + ((uint32_t)buf[i + 1] - 0xDC00);
                ++i;
            }
            else {
                u = kReplacementChar;
            }
        }
        else if (isLowSurrogate(u)) {
            u = kReplacementChar;
        }
        appendUtf8(out, u);
    }
    return out;
}

namespace {
    // Mappatura lowercase semplice (1 code point -> 1 code point) per gli script
    // che si trovano nei nomi eseguibili: Latin, greco, cirillico, armeno, georgiano, fullwidth.
    struct LowerRange {
        uint32_t first, last;
        uint32_t delta;
        bool     alternating;   // coppie adiacenti: cambia solo chi ha la parità di "first"
    };

    constexpr LowerRange kLowerRanges[] = {
        { 0x00C0, 0x00D6,   32, false },   // À..Ö
        { 0x00D8, 0x00DE,   32, false },   // Ø..Þ
        { 0x0100, 0x012E,    1, true  },
        { 0x0132, 0x0136,    1, true  },
        { 0x0139, 0x0147,    1, true  },
        { 0x014A, 0x0176,    1, true  },
        { 0x0179, 0x017D,    1, true  },
        { 0x01CD, 0x01DB,    1, true  },
        { 0x01DE, 0x01EE,    1, true  },
        { 0x01F8, 0x021E,    1, true  },
        { 0x0222, 0x0232,    1, true  },
        { 0x0388, 0x038A,   37, false },
        { 0x038E, 0x038F,   63, false },
        { 0x0391, 0x03A1,   32, false },   // Α..Ρ
        { 0x03A3, 0x03AB,   32, false },   // Σ..Ϋ
        { 0x03D8, 0x03EE,    1, true  },
        { 0x0400, 0x040F,   80, false },   // Ѐ..Џ
        { 0x0410, 0x042F,   32, false },   // А..Я
        { 0x0460, 0x0480,    1, true  },
        { 0x048A, 0x04BE,    1, true  },
        { 0x04C1, 0x04CD,    1, true  },
        { 0x04D0, 0x052E,    1, true  },
        { 0x0531, 0x0556,   48, false },   // armeno
        { 0x10A0, 0x10C5, 7264, false },   // georgiano -> U+2D00
        { 0x1E00, 0x1E94,    1, true  },
        { 0x1EA0, 0x1EFE,    1, true  },
        { 0x2160, 0x216F,   16, false },   // numeri romani
        { 0x24B6, 0x24CF,   26, false },   // lettere cerchiate
        { 0xFF21, 0xFF3A,   32, false },   // fullwidth A..Z
    };

    struct LowerSingle { uint32_t upper, lower; };

    constexpr LowerSingle kLowerSingles[] = {
        { 0x0130, 0x0069 },   // İ -> i
        { 0x0178, 0x00FF },   // Ÿ -> ÿ
        { 0x0386, 0x03AC },   // Ά -> ά
        { 0x038C, 0x03CC },   // Ό -> ό
        { 0x04C0, 0x04CF },   // Ӏ -> ӏ
        { 0x1E9E, 0x00DF },   // ẞ -> ß
    };

    uint32_t lowerCodePoint(uint32_t cp) {
        if (cp < 0x80) return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
        for (const auto& s : kLowerSingles) {
            if (s.upper == cp) return s.lower;
        }
        for (const auto& r : kLowerRanges) {
            if (cp < r.first || cp > r.last) continue;
            if (r.alternating && ((cp - r.first) & 1)) return cp;
            return cp + r.delta;
        }
        return cp;
    }

    // Legge un code point UTF-8 da s[i]; ritorna i byte consumati, 0 se la sequenza non è valida
    size_t decodeUtf8(const std::string& s, size_t i, uint32_t& cp) {
        const unsigned char c = (unsigned char)s[i];
        size_t n = 0;
        if (c < 0x80) { cp = c; return 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; n = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; n = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; n = 4; }
        else return 0;

        if (i + n > s.size()) return 0;
        for (size_t k = 1; k < n; ++k) {
            const unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return 0;
            cp = (cp << 6) | (cc & 0x3F);
        }
        return n;
    }
}

std::string FindProcess::ToLowerName(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        uint32_t cp = 0;
        const size_t n = decodeUtf8(s, i, cp);
        if (n == 0) { out.push_back(s[i]); ++i; continue; }   // byte non valido: invariato

        const uint32_t lower = lowerCodePoint(cp);
        if (lower == cp) out.append(s, i, n);
        else             appendUtf8(out, lower);
        i += n;
    }
    return out;
}
