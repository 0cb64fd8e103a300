/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "StdLib.hpp"

#include <regex>

namespace Utils {
using namespace StdLib;

static inline String fLeftTrim(const String &s) {
    return std::regex_replace(s, std::regex("^\\s+"), String(""));
}

static inline String fRightTrim(const String &s) {
    return std::regex_replace(s, std::regex("\\s+$"), String(""));
}

static inline String fTrim(const String &s) {
    return fLeftTrim(fRightTrim(s));
}

static inline String fJoin(const Vector<String>& items, const String& separator) {
    OStrStream joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined << separator;
        }

        joined << items[i];
    }

    return joined.str();
}

/** fSplitLines - Splits text on '\n'. A trailing '\r' is kept, the line is returned raw
 * @return At least one (possibly empty) line
 */
static inline Vector<String> fSplitLines(const String& text) {
    Vector<String> lines;
    size_t lineBegin = 0;
    // Get the first occurrence
    size_t pos = text.find('\n');
    // Repeat till end is reached
    while (pos != String::npos) {
        lines.push_back(text.substr(lineBegin, pos - lineBegin));
        lineBegin = pos + 1;
        pos = text.find('\n', lineBegin);
    }

    lines.push_back(text.substr(lineBegin));
    return lines;
}

static constexpr inline bool fIsUtf8Continuation(const unsigned char c) { return (c & 0xC0) == 0x80; }

/** fUtf8Length - Counts code points, continuation bytes are skipped */
static inline size_t fUtf8Length(const String& text) {
    size_t length = 0;
    for (const char c : text) {
        if (!fIsUtf8Continuation(static_cast<unsigned char>(c))) {
            ++length;
        }
    }

    return length;
}

/** fUtf8Prefix - Returns the first maxCodePoints code points of text without splitting a multi-byte sequence */
static inline String fUtf8Prefix(const String& text, const size_t maxCodePoints) {
    size_t codePoints = 0;
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (fIsUtf8Continuation(static_cast<unsigned char>(text[pos]))) {
            continue;
        }

        if (codePoints == maxCodePoints) {
            return text.substr(0, pos);
        }

        ++codePoints;
    }

    return text;
}

static inline String fPadRight(const String& text, const size_t width) {
    const size_t length = fUtf8Length(text);
    if (length >= width) {
        return text;
    }

    return text + String(width - length, ' ');
}

} // namespace Utils
