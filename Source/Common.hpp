/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

#include <cstdint>

using Byte = uint8_t;
using ByteStream = StdLib::Vector<Byte>;

static inline StdLib::String fToString(const ByteStream& data) {
    return StdLib::String(data.begin(), data.end());
}

static inline ByteStream fToByteStream(const StdLib::String& data) {
    return ByteStream(data.begin(), data.end());
}
