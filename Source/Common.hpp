/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

using Byte = uint8_t;
using ByteStream = StdLib::Vector<Byte>;

namespace Exit {
enum Code {
    IDENTICAL = 0,
    DIFFERENT = 1,
    FAILURE = 2
};
} // namespace Exit
