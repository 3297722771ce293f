/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "StdLib.hpp"

#include <cstdint>
#include <filesystem>

namespace Utils {
using namespace StdLib;

static inline Vector<uint8_t> fToByteStream(const String& data) {
    return Vector<uint8_t>(data.begin(), data.end());
}

/** fIsHidden - Tells whether any component of a relative path starts with a dot */
static inline bool fIsHidden(const std::filesystem::path& relativePath) {
    for (const auto& component : relativePath) {
        const auto name = component.string();
        if ((name.size() > 1) && (name.front() == '.') && (name != "..")) {
            return true;
        }
    }

    return false;
}

static inline bool fHasExtension(const std::filesystem::path& path, const String& extension) {
    return path.extension() == extension;
}
} // namespace Utils
