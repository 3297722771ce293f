/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Diff {
using namespace StdLib;

/** Position of a child inside its parent: a member name for objects, an index for arrays */
class DiffKey {
public:
    DiffKey(String name) : mKey(std::move(name)) {}
    DiffKey(const char* name) : mKey(String(name)) {}
    DiffKey(size_t index) : mKey(index) {}

    bool IsIndex() const { return std::holds_alternative<size_t>(mKey); }
    const String& Name() const { return std::get<String>(mKey); }
    size_t Index() const { return std::get<size_t>(mKey); }

    String ToString() const { return IsIndex() ? std::to_string(Index()) : Name(); }

    bool operator==(const DiffKey& other) const { return mKey == other.mKey; }
    bool operator!=(const DiffKey& other) const { return !(*this == other); }

private:
    Variant<String, size_t> mKey;
};
} // namespace Diff
