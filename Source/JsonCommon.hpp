/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

#include <nlohmann/json.hpp>

namespace Json {
using namespace StdLib;
using JSON = nlohmann::ordered_json;

constexpr int DEFAULT_OUTPUT_INDENT = 2;
constexpr size_t DEFAULT_MAX_DEPTH = 512;

namespace Encoding {
namespace Field {
    static const String OLD = "__old";
    static const String NEW = "__new";
    static const String ADDED_SUFFIX = "__added";
    static const String DELETED_SUFFIX = "__deleted";
} // namespace Field

namespace Operation {
    static const String ADD = "+";
    static const String CHANGE = "~";
    static const String KEEP = " ";
    static const String REMOVE = "-";
} // namespace Operation
} // namespace Encoding
} // namespace Json
