/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "JsonCommon.hpp"
#include "Value.hpp"

#include <stdexcept>

namespace Json {
using namespace StdLib;

/** Thrown when a document nests containers deeper than the accepted maximum */
class DepthLimitError : public std::runtime_error {
public:
    DepthLimitError(size_t maxDepth)
      : std::runtime_error("JSON document exceeds the maximum nesting depth of " + std::to_string(maxDepth)), mMaxDepth(maxDepth) {}

    size_t MaxDepth() const { return mMaxDepth; }

private:
    size_t mMaxDepth;
};

/** fFromJson - Converts parsed nlohmann JSON into a Value tree
 * @param json Parsed document
 * @param maxDepth Maximum number of nested containers accepted
 * @return Converted value
 * @throws DepthLimitError if the document is nested deeper than maxDepth
 */
Value fFromJson(const JSON& json, size_t maxDepth = DEFAULT_MAX_DEPTH);

JSON fToJson(const Value& value);

/** fParse - Parses JSON text into a Value tree
 * @throws JSON::parse_error on malformed text, DepthLimitError on too deep documents
 */
Value fParse(StringView text, size_t maxDepth = DEFAULT_MAX_DEPTH);

/** fDump - Compact JSON text of the value, members in insertion order */
String fDump(const Value& value, int indent = -1);
} // namespace Json
