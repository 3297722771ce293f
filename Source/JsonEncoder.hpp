/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "DiffNode.hpp"
#include "JsonCommon.hpp"

namespace Render {
/** fEncodeJson - Raw JSON encoding of a diff tree
 *
 *  Changed:  {"__old": a, "__new": b}
 *  Object:   "key__deleted": removed value, "key__added": added value, "key": changed or nested
 *            member; unchanged members are left out
 *  Array:    [" ", v] unchanged scalar, [" "] unchanged container, ["-", v], ["+", v],
 *            ["~", nested], a changed element as ["-", old] followed by ["+", new]
 *
 *  A fully unchanged tree encodes to null. An Added or Removed root encodes to {"__new": v} or
 *  {"__old": v}.
 */
Json::JSON fEncodeJson(const Diff::DiffNode& node);
} // namespace Render
