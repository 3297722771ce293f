/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

// Headers arranged in alphabetical order
#include "DiffEngine.hpp"
#include "DiffNode.hpp"
#include "DiffScore.hpp"
#include "DiffStats.hpp"
#include "JsonEncoder.hpp"
#include "TextRenderer.hpp"
#include "Value.hpp"
#include "ValueConverter.hpp"

namespace JsonStructDiff {
using namespace StdLib;

/** fDiffString - Compares two documents and renders the text report
 * @return Empty if the documents are structurally identical
 */
inline Optional<String> fDiffString(const Json::Value& left, const Json::Value& right, Diff::DiffOptions diffOptions = {}, Render::RenderOptions renderOptions = {}) {
    auto diff = Diff::DiffEngine(diffOptions).Compare(left, right);
    if (diff.IsUnchanged()) {
        return {};
    }

    return Render::TextRenderer(renderOptions).Render(diff);
}
} // namespace JsonStructDiff
