/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "DiffNode.hpp"

namespace Diff {
/** fSimilarityScore - How close the two compared documents are, 0 means entirely different
 *
 *  Unchanged:  100, an object scores 100 per member (at least 50)
 *  Changed:    0
 *  Object:     -30 per added or removed member, 20 plus the member score / 5 (clamped to
 *              [-10, 20]) per member on both sides
 *  Array:      +10 per element kept in place (unchanged or nested), -5 per added or removed
 *              element, -10 per replaced element
 *
 *  Container scores never go below 0.
 */
double fSimilarityScore(const DiffNode& node);
} // namespace Diff
