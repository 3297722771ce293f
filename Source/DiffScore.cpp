/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "DiffScore.hpp"

#include <algorithm>

namespace Diff {
namespace {
constexpr double IDENTICAL_SCORE = 100.0;
constexpr double MEMBER_ONE_SIDE_PENALTY = 30.0;
constexpr double MEMBER_BOTH_SIDES_BONUS = 20.0;
constexpr double MEMBER_SCORE_DIVISOR = 5.0;
constexpr double MEMBER_SCORE_MIN = -10.0;
constexpr double MEMBER_SCORE_MAX = 20.0;
constexpr double ELEMENT_KEPT_BONUS = 10.0;
constexpr double ELEMENT_ONE_SIDE_PENALTY = 5.0;

double fUnchangedScore(const Json::Value& value) {
    if (value.GetKind() != Json::Kind::Object) {
        return IDENTICAL_SCORE;
    }

    return IDENTICAL_SCORE * std::max(static_cast<double>(value.AsObject().Size()), 0.5);
}

double fObjectScore(const DiffNode& node) {
    double score = 0.0;
    for (const auto& child : node.Children()) {
        const auto status = child.Node.GetStatus();
        if ((status == Status::Added) || (status == Status::Removed)) {
            score -= MEMBER_ONE_SIDE_PENALTY;
            continue;
        }

        score += MEMBER_BOTH_SIDES_BONUS;
        score += std::clamp(fSimilarityScore(child.Node) / MEMBER_SCORE_DIVISOR, MEMBER_SCORE_MIN, MEMBER_SCORE_MAX);
    }

    return std::max(score, 0.0);
}

double fArrayScore(const DiffNode& node) {
    double score = 0.0;
    for (const auto& child : node.Children()) {
        switch (child.Node.GetStatus()) {
        case Status::Unchanged:
        case Status::Nested:
            score += ELEMENT_KEPT_BONUS;
            break;
        case Status::Added:
        case Status::Removed:
            score -= ELEMENT_ONE_SIDE_PENALTY;
            break;
        case Status::Changed:
            // Old element out, new element in
            score -= 2 * ELEMENT_ONE_SIDE_PENALTY;
            break;
        }
    }

    return std::max(score, 0.0);
}
} // namespace

double fSimilarityScore(const DiffNode& node) {
    switch (node.GetStatus()) {
    case Status::Unchanged:
        return fUnchangedScore(node.GetValue());
    case Status::Added:
    case Status::Removed:
    case Status::Changed:
        return 0.0;
    case Status::Nested:
        return (node.GetContainerKind() == ContainerKind::Object) ? fObjectScore(node) : fArrayScore(node);
    }

    return 0.0;
}
} // namespace Diff
