/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "DiffEngine.hpp"

#include <algorithm>
#include <type_traits>

namespace Diff {
namespace {
constexpr size_t CHUNKS_PER_WORKER = 4;
} // namespace

/** Picks the comparison for a (left kind, right kind) pair. Two objects and two arrays recurse,
 *  every other combination lands in the generic arm.
 */
struct KindDispatcher {
    const DiffEngine& Engine;
    const Json::Value& Left;
    const Json::Value& Right;

    DiffNode operator()(const Json::Object& left, const Json::Object& right) const {
        return Engine.CompareObjects(left, right, Right);
    }

    DiffNode operator()(const Json::Array& left, const Json::Array& right) const {
        return Engine.CompareArrays(left, right, Right);
    }

    template<class L, class R>
    DiffNode operator()(const L&, const R&) const {
        return Engine.CompareScalars(Left, Right, std::is_same_v<L, R>);
    }
};

DiffNode DiffEngine::Compare(const Json::Value& left, const Json::Value& right) const {
    return std::visit(KindDispatcher{*this, left, right}, left.Data(), right.Data());
}

DiffNode DiffEngine::CompareScalars(const Json::Value& left, const Json::Value& right, bool equalKind) const {
    if (equalKind && (left == right)) {
        return DiffNode::Unchanged(left);
    }

    if (mOptions.KeysOnly) {
        return DiffNode::Unchanged(right);
    }

    return DiffNode::Changed(left, right);
}

DiffNode DiffEngine::CompareObjects(const Json::Object& left, const Json::Object& right, const Json::Value& rightValue) const {
    Vector<DiffKey> keys;
    ChildPairs pairs;
    keys.reserve(left.Size() + right.Size());
    pairs.reserve(left.Size() + right.Size());

    for (size_t i = 0; i < left.Size(); ++i) {
        keys.emplace_back(left.KeyAt(i));
        pairs.emplace_back(&left.ValueAt(i), right.Find(left.KeyAt(i)));
    }

    for (size_t i = 0; i < right.Size(); ++i) {
        if (left.Contains(right.KeyAt(i))) {
            continue;
        }

        keys.emplace_back(right.KeyAt(i));
        pairs.emplace_back(nullptr, &right.ValueAt(i));
    }

    return CompareChildren(ContainerKind::Object, std::move(keys), pairs, rightValue);
}

DiffNode DiffEngine::CompareArrays(const Json::Array& left, const Json::Array& right, const Json::Value& rightValue) const {
    const size_t count = std::max(left.size(), right.size());
    Vector<DiffKey> keys;
    ChildPairs pairs;
    keys.reserve(count);
    pairs.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        keys.emplace_back(i);
        pairs.emplace_back(i < left.size() ? &left[i] : nullptr, i < right.size() ? &right[i] : nullptr);
    }

    return CompareChildren(ContainerKind::Array, std::move(keys), pairs, rightValue);
}

DiffNode DiffEngine::CompareChildren(ContainerKind kind, Vector<DiffKey> keys, const ChildPairs& pairs, const Json::Value& rightValue) const {
    // Slot i belongs to keys[i], whatever order the tasks finish in
    Vector<Optional<DiffNode>> results(pairs.size());
    auto compareRange = [this, &pairs, &results](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const auto [left, right] = pairs[i];
            if (!right) {
                results[i] = DiffNode::Removed(*left);
            }
            else if (!left) {
                results[i] = DiffNode::Added(*right);
            }
            else {
                results[i] = Compare(*left, *right);
            }
        }
    };

    size_t chunkCount = 1;
    if (mWorkerPool && (pairs.size() >= mOptions.ParallelThreshold) && !mWorkerPool->IsCurrentThreadWorker()) {
        chunkCount = mWorkerPool->Size() * CHUNKS_PER_WORKER;
        mLog->trace("Comparing {} children on {} workers", pairs.size(), mWorkerPool->Size());
    }

    Concurrency::fParallelFor(mWorkerPool.get(), pairs.size(), chunkCount, compareRange);

    const bool allUnchanged = std::all_of(results.begin(), results.end(), [](const Optional<DiffNode>& result) {
        return result->IsUnchanged();
    });
    if (allUnchanged) {
        return DiffNode::Unchanged(rightValue);
    }

    Vector<DiffChild> children;
    children.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i) {
        children.push_back(DiffChild{std::move(keys[i]), std::move(*results[i])});
    }

    return DiffNode::Nested(kind, std::move(children));
}

DiffNode fDiff(const Json::Value& left, const Json::Value& right) {
    return DiffEngine().Compare(left, right);
}
} // namespace Diff
