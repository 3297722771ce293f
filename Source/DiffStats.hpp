/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "DiffNode.hpp"
#include "DiffVisitor.hpp"

namespace Diff {
/** Counts the leaves of a diff tree per status. Nested nodes are walked, not counted */
class DiffStats final : public IVisitor {
public:
    static DiffStats Collect(const DiffNode& node) {
        DiffStats stats;
        node.Accept(stats);
        return stats;
    }

    void Visit([[maybe_unused]] const Optional<DiffKey>& key, const DiffNode& node) override {
        switch (node.GetStatus()) {
        case Status::Unchanged:
            ++mUnchanged;
            break;
        case Status::Added:
            ++mAdded;
            break;
        case Status::Removed:
            ++mRemoved;
            break;
        case Status::Changed:
            ++mChanged;
            break;
        case Status::Nested:
            break;
        }
    }

    bool Enter([[maybe_unused]] const Optional<DiffKey>& key, [[maybe_unused]] const DiffNode& node) override {
        ++mNested;
        return true;
    }

    void Leave([[maybe_unused]] const Optional<DiffKey>& key, [[maybe_unused]] const DiffNode& node) override { }

    size_t Added() const { return mAdded; }
    size_t Removed() const { return mRemoved; }
    size_t Changed() const { return mChanged; }
    size_t Unchanged() const { return mUnchanged; }
    size_t Nested() const { return mNested; }
    size_t Differences() const { return mAdded + mRemoved + mChanged; }

private:
    size_t mAdded = 0;
    size_t mRemoved = 0;
    size_t mChanged = 0;
    size_t mUnchanged = 0;
    size_t mNested = 0;
};
} // namespace Diff
