/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

// Headers arranged in alphabetical order
#include "DiffKey.hpp"
#include "DiffVisitor.hpp"
#include "Value.hpp"

#include "Lib/StdLib.hpp"

namespace Diff {
using namespace StdLib;

enum class Status {
    Unchanged,
    Added,
    Removed,
    Changed,
    Nested
};

enum class ContainerKind {
    Object,
    Array
};

const char* fStatusName(Status status);

struct DiffChild;

/** Outcome of comparing two values at one path. Built once by the engine, read-only afterwards.
 *  A fully unchanged subtree is always a single Unchanged node, never a Nested one.
 */
class DiffNode : public IVisitable {
public:
    static DiffNode Unchanged(Json::Value value);
    static DiffNode Added(Json::Value value);
    static DiffNode Removed(Json::Value value);
    static DiffNode Changed(Json::Value oldValue, Json::Value newValue);
    static DiffNode Nested(ContainerKind kind, Vector<DiffChild> children);

    Status GetStatus() const { return mStatus; }
    bool IsUnchanged() const { return mStatus == Status::Unchanged; }
    bool IsNested() const { return mStatus == Status::Nested; }

    /** GetContainerKind - Kind of both compared containers
     * @throws std::logic_error if the node is not Nested
     */
    ContainerKind GetContainerKind() const;

    /** Children - Child results in reconciled order: left keys first, then keys new on the right
     * @throws std::logic_error if the node is not Nested
     */
    const Vector<DiffChild>& Children() const;

    /** GetValue - The single value of an Unchanged, Added or Removed node */
    const Json::Value& GetValue() const;

    const Json::Value& OldValue() const;
    const Json::Value& NewValue() const;

    void Accept(IVisitor &visitor) const override;

private:
    DiffNode(Status status, ContainerKind kind) : mStatus(status), mContainerKind(kind) {}

    void AcceptAs(const Optional<DiffKey>& key, IVisitor &visitor) const;

    Status mStatus;
    ContainerKind mContainerKind;
    // Unchanged, Added, Removed: [value]; Changed: [old, new]; Nested: empty
    Vector<Json::Value> mValues;
    Vector<DiffChild> mChildren;
};

struct DiffChild {
    DiffKey Key;
    DiffNode Node;
};
} // namespace Diff
