/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "DiffNode.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace Diff {

const char* fStatusName(Status status) {
    switch (status) {
    case Status::Unchanged:
        return "unchanged";
    case Status::Added:
        return "added";
    case Status::Removed:
        return "removed";
    case Status::Changed:
        return "changed";
    case Status::Nested:
        return "nested";
    }

    return "unknown";
}

DiffNode DiffNode::Unchanged(Json::Value value) {
    DiffNode node(Status::Unchanged, ContainerKind::Object);
    node.mValues.push_back(std::move(value));
    return node;
}

DiffNode DiffNode::Added(Json::Value value) {
    DiffNode node(Status::Added, ContainerKind::Object);
    node.mValues.push_back(std::move(value));
    return node;
}

DiffNode DiffNode::Removed(Json::Value value) {
    DiffNode node(Status::Removed, ContainerKind::Object);
    node.mValues.push_back(std::move(value));
    return node;
}

DiffNode DiffNode::Changed(Json::Value oldValue, Json::Value newValue) {
    DiffNode node(Status::Changed, ContainerKind::Object);
    node.mValues.reserve(2);
    node.mValues.push_back(std::move(oldValue));
    node.mValues.push_back(std::move(newValue));
    return node;
}

DiffNode DiffNode::Nested(ContainerKind kind, Vector<DiffChild> children) {
    DiffNode node(Status::Nested, kind);
    node.mChildren = std::move(children);
    return node;
}

ContainerKind DiffNode::GetContainerKind() const {
    if (mStatus != Status::Nested) {
        throw std::logic_error(fmt::format("Container kind requested from a {} node", fStatusName(mStatus)));
    }

    return mContainerKind;
}

const Vector<DiffChild>& DiffNode::Children() const {
    if (mStatus != Status::Nested) {
        throw std::logic_error(fmt::format("Children requested from a {} node", fStatusName(mStatus)));
    }

    return mChildren;
}

const Json::Value& DiffNode::GetValue() const {
    if ((mStatus == Status::Changed) || (mStatus == Status::Nested)) {
        throw std::logic_error(fmt::format("Single value requested from a {} node", fStatusName(mStatus)));
    }

    return mValues.front();
}

const Json::Value& DiffNode::OldValue() const {
    if (mStatus != Status::Changed) {
        throw std::logic_error(fmt::format("Old value requested from a {} node", fStatusName(mStatus)));
    }

    return mValues[0];
}

const Json::Value& DiffNode::NewValue() const {
    if (mStatus != Status::Changed) {
        throw std::logic_error(fmt::format("New value requested from a {} node", fStatusName(mStatus)));
    }

    return mValues[1];
}

void DiffNode::Accept(IVisitor &visitor) const {
    AcceptAs(std::nullopt, visitor);
}

void DiffNode::AcceptAs(const Optional<DiffKey>& key, IVisitor &visitor) const {
    if (mStatus != Status::Nested) {
        visitor.Visit(key, *this);
        return;
    }

    if (!visitor.Enter(key, *this)) {
        return;
    }

    for (const auto& child : mChildren) {
        child.Node.AcceptAs(child.Key, visitor);
    }

    visitor.Leave(key, *this);
}
} // namespace Diff
