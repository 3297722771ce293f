/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

// Headers arranged in alphabetical order
#include "DiffKey.hpp"

#include "Lib/StdLib.hpp"

namespace Diff {
using namespace StdLib;

class DiffNode;

/** The IVisitor interface is used by a derived class to walk a diff tree depth-first.
 *  The key is empty for the root node.
 */
class IVisitor {
public:
    virtual ~IVisitor() = default;

    /** Visit - Called for every node that is not Nested */
    virtual void Visit(const Optional<DiffKey>& key, const DiffNode& node) = 0;

    /** Enter - Called for a Nested node before its children
     * @return False to skip the children and the matching Leave call
     */
    virtual bool Enter(const Optional<DiffKey>& key, const DiffNode& node) = 0;

    virtual void Leave(const Optional<DiffKey>& key, const DiffNode& node) = 0;
};

/** The IVisitable interface is used by a derived class to create a contract that allows a visitor to visit an object */
class IVisitable {
public:
    virtual ~IVisitable() = default;

    virtual void Accept(IVisitor &visitor) const = 0;
};
} // namespace Diff
