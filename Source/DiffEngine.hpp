/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "DiffNode.hpp"
#include "Modules.hpp"
#include "Value.hpp"

#include "Lib/ModuleRegistry.hpp"

namespace Diff {
using namespace StdLib;

struct DiffOptions {
    // Ignore value differences: only added or removed keys and indices are reported
    bool KeysOnly = false;
    // Minimum number of children of one container before they are compared on the worker pool
    size_t ParallelThreshold = 64;
};

/** Recursive structural comparator of two value trees.
 *
 *  Objects are reconciled by key (left keys in left order, then keys new on the right in right
 *  order), arrays by position. Any kind mismatch, including object against array, is a Changed
 *  leaf. A container whose children are all unchanged collapses into a single Unchanged node.
 *  Numbers compare as 64-bit doubles.
 *
 *  When the module registry carries a worker pool, the children of a container with at least
 *  ParallelThreshold members are compared on the pool and gathered back by index.
 */
class DiffEngine {
public:
    explicit DiffEngine(DiffOptions options = {}, const SharedPtr<ModuleRegistry>& moduleRegistry = std::make_shared<ModuleRegistry>())
      : mOptions(options), mModuleRegistry(moduleRegistry), mWorkerPool(moduleRegistry->WorkerPool()),
        mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::DIFF_ENGINE)) {}

    DiffNode Compare(const Json::Value& left, const Json::Value& right) const;

    const DiffOptions& Options() const { return mOptions; }

private:
    friend struct KindDispatcher;

    /** Side-by-side members to compare; a nullptr side means the member exists on one side only */
    using ChildPairs = Vector<Pair<const Json::Value*, const Json::Value*>>;

    DiffNode CompareScalars(const Json::Value& left, const Json::Value& right, bool equalKind) const;
    DiffNode CompareObjects(const Json::Object& left, const Json::Object& right, const Json::Value& rightValue) const;
    DiffNode CompareArrays(const Json::Array& left, const Json::Array& right, const Json::Value& rightValue) const;
    DiffNode CompareChildren(ContainerKind kind, Vector<DiffKey> keys, const ChildPairs& pairs, const Json::Value& rightValue) const;

    DiffOptions mOptions;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Concurrency::WorkerPool> mWorkerPool;
    SharedPtr<Log::SpdLogger> mLog;
}; // class DiffEngine

/** fDiff - Single threaded comparison with default options */
DiffNode fDiff(const Json::Value& left, const Json::Value& right);
} // namespace Diff
