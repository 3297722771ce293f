/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "DiffEngine.hpp"
#include "DiffStats.hpp"
#include "JsonStructDiff.hpp"
#include "TextRenderer.hpp"
#include "ValueConverter.hpp"

#include <gtest/gtest.h>

#include <map>
#include <set>
#include <stdexcept>

using namespace Diff;
using Json::fParse;

namespace {
const DiffChild& fChild(const DiffNode& node, const DiffKey& key) {
    for (const auto& child : node.Children()) {
        if (child.Key == key) {
            return child;
        }
    }

    throw std::out_of_range("No child " + key.ToString());
}

/** Flattens a diff tree into path -> (status, values) */
class PathRecorder final : public IVisitor {
public:
    struct Entry {
        Status NodeStatus;
        std::vector<Json::Value> Values;
    };

    static std::map<std::string, Entry> Record(const DiffNode& node) {
        PathRecorder recorder;
        node.Accept(recorder);
        return std::move(recorder.mEntries);
    }

    void Visit(const Optional<DiffKey>& key, const DiffNode& node) override {
        Entry entry{node.GetStatus(), {}};
        if (node.GetStatus() == Status::Changed) {
            entry.Values = {node.OldValue(), node.NewValue()};
        }
        else {
            entry.Values = {node.GetValue()};
        }

        mEntries[Path(key)] = std::move(entry);
    }

    bool Enter(const Optional<DiffKey>& key, const DiffNode& node) override {
        mEntries[Path(key)] = Entry{node.GetStatus(), {}};
        if (key) {
            mPath.push_back(key->ToString());
        }

        return true;
    }

    void Leave(const Optional<DiffKey>& key, const DiffNode&) override {
        if (key) {
            mPath.pop_back();
        }
    }

private:
    std::string Path(const Optional<DiffKey>& key) const {
        std::string path;
        for (const auto& part : mPath) {
            path += "/" + part;
        }

        if (key) {
            path += "/" + key->ToString();
        }

        return path;
    }

    std::vector<std::string> mPath;
    std::map<std::string, Entry> mEntries;
};

Json::Value fWideDocument(size_t width, int salt) {
    Json::Object root;
    for (size_t i = 0; i < width; ++i) {
        Json::Object member;
        member.Insert("id", Json::Value(static_cast<int64_t>(i)));
        member.Insert("tag", Json::Value((i % 7 == 0) ? salt : 0));
        Json::Array items;
        for (size_t j = 0; j < (i % 5); ++j) {
            items.push_back(Json::Value(static_cast<int64_t>(j + ((i % 11 == 0) ? salt : 0))));
        }

        member.Insert("items", Json::Value(std::move(items)));
        root.Insert("member" + std::to_string(i), Json::Value(std::move(member)));
    }

    return Json::Value(std::move(root));
}
} // namespace

TEST(DiffEngineTest, IdenticalDocumentsAreUnchanged) {
    const auto doc = fParse(R"({"a": [1, {"b": null}], "c": "x", "d": {}})");
    const auto diff = fDiff(doc, doc);
    ASSERT_TRUE(diff.IsUnchanged());
    EXPECT_EQ(diff.GetValue(), doc);
}

TEST(DiffEngineTest, KeyOrderIsNotADifference) {
    const auto diff = fDiff(fParse(R"({"a": 1, "b": 2})"), fParse(R"({"b": 2, "a": 1})"));
    EXPECT_TRUE(diff.IsUnchanged());
}

TEST(DiffEngineTest, IntegerAndFloatOfSameValueAreEqual) {
    EXPECT_TRUE(fDiff(fParse("[1, 2]"), fParse("[1.0, 2.0]")).IsUnchanged());
    for (int run = 0; run < 10; ++run) {
        ASSERT_TRUE(fDiff(Json::Value(1), Json::Value(1.0)).IsUnchanged());
    }

    EXPECT_EQ(fDiff(fParse("1"), fParse("1.5")).GetStatus(), Status::Changed);
}

TEST(DiffEngineTest, ScalarChangeAtRoot) {
    const auto diff = fDiff(Json::Value(1), Json::Value("one"));
    ASSERT_EQ(diff.GetStatus(), Status::Changed);
    EXPECT_EQ(diff.OldValue(), Json::Value(1));
    EXPECT_EQ(diff.NewValue(), Json::Value("one"));
}

TEST(DiffEngineTest, ObjectMembersAreReconciledByKey) {
    const auto diff = fDiff(fParse(R"({"foo": 42, "bar": 1, "gone": true})"), fParse(R"({"new": "x", "bar": 1, "foo": 10})"));
    ASSERT_TRUE(diff.IsNested());
    EXPECT_EQ(diff.GetContainerKind(), ContainerKind::Object);

    const auto& children = diff.Children();
    ASSERT_EQ(children.size(), 4u);
    // Left keys in left order, then keys new on the right
    EXPECT_EQ(children[0].Key, DiffKey("foo"));
    EXPECT_EQ(children[1].Key, DiffKey("bar"));
    EXPECT_EQ(children[2].Key, DiffKey("gone"));
    EXPECT_EQ(children[3].Key, DiffKey("new"));

    EXPECT_EQ(children[0].Node.GetStatus(), Status::Changed);
    EXPECT_EQ(children[1].Node.GetStatus(), Status::Unchanged);
    EXPECT_EQ(children[2].Node.GetStatus(), Status::Removed);
    EXPECT_EQ(children[3].Node.GetStatus(), Status::Added);
    EXPECT_EQ(children[3].Node.GetValue(), Json::Value("x"));
}

TEST(DiffEngineTest, EveryKeyOfBothSidesIsReported) {
    const auto left = fParse(R"({"a": 1, "b": {"x": 1}, "c": [1]})");
    const auto right = fParse(R"({"d": 1, "b": {"x": 2}, "a": 1, "e": null})");
    const auto diff = fDiff(left, right);

    std::set<std::string> keys;
    for (const auto& child : diff.Children()) {
        keys.insert(child.Key.Name());
    }

    EXPECT_EQ(keys, (std::set<std::string>{"a", "b", "c", "d", "e"}));
    EXPECT_TRUE(fChild(diff, "b").Node.IsNested());
    EXPECT_EQ(fChild(fChild(diff, "b").Node, "x").Node.GetStatus(), Status::Changed);
}

TEST(DiffEngineTest, ArraysArePairedByPosition) {
    const auto longer = fDiff(fParse("[1, 2]"), fParse("[1, 2, 3]"));
    ASSERT_TRUE(longer.IsNested());
    EXPECT_EQ(longer.GetContainerKind(), ContainerKind::Array);
    ASSERT_EQ(longer.Children().size(), 3u);
    EXPECT_EQ(longer.Children()[0].Key, DiffKey(size_t{0}));
    EXPECT_TRUE(longer.Children()[0].Node.IsUnchanged());
    EXPECT_TRUE(longer.Children()[1].Node.IsUnchanged());
    EXPECT_EQ(longer.Children()[2].Node.GetStatus(), Status::Added);

    const auto shorter = fDiff(fParse("[1, 2, 3]"), fParse("[1]"));
    ASSERT_EQ(shorter.Children().size(), 3u);
    EXPECT_EQ(shorter.Children()[1].Node.GetStatus(), Status::Removed);
    EXPECT_EQ(shorter.Children()[2].Node.GetStatus(), Status::Removed);

    // An insertion at the front shifts every element
    const auto shifted = fDiff(fParse("[1, 2]"), fParse("[0, 1, 2]"));
    EXPECT_EQ(DiffStats::Collect(shifted).Changed(), 2u);
    EXPECT_EQ(DiffStats::Collect(shifted).Added(), 1u);
}

TEST(DiffEngineTest, KindMismatchIsAChangedLeaf) {
    const auto diff = fDiff(fParse(R"({"a": 1})"), fParse("[1]"));
    ASSERT_EQ(diff.GetStatus(), Status::Changed);
    EXPECT_EQ(diff.OldValue().GetKind(), Json::Kind::Object);
    EXPECT_EQ(diff.NewValue().GetKind(), Json::Kind::Array);

    EXPECT_EQ(fDiff(Json::Value(nullptr), Json::Value(false)).GetStatus(), Status::Changed);
    EXPECT_EQ(fDiff(Json::Value("1"), Json::Value(1)).GetStatus(), Status::Changed);
}

TEST(DiffEngineTest, UnchangedSubtreeCollapses) {
    const auto diff = fDiff(fParse(R"({"same": {"deep": [1, {"x": 2}]}, "other": 1})"), fParse(R"({"same": {"deep": [1, {"x": 2}]}, "other": 2})"));
    const auto& same = fChild(diff, "same").Node;
    ASSERT_TRUE(same.IsUnchanged());
    EXPECT_EQ(same.GetValue(), fParse(R"({"deep": [1, {"x": 2}]})"));
}

TEST(DiffEngineTest, EmptyContainersAreUnchanged) {
    EXPECT_TRUE(fDiff(fParse("{}"), fParse("{}")).IsUnchanged());
    EXPECT_TRUE(fDiff(fParse("[]"), fParse("[]")).IsUnchanged());
    EXPECT_EQ(fDiff(fParse("{}"), fParse("[]")).GetStatus(), Status::Changed);
}

TEST(DiffEngineTest, DirectionSwapsAddedAndRemoved) {
    const auto left = fParse(R"({"a": 1, "b": [1, [2, 3], {"x": 1}, 4], "c": {"d": true, "f": [0]}, "g": "s"})");
    const auto right = fParse(R"({"e": null, "a": 2, "b": [1, [2], {"x": 1, "y": 2}, 5, 6], "c": {"f": [0, 1]}, "g": "s"})");
    const auto forward = PathRecorder::Record(fDiff(left, right));
    const auto backward = PathRecorder::Record(fDiff(right, left));

    std::vector<std::string> forwardPaths;
    for (const auto& [path, entry] : forward) {
        forwardPaths.push_back(path);
    }

    std::vector<std::string> backwardPaths;
    for (const auto& [path, entry] : backward) {
        backwardPaths.push_back(path);
    }

    ASSERT_EQ(forwardPaths, backwardPaths);
    const std::vector<std::string> expectedPaths = {
        "", "/a", "/b", "/b/0", "/b/1", "/b/1/0", "/b/1/1", "/b/2", "/b/2/x", "/b/2/y", "/b/3", "/b/4",
        "/c", "/c/d", "/c/f", "/c/f/0", "/c/f/1", "/e", "/g",
    };
    EXPECT_EQ(forwardPaths, expectedPaths);

    for (const auto& [path, entry] : forward) {
        SCOPED_TRACE(path);
        const auto& mirrored = backward.at(path);
        switch (entry.NodeStatus) {
        case Status::Added:
            ASSERT_EQ(mirrored.NodeStatus, Status::Removed);
            EXPECT_EQ(mirrored.Values, entry.Values);
            break;
        case Status::Removed:
            ASSERT_EQ(mirrored.NodeStatus, Status::Added);
            EXPECT_EQ(mirrored.Values, entry.Values);
            break;
        case Status::Changed:
            ASSERT_EQ(mirrored.NodeStatus, Status::Changed);
            ASSERT_EQ(entry.Values.size(), 2u);
            ASSERT_EQ(mirrored.Values.size(), 2u);
            EXPECT_EQ(mirrored.Values[0], entry.Values[1]);
            EXPECT_EQ(mirrored.Values[1], entry.Values[0]);
            break;
        case Status::Unchanged:
        case Status::Nested:
            EXPECT_EQ(mirrored.NodeStatus, entry.NodeStatus);
            EXPECT_EQ(mirrored.Values, entry.Values);
            break;
        }
    }

    EXPECT_EQ(forward.at("/a").NodeStatus, Status::Changed);
    EXPECT_EQ(forward.at("/b/1/1").NodeStatus, Status::Removed);
    EXPECT_EQ(forward.at("/b/2/y").NodeStatus, Status::Added);
    EXPECT_EQ(forward.at("/b/3").NodeStatus, Status::Changed);
    EXPECT_EQ(forward.at("/b/4").NodeStatus, Status::Added);
    EXPECT_EQ(forward.at("/c/d").NodeStatus, Status::Removed);
    EXPECT_EQ(forward.at("/c/f/1").NodeStatus, Status::Added);
    EXPECT_EQ(forward.at("/e").NodeStatus, Status::Added);
}

TEST(DiffEngineTest, KeysOnlyIgnoresValues) {
    const DiffEngine engine(DiffOptions{true});
    EXPECT_TRUE(engine.Compare(fParse(R"({"a": 1, "b": [1, "x"]})"), fParse(R"({"b": [2, "y"], "a": "z"})")).IsUnchanged());
    EXPECT_TRUE(engine.Compare(fParse(R"({"a": 1})"), fParse(R"({"a": [1]})")).IsUnchanged());

    const auto diff = engine.Compare(fParse(R"({"a": 1, "b": [1]})"), fParse(R"({"a": 2, "b": [1, 2], "c": 3})"));
    const auto stats = DiffStats::Collect(diff);
    EXPECT_EQ(stats.Added(), 2u);
    EXPECT_EQ(stats.Changed(), 0u);
    EXPECT_EQ(stats.Removed(), 0u);
    EXPECT_TRUE(fChild(diff, "a").Node.IsUnchanged());
    EXPECT_EQ(fChild(diff, "a").Node.GetValue(), Json::Value(2));
}

TEST(DiffEngineTest, ParallelComparisonMatchesSequential) {
    const auto left = fWideDocument(300, 1);
    const auto right = fWideDocument(300, 2);

    const DiffEngine sequential;
    const auto expected = Render::TextRenderer().Render(sequential.Compare(left, right));
    ASSERT_FALSE(expected.empty());

    auto moduleRegistry = std::make_shared<ModuleRegistry>();
    moduleRegistry->SetWorkerPool(std::make_shared<Concurrency::WorkerPool>(4));
    const DiffEngine parallel(DiffOptions{false, 1}, moduleRegistry);
    for (int run = 0; run < 5; ++run) {
        EXPECT_EQ(Render::TextRenderer().Render(parallel.Compare(left, right)), expected);
    }

    EXPECT_TRUE(parallel.Compare(left, left).IsUnchanged());
}

TEST(DiffEngineTest, AccessorOfWrongStatusThrows) {
    const auto unchanged = DiffNode::Unchanged(Json::Value(1));
    EXPECT_THROW(unchanged.Children(), std::logic_error);
    EXPECT_THROW(unchanged.OldValue(), std::logic_error);
    EXPECT_THROW(unchanged.GetContainerKind(), std::logic_error);

    const auto changed = DiffNode::Changed(Json::Value(1), Json::Value(2));
    EXPECT_THROW(changed.GetValue(), std::logic_error);
    EXPECT_NO_THROW(changed.NewValue());

    const auto nested = DiffNode::Nested(ContainerKind::Array, {});
    EXPECT_THROW(nested.GetValue(), std::logic_error);
    EXPECT_THROW(nested.NewValue(), std::logic_error);
}

TEST(DiffEngineTest, DiffStringIsEmptyForIdenticalDocuments) {
    EXPECT_FALSE(JsonStructDiff::fDiffString(fParse("[1, {}]"), fParse("[1.0, {}]")).has_value());

    const auto report = JsonStructDiff::fDiffString(fParse(R"({"foo": 42})"), fParse(R"({"foo": 10})"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value(), " {\n-  foo: 42\n+  foo: 10\n }\n");
}
