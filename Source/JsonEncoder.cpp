/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "JsonEncoder.hpp"

#include "ValueConverter.hpp"

namespace Render {
namespace {
using namespace Json::Encoding;

Json::JSON fEncodeObject(const Diff::DiffNode& node) {
    auto jObject = Json::JSON::object();
    for (const auto& child : node.Children()) {
        const auto& key = child.Key.Name();
        switch (child.Node.GetStatus()) {
        case Diff::Status::Unchanged:
            break;
        case Diff::Status::Added:
            jObject[key + Field::ADDED_SUFFIX] = Json::fToJson(child.Node.GetValue());
            break;
        case Diff::Status::Removed:
            jObject[key + Field::DELETED_SUFFIX] = Json::fToJson(child.Node.GetValue());
            break;
        case Diff::Status::Changed:
        case Diff::Status::Nested:
            jObject[key] = fEncodeJson(child.Node);
            break;
        }
    }

    return jObject;
}

Json::JSON fEncodeArray(const Diff::DiffNode& node) {
    auto jArray = Json::JSON::array();
    for (const auto& child : node.Children()) {
        switch (child.Node.GetStatus()) {
        case Diff::Status::Unchanged:
            if (child.Node.GetValue().IsContainer()) {
                jArray.push_back(Json::JSON::array({Operation::KEEP}));
            }
            else {
                jArray.push_back(Json::JSON::array({Operation::KEEP, Json::fToJson(child.Node.GetValue())}));
            }
            break;
        case Diff::Status::Added:
            jArray.push_back(Json::JSON::array({Operation::ADD, Json::fToJson(child.Node.GetValue())}));
            break;
        case Diff::Status::Removed:
            jArray.push_back(Json::JSON::array({Operation::REMOVE, Json::fToJson(child.Node.GetValue())}));
            break;
        case Diff::Status::Changed:
            jArray.push_back(Json::JSON::array({Operation::REMOVE, Json::fToJson(child.Node.OldValue())}));
            jArray.push_back(Json::JSON::array({Operation::ADD, Json::fToJson(child.Node.NewValue())}));
            break;
        case Diff::Status::Nested:
            jArray.push_back(Json::JSON::array({Operation::CHANGE, fEncodeJson(child.Node)}));
            break;
        }
    }

    return jArray;
}
} // namespace

Json::JSON fEncodeJson(const Diff::DiffNode& node) {
    switch (node.GetStatus()) {
    case Diff::Status::Unchanged:
        return Json::JSON(nullptr);
    case Diff::Status::Added:
        return Json::JSON::object({{Field::NEW, Json::fToJson(node.GetValue())}});
    case Diff::Status::Removed:
        return Json::JSON::object({{Field::OLD, Json::fToJson(node.GetValue())}});
    case Diff::Status::Changed:
        return Json::JSON::object({{Field::OLD, Json::fToJson(node.OldValue())}, {Field::NEW, Json::fToJson(node.NewValue())}});
    case Diff::Status::Nested:
        if (node.GetContainerKind() == Diff::ContainerKind::Object) {
            return fEncodeObject(node);
        }

        return fEncodeArray(node);
    }

    return Json::JSON(nullptr);
}
} // namespace Render
