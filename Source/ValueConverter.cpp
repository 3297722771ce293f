/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "ValueConverter.hpp"

namespace Json {
namespace {
Value fConvert(const JSON& json, size_t depth, size_t maxDepth) {
    switch (json.type()) {
    case JSON::value_t::null:
    case JSON::value_t::discarded:
        return Value(nullptr);
    case JSON::value_t::boolean:
        return Value(json.get<bool>());
    case JSON::value_t::number_integer:
        return Value(Number(json.get<int64_t>()));
    case JSON::value_t::number_unsigned:
        return Value(Number(json.get<uint64_t>()));
    case JSON::value_t::number_float:
        return Value(Number(json.get<double>()));
    case JSON::value_t::string:
        return Value(json.get<String>());
    case JSON::value_t::binary: {
        // Not produced by the text parser, kept as its array of bytes
        if (depth >= maxDepth) {
            throw DepthLimitError(maxDepth);
        }

        Array bytes;
        for (const auto byte : json.get_binary()) {
            bytes.push_back(Value(Number(static_cast<uint64_t>(byte))));
        }

        return Value(std::move(bytes));
    }
    case JSON::value_t::array: {
        if (depth >= maxDepth) {
            throw DepthLimitError(maxDepth);
        }

        Array array;
        array.reserve(json.size());
        for (const auto& item : json) {
            array.push_back(fConvert(item, depth + 1, maxDepth));
        }

        return Value(std::move(array));
    }
    case JSON::value_t::object: {
        if (depth >= maxDepth) {
            throw DepthLimitError(maxDepth);
        }

        Object object;
        for (const auto& [key, member] : json.items()) {
            object.Insert(key, fConvert(member, depth + 1, maxDepth));
        }

        return Value(std::move(object));
    }
    }

    return Value(nullptr);
}
} // namespace

Value fFromJson(const JSON& json, size_t maxDepth) {
    return fConvert(json, 0, maxDepth);
}

JSON fToJson(const Value& value) {
    switch (value.GetKind()) {
    case Kind::Null:
        return JSON(nullptr);
    case Kind::Bool:
        return JSON(value.AsBool());
    case Kind::Number:
        return std::visit([](auto number) { return JSON(number); }, value.AsNumber().Representation());
    case Kind::String:
        return JSON(value.AsString());
    case Kind::Array: {
        auto jArray = JSON::array();
        for (const auto& item : value.AsArray()) {
            jArray.push_back(fToJson(item));
        }

        return jArray;
    }
    case Kind::Object: {
        auto jObject = JSON::object();
        const auto& object = value.AsObject();
        for (size_t i = 0; i < object.Size(); ++i) {
            jObject[object.KeyAt(i)] = fToJson(object.ValueAt(i));
        }

        return jObject;
    }
    }

    return JSON(nullptr);
}

Value fParse(StringView text, size_t maxDepth) {
    return fFromJson(JSON::parse(text.begin(), text.end()), maxDepth);
}

String fDump(const Value& value, int indent) {
    return fToJson(value).dump(indent);
}
} // namespace Json
