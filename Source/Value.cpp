/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Value.hpp"

#include <type_traits>

namespace Json {

bool Object::Insert(String key, Value value) {
    auto indexIt = mIndexByKey.find(key);
    if (indexIt != mIndexByKey.end()) {
        mValues[indexIt->second] = std::move(value);
        return false;
    }

    mIndexByKey.emplace(key, mKeys.size());
    mKeys.push_back(std::move(key));
    mValues.push_back(std::move(value));
    return true;
}

const Value* Object::Find(StringView key) const {
    auto indexIt = mIndexByKey.find(key);
    if (indexIt == mIndexByKey.end()) {
        return nullptr;
    }

    return &mValues[indexIt->second];
}

bool Object::operator==(const Object& other) const {
    if (Size() != other.Size()) {
        return false;
    }

    for (size_t i = 0; i < mKeys.size(); ++i) {
        const Value* otherValue = other.Find(mKeys[i]);
        if (!otherValue || (*otherValue != mValues[i])) {
            return false;
        }
    }

    return true;
}

bool Value::operator==(const Value& other) const {
    if (mData.index() != other.mData.index()) {
        return false;
    }

    return std::visit([&other](const auto& lhs) {
        using T = std::decay_t<decltype(lhs)>;
        return lhs == std::get<T>(other.mData);
    }, mData);
}

const char* fKindName(Kind kind) {
    switch (kind) {
    case Kind::Null:
        return "null";
    case Kind::Bool:
        return "boolean";
    case Kind::Number:
        return "number";
    case Kind::String:
        return "string";
    case Kind::Array:
        return "array";
    case Kind::Object:
        return "object";
    }

    return "unknown";
}

Value fMakeArray(std::initializer_list<Value> items) {
    return Value(Array(items));
}

Value fMakeObject(std::initializer_list<Pair<String, Value>> members) {
    Object object;
    for (const auto& [key, value] : members) {
        object.Insert(key, value);
    }

    return Value(std::move(object));
}
} // namespace Json
