/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

#include <cstddef>
#include <initializer_list>

namespace Json {
using namespace StdLib;

/** Order of the enumerators follows the order of the alternatives in Value::Storage */
enum class Kind {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/** JSON number. Keeps the literal form produced by the parser (signed, unsigned or floating)
 *  for display, but two numbers are equal when their values are equal as 64-bit doubles,
 *  so 1 == 1.0 holds.
 */
class Number {
public:
    using Repr = Variant<int64_t, uint64_t, double>;

    Number() : mRepr(int64_t{0}) {}
    explicit Number(int64_t value) : mRepr(value) {}
    explicit Number(uint64_t value) : mRepr(value) {}
    explicit Number(double value) : mRepr(value) {}

    double AsDouble() const {
        return std::visit([](auto value) { return static_cast<double>(value); }, mRepr);
    }

    bool IsFloat() const { return std::holds_alternative<double>(mRepr); }
    const Repr& Representation() const { return mRepr; }

    bool operator==(const Number& other) const { return AsDouble() == other.AsDouble(); }
    bool operator!=(const Number& other) const { return !(*this == other); }

private:
    Repr mRepr;
};

class Value;
using Array = Vector<Value>;

/** JSON object. Members keep their insertion order, lookup goes through a key index.
 *  Equality compares the key sets and the values per key, the order is not significant.
 */
class Object {
public:
    /** Insert - Adds a member, or replaces the value of an existing key in place
     * @return True if the key was not present before
     */
    bool Insert(String key, Value value);

    const Value* Find(StringView key) const;
    bool Contains(StringView key) const { return mIndexByKey.find(key) != mIndexByKey.end(); }

    size_t Size() const { return mKeys.size(); }
    bool Empty() const { return mKeys.empty(); }

    const Vector<String>& Keys() const { return mKeys; }
    const String& KeyAt(size_t index) const { return mKeys.at(index); }
    const Value& ValueAt(size_t index) const;

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    Vector<String> mKeys;
    Vector<Value> mValues;
    std::map<String, size_t, std::less<>> mIndexByKey;
};

/** Immutable JSON value: a closed tagged union over the six JSON kinds */
class Value {
public:
    using Storage = Variant<std::nullptr_t, bool, Number, String, Array, Object>;

    Value() : mData(nullptr) {}
    Value(std::nullptr_t) : mData(nullptr) {}
    Value(bool value) : mData(value) {}
    Value(Number value) : mData(std::move(value)) {}
    Value(int value) : mData(Number(static_cast<int64_t>(value))) {}
    Value(int64_t value) : mData(Number(value)) {}
    Value(uint64_t value) : mData(Number(value)) {}
    Value(double value) : mData(Number(value)) {}
    Value(const char* value) : mData(String(value)) {}
    Value(String value) : mData(std::move(value)) {}
    Value(Array value) : mData(std::move(value)) {}
    Value(Object value) : mData(std::move(value)) {}

    Kind GetKind() const { return static_cast<Kind>(mData.index()); }
    bool IsContainer() const { return GetKind() == Kind::Array || GetKind() == Kind::Object; }

    bool AsBool() const { return std::get<bool>(mData); }
    const Number& AsNumber() const { return std::get<Number>(mData); }
    const String& AsString() const { return std::get<String>(mData); }
    const Array& AsArray() const { return std::get<Array>(mData); }
    const Object& AsObject() const { return std::get<Object>(mData); }

    const Storage& Data() const { return mData; }

    /** Structural equality, deep and independent of object key order */
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage mData;
};

inline const Value& Object::ValueAt(size_t index) const { return mValues.at(index); }

const char* fKindName(Kind kind);

/** Builders used where a document is assembled in code rather than parsed */
Value fMakeArray(std::initializer_list<Value> items);
Value fMakeObject(std::initializer_list<Pair<String, Value>> members);
} // namespace Json
