#pragma once

#include <cstring>
#include <iosfwd>
#include <string>
#include <type_traits>

#include "vine/vm/config.hpp"

namespace vine {

// Opaque reference into the heap's object table. The generation changes every
// time the slot behind `index` is freed, so old handles stop resolving.
struct Handle
{
    uint32 index;
    uint32 generation;
};

VINE_FORCE_INLINE bool operator==(const Handle &a, const Handle &b)
{
    return a.index == b.index && a.generation == b.generation;
}

VINE_FORCE_INLINE bool operator!=(const Handle &a, const Handle &b)
{
    return !(a == b);
}

enum class ValueType : uint8
{
    RAW,
    REFERENCE,
};

struct Value
{
    ValueType type;
    union
    {
        uint64 raw;
        Handle handle;
    } as;

    Value();
    Value(const Value &other) = default;
    Value(Value &&other) noexcept = default;
    Value &operator=(const Value &other) = default;
    Value &operator=(Value &&other) noexcept = default;

    static Value makeRaw(uint64 bits);
    static Value makeReference(Handle handle);

    // Zero-extends smaller unsigned types.
    template <typename T>
    static Value fromUnsigned(T value)
    {
        static_assert(std::is_integral<T>::value && std::is_unsigned<T>::value, "unsigned integer expected");
        return makeRaw(static_cast<uint64>(value));
    }

    // Sign-extends smaller signed types to 64 bits.
    template <typename T>
    static Value fromSigned(T value)
    {
        static_assert(std::is_integral<T>::value && std::is_signed<T>::value, "signed integer expected");
        return makeRaw(static_cast<uint64>(static_cast<int64>(value)));
    }

    static Value fromFloat(float value);
    static Value fromDouble(double value);

    // Type checks
    VINE_FORCE_INLINE bool isRaw() const { return type == ValueType::RAW; }
    VINE_FORCE_INLINE bool isReference() const { return type == ValueType::REFERENCE; }

    // Conversions. Callers check the tag first; reading the wrong arm is a bug.
    VINE_FORCE_INLINE uint64 asRaw() const { return as.raw; }
    VINE_FORCE_INLINE Handle asHandle() const { return as.handle; }
    VINE_FORCE_INLINE int64 asInt64() const { return static_cast<int64>(as.raw); }

    VINE_FORCE_INLINE double asDouble() const
    {
        double out;
        std::memcpy(&out, &as.raw, sizeof(out));
        return out;
    }

    VINE_FORCE_INLINE float asFloat() const
    {
        uint32 bits = static_cast<uint32>(as.raw);
        float out;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }
};

const char *valueTypeToString(ValueType type);
std::string valueToString(const Value &value);

VINE_FORCE_INLINE bool valuesEqual(const Value &a, const Value &b)
{
    if (a.type != b.type)
        return false;

    if (a.isRaw())
        return a.as.raw == b.as.raw;

    return a.as.handle == b.as.handle;
}

VINE_FORCE_INLINE bool operator==(const Value &a, const Value &b)
{
    return valuesEqual(a, b);
}

VINE_FORCE_INLINE bool operator!=(const Value &a, const Value &b)
{
    return !valuesEqual(a, b);
}

std::ostream &operator<<(std::ostream &out, const Value &value);

} // namespace vine
