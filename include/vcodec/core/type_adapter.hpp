#pragma once

#include "vcodec/core/value.hpp"

#include <optional>
#include <string>
#include <type_traits>

namespace vcodec::core {

// -----------------------------------------------------------------------------
// Primary template: no adapter
// -----------------------------------------------------------------------------
template<typename T>
struct TypeAdapter {
    static constexpr bool is_specialized = false;
};

// -----------------------------------------------------------------------------
// Adapter detection
// -----------------------------------------------------------------------------
template<typename T>
struct has_type_adapter : std::false_type {};

template<typename T>
    requires (TypeAdapter<T>::is_specialized)
struct has_type_adapter<T> : std::true_type {};

template<typename T>
inline constexpr bool has_type_adapter_v = has_type_adapter<T>::value;

// An adapter provides
//   static constexpr ValueKind value_kind;
//   static Value to_value(const T&);
//   static T from_value(const Value&);   // EncodingTypeMismatchError on wrong kind
template<typename T, typename = void>
struct adapter_has_value_conversions : std::false_type {};

template<typename T>
struct adapter_has_value_conversions<T, std::void_t<
    decltype( TypeAdapter<T>::value_kind ),
    decltype( TypeAdapter<T>::to_value( std::declval<const T&>() ) ),
    decltype( TypeAdapter<T>::from_value( std::declval<const Value&>() ) )
>> : std::true_type {};

template<typename T>
inline constexpr bool adapter_has_value_conversions_v = adapter_has_value_conversions<T>::value;

// -----------------------------------------------------------------------------
// Concepts
// -----------------------------------------------------------------------------
template<typename T>
concept Adaptable = has_type_adapter_v<T> && adapter_has_value_conversions_v<T>;

// Types a Value can be built from directly or through an adapter
template<typename T>
concept ValueCompatible =
    std::is_same_v<T, bool> ||
    std::is_integral_v<T> ||
    std::is_floating_point_v<T> ||
    std::is_same_v<T, std::string> ||
    Adaptable<T>;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
template<Adaptable T>
Value adapt_to_value(const T& value) {
    return TypeAdapter<T>::to_value(value);
}

template<Adaptable T>
T adapt_from_value(const Value& value) {
    return TypeAdapter<T>::from_value(value);
}

// nullopt <-> Value::null()
template<Adaptable T>
Value adapt_to_value_opt(const std::optional<T>& value) {
    if (!value.has_value()) {
        return Value::null();
    }
    return TypeAdapter<T>::to_value(*value);
}

template<Adaptable T>
std::optional<T> adapt_from_value_opt(const Value& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    return TypeAdapter<T>::from_value(value);
}

} // namespace vcodec::core
