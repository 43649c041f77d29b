#pragma once
#include "debug/exceptions.h"
#include <type_traits>
#include <utility>

/*! Casts between integral types, throwing if the value does not fit in the target type */
template<typename To, typename From>
[[nodiscard]] To safe_cast(From from) {
    if constexpr(std::is_same_v<To, From>) {
        return from;
    } else if constexpr(std::is_integral_v<To> and std::is_integral_v<From>) {
        if(not std::in_range<To>(from)) throw except::range_error("safe_cast: value {} does not fit in the target type", from);
        return static_cast<To>(from);
    } else {
        return static_cast<To>(from);
    }
}
