#pragma once
#include "debug/exceptions.h"
#include "math/eig/enums.h"
#include "math/svd/config.h"
#include <string>
#include <string_view>
#include <type_traits>

namespace enum_sfinae {
    template<class T, class... Ts>
    struct is_any : std::disjunction<std::is_same<T, Ts>...> {};
    template<class T, class... Ts>
    inline constexpr bool is_any_v = is_any<T, Ts...>::value;
}

/* clang-format off */
template<typename T>
constexpr auto sv2enum(std::string_view item) {
    static_assert(enum_sfinae::is_any_v<T,
        svd::lib,
        svd::rtn,
        eig::Lib>);
    if constexpr(std::is_same_v<T, svd::lib>) {
        if(item == "eigen")                 return svd::lib::eigen;
        if(item == "lapacke")               return svd::lib::lapacke;
    }
    if constexpr(std::is_same_v<T, svd::rtn>) {
        if(item == "gesvj")                 return svd::rtn::gesvj;
        if(item == "gejsv")                 return svd::rtn::gejsv;
        if(item == "gesvd")                 return svd::rtn::gesvd;
        if(item == "gesdd")                 return svd::rtn::gesdd;
        if(item == "geauto")                return svd::rtn::geauto;
    }
    if constexpr(std::is_same_v<T, eig::Lib>) {
        if(item == "EIGEN")                 return eig::Lib::EIGEN;
        if(item == "LAPACKE")               return eig::Lib::LAPACKE;
    }
    throw except::invalid_argument("sv2enum given invalid string item: {}", item);
}
/* clang-format on */
