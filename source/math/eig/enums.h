#pragma once
#include "math/float.h"
#include <optional>
#include <stdexcept>
#include <string_view>

namespace eig {
    using size_type = long;
    using real      = fp64;
    using cplx      = cx64;

    // Enums
    enum class Lib { EIGEN, LAPACKE }; // Choose the underlying library
    enum class Form { SYMM, NSYM };    // Symmetric or non-symmetric problems (complex symmetric are assumed Hermitian)
    enum class Type { REAL, CPLX };    // Real or complex, i.e. double or std::complex<double> matrix
    enum class Vecs { ON, OFF };

    constexpr std::string_view enum2sv(Lib lib) {
        switch(lib) {
            case Lib::EIGEN: return "EIGEN";
            case Lib::LAPACKE: return "LAPACKE";
            default: throw std::logic_error("No valid eig::Lib given");
        }
    }
    constexpr std::string_view enum2sv(std::optional<Lib> lib) { return lib ? enum2sv(lib.value()) : "Lib:NONE"; }

    constexpr std::string_view enum2sv(Form form) {
        switch(form) {
            case Form::SYMM: return "SYMM";
            case Form::NSYM: return "NSYM";
            default: throw std::logic_error("Not a valid eig::Form");
        }
    }

    constexpr std::string_view enum2sv(Type type) {
        switch(type) {
            case Type::REAL: return "REAL";
            case Type::CPLX: return "CPLX";
            default: throw std::logic_error("Not a valid eig::Type");
        }
    }
    constexpr std::string_view enum2sv(std::optional<Type> type) { return type ? enum2sv(type.value()) : "Type:UNKNOWN"; }
}
