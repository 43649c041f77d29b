#pragma once
#include <fmt/core.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace svd {
    enum class lib { eigen, lapacke }; /*!< Library */

    /*! \brief SVD routine. In Eigen gesvd, gejsv, gesvj, are just JacobiSVD, while gesdd is BDCSVD
     * Links to disussions:
     * https://discourse.julialang.org/t/svd-better-default-to-gesvd-instead-of-gesdd/20603/17
     * */
    enum class rtn {
        gesvj, /*!< Slowest. Preconditioned Jacobi. Probably the most accurate for tiny singular values  */
        gejsv, /*!< Slower. Preconditioned Jacobi. More accurate than QR */
        gesvd, /*!< Fast. Bidiagonal QR iteration. Sufficient accuracy. */
        gesdd, /*!< Fastest. Divide and conquer. Low accuracy on small singular values.   */
        geauto /*!< Defaults to gejsv for small matrices, moving to gesvd and then gesdd for larger matrices */
    };

    constexpr inline std::string_view enum2sv(svd::lib lib) {
        switch(lib) {
            case svd::lib::eigen: return "eigen";
            case svd::lib::lapacke: return "lapacke";
            default: throw std::logic_error("Could not match svd::lib");
        }
    }

    constexpr inline std::string_view enum2sv(svd::rtn rtn) {
        switch(rtn) {
            case svd::rtn::gesvd: return "gesvd";
            case svd::rtn::gejsv: return "gejsv";
            case svd::rtn::gesvj: return "gesvj";
            case svd::rtn::gesdd: return "gesdd";
            case svd::rtn::geauto: return "geauto";
            default: throw std::logic_error("Could not match svd::rtn");
        }
    }

    /*! Optional overrides of the defaults in svd::solver. Fields left empty keep the solver's current value. */
    struct config {
        std::optional<size_t>   switchsize_gejsv = std::nullopt;
        std::optional<size_t>   switchsize_gesvd = std::nullopt;
        std::optional<size_t>   switchsize_gesdd = std::nullopt;
        std::optional<size_t>   loglevel         = std::nullopt;
        std::optional<svd::lib> svd_lib          = std::nullopt;
        std::optional<svd::rtn> svd_rtn          = std::nullopt;
        [[nodiscard]] std::string to_string() const;
        config() = default;
        explicit config(svd::lib svd_lib_);
        explicit config(svd::lib svd_lib_, svd::rtn svd_rtn_);
    };
}
