#pragma once
#include "config/settings.h"
#include "math/eig/settings.h"
#include "math/svd/config.h"
#include <optional>
#include <string>
#include <vector>

namespace decomp {
    /*! \brief Truncation options shared by decomp::svd and decomp::eig
     *
     *  With eps <= 0 the largest candidate in chis is kept (all values when chis is empty).
     *  With eps > 0 the smallest candidate whose relative truncation error is below eps is kept.
     *  The degeneracy defaults are read from settings::decomp when the config is constructed.
     */
    struct config {
        std::optional<std::vector<long>> chis             = std::nullopt; /*!< Candidate ranks. A single long is a one-element list */
        double                           eps              = 0;            /*!< Relative truncation error bound */
        bool                             return_rel_err   = false;        /*!< Populate rel_err in the result */
        bool                             break_degenerate = settings::decomp::break_degenerate;
        double                           degeneracy_eps   = settings::decomp::degeneracy_eps;
        bool                             hermitian        = false; /*!< eig only: use the self-adjoint eigensolver */
        std::optional<svd::config>       svd_cfg          = std::nullopt;
        std::optional<eig::settings>     eig_cfg          = std::nullopt;

        config() = default;
        config(long chi, double eps_ = 0);
        config(std::vector<long> chis_, double eps_ = 0);
        [[nodiscard]] std::string to_string() const;
    };
}
