#pragma once
#include "config.h"
#include "config/settings.h"
#include "math/eig/solver.h"
#include "math/num.h"
#include "math/svd.h"
#include "partition.h"
#include "tools/common/log.h"
#include "truncation.h"
#include <optional>

/*!
 *  \namespace decomp
 *  Singular value and eigenvalue decompositions of Eigen tensors, truncated by a shared rank selector.
 *  The tensor axes are split in two groups a and b, flattened to a matrix, decomposed, truncated and reshaped back.
 */
namespace decomp {

    template<typename Scalar, size_t NA, size_t NB>
    struct svd_result {
        Eigen::Tensor<Scalar, static_cast<int>(NA) + 1> U; /*!< Shape (shape_a..., chi) */
        Eigen::Tensor<fp64, 1>                          S; /*!< chi singular values in descending order */
        Eigen::Tensor<Scalar, static_cast<int>(NB) + 1> V; /*!< Shape (chi, shape_b...) */
        std::optional<double>                           rel_err = std::nullopt;
    };

    template<size_t NA>
    struct eig_result {
        Eigen::Tensor<cx64, 1>                          S; /*!< chi eigenvalues sorted by descending absolute value */
        Eigen::Tensor<cx64, static_cast<int>(NA) + 1>   U; /*!< Right eigenvectors with shape (shape_a..., chi). U[...,i] belongs to S[i] */
        std::optional<double>                           rel_err = std::nullopt;
    };

    template<typename Scalar, int N, size_t NA, size_t NB>
    svd_result<Scalar, NA, NB> svd(const Eigen::Tensor<Scalar, N> &tensor, const std::array<long, NA> &a, const std::array<long, NB> &b,
                                   const config &cfg = {}) {
        auto grp = partition(tensor, a, b);
        tools::get_log()->trace("svd: axes {} | {} -> {} x {} {}", a, b, grp.dim_a, grp.dim_b, cfg.to_string());

        auto svd_solver = ::svd::solver(settings::get_svd_config());
        svd_solver.set_config(cfg.svd_cfg);
        auto [U, S, VT] = svd_solver.do_svd_ptr(grp.matrix.data(), grp.dim_a, grp.dim_b);

        auto trunc = select_rank(S, cfg.eps, cfg.chis, cfg.break_degenerate, cfg.degeneracy_eps);
        auto chi   = trunc.chi;

        svd_result<Scalar, NA, NB> res;
        res.U = tenx::TensorCast(U.leftCols(chi), append(grp.shape_a, chi));
        res.S = tenx::TensorCast(S.head(chi), chi);
        res.V = tenx::TensorCast(VT.topRows(chi), prepend(chi, grp.shape_b));
        if(cfg.return_rel_err) res.rel_err = trunc.error;
        return res;
    }

    /*! \brief Truncated singular value decomposition of a tensor.
     *  The axes in a and b (std::array<long,M> or a bare long) become the legs of U and V respectively, so that
     *  contracting U, diag(S) and V over the new bond reproduces the tensor permuted to a ++ b, up to the truncation error.
     */
    template<typename Scalar, int N, typename AxesA, typename AxesB>
    auto svd(const Eigen::Tensor<Scalar, N> &tensor, const AxesA &a, const AxesB &b, const config &cfg = {}) {
        return svd(tensor, as_axes(a), as_axes(b), cfg);
    }

    template<typename Scalar, int N, size_t NA, size_t NB>
    eig_result<NA> eig(const Eigen::Tensor<Scalar, N> &tensor, const std::array<long, NA> &a, const std::array<long, NB> &b, const config &cfg = {}) {
        auto grp = partition(tensor, a, b);
        if(grp.dim_a != grp.dim_b) throw except::invalid_argument("eig: axes {} | {} give a non-square {} x {} matrix", a, b, grp.dim_a, grp.dim_b);
        tools::get_log()->trace("eig: axes {} | {} -> {} x {} {}", a, b, grp.dim_a, grp.dim_b, cfg.to_string());

        auto eig_cfg = cfg.eig_cfg.value_or(::eig::settings());
        if(not eig_cfg.lib) eig_cfg.lib = settings::eig::lib;
        if(not eig_cfg.loglevel) eig_cfg.loglevel = settings::eig::loglevel;
        auto eig_solver = ::eig::solver(eig_cfg);
        if(cfg.hermitian)
            eig_solver.eig<::eig::Form::SYMM>(grp.matrix.data(), grp.dim_a);
        else
            eig_solver.eig<::eig::Form::NSYM>(grp.matrix.data(), grp.dim_a);

        const auto &eigvals = eig_solver.result.get_eigvals<cx64>();
        const auto &eigvecs = eig_solver.result.get_eigvecs<cx64>();
        auto        L       = grp.dim_a;

        // The solvers give no particular order. Sort by descending magnitude, keeping the order of ties.
        auto order = num::argsort(eigvals, [](const cx64 &lhs, const cx64 &rhs) { return std::abs(lhs) > std::abs(rhs); });

        auto               evecs = Eigen::Map<const tenx::MatrixType<cx64>>(eigvecs.data(), L, L);
        Eigen::VectorXcd   S(L);
        Eigen::MatrixXcd   U(L, L);
        Eigen::VectorXd    magnitudes(L);
        for(long i = 0; i < L; i++) {
            auto j        = order[static_cast<size_t>(i)];
            S[i]          = eigvals[static_cast<size_t>(j)];
            U.col(i)      = evecs.col(j);
            magnitudes[i] = std::abs(S[i]);
        }

        auto trunc = select_rank(magnitudes, cfg.eps, cfg.chis, cfg.break_degenerate, cfg.degeneracy_eps);
        auto chi   = trunc.chi;

        eig_result<NA> res;
        res.S = tenx::TensorCast(S.head(chi), chi);
        res.U = tenx::TensorCast(U.leftCols(chi), append(grp.shape_a, chi));
        if(cfg.return_rel_err) res.rel_err = trunc.error;
        return res;
    }

    /*! \brief Truncated eigendecomposition of a tensor whose axes a and b flatten to a square matrix.
     *  Eigenvalues are sorted by descending absolute value and truncated with the same rules as decomp::svd.
     *  With cfg.hermitian the self-adjoint solver is used and the eigenvalues have zero imaginary part.
     */
    template<typename Scalar, int N, typename AxesA, typename AxesB>
    auto eig(const Eigen::Tensor<Scalar, N> &tensor, const AxesA &a, const AxesB &b, const config &cfg = {}) {
        return eig(tensor, as_axes(a), as_axes(b), cfg);
    }
}
