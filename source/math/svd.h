#pragma once

#include "math/float.h"
#include "math/tenx.h"
#include "svd/config.h"
#include "tools/common/log.h"
#include <atomic>
#include <optional>
#include <tuple>

namespace svd {
    inline std::shared_ptr<spdlog::logger> log;

    template<typename Scalar>
    using MatrixType = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
    template<typename Scalar>
    using VectorType = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

    /*! \brief Dense singular value decomposition A = U * diag(S) * VT of a column-major matrix.
     *
     *  The full (thin) decomposition is always returned: U is rows x k, S has k entries and VT is k x cols, with k = min(rows,cols).
     *  Singular values are real, non-negative and sorted in descending order. Truncation is left to the caller.
     *  A failed factorization throws except::convergence_error and is never retried with another routine.
     */
    class solver {
        private:
        static std::atomic<long long> count; // Count the number of svd invocations for this execution

        template<typename Scalar>
        std::tuple<MatrixType<Scalar>, VectorType<fp64>, MatrixType<Scalar>> do_svd_lapacke(const Scalar *mat_ptr, long rows, long cols) const;

        template<typename Scalar>
        std::tuple<MatrixType<Scalar>, VectorType<fp64>, MatrixType<Scalar>> do_svd_eigen(const Scalar *mat_ptr, long rows, long cols) const;

        void copy_config(const svd::config &svd_cfg);

        template<typename Scalar>
        void print_matrix(const Scalar *mat_ptr, long rows, long cols, std::string_view tag, long dec = 8) const;

        public:
        solver();
        solver(const svd::config &svd_cfg);
        solver(std::optional<svd::config> svd_cfg);

        // Switch sizes for automatic algorithm promotion (only used with svd::rtn::geauto)
        size_t   switchsize_gejsv = 1;   /*!< Default jacobi algorithm (gesjsv) when min(rows,cols) >= swtichsize_gejsv, otherwise gesvj */
        size_t   switchsize_gesvd = 32;  /*!< Default QR bidiagonalization (gesvd) when min(rows,cols) >= switchsize_gesvd */
        size_t   switchsize_gesdd = 64;  /*!< Default bidiagonal divide and conquer when  min(rows,cols) >= switchsize_gesdd */
        svd::lib svd_lib          = svd::lib::eigen;
        svd::rtn svd_rtn          = svd::rtn::geauto;

        void set_config(const svd::config &svd_cfg);
        void set_config(std::optional<svd::config> svd_cfg);

        void                           setLogLevel(size_t logLevel);
        [[nodiscard]] static long long get_count();

        template<typename Scalar>
        std::tuple<MatrixType<Scalar>, VectorType<fp64>, MatrixType<Scalar>> do_svd_ptr(const Scalar *mat_ptr, long rows, long cols,
                                                                                        const svd::config &svd_cfg = svd::config());

        template<typename Derived>
        auto do_svd(const Eigen::DenseBase<Derived> &mat, const svd::config &svd_cfg = svd::config()) {
            return do_svd_ptr(mat.derived().data(), mat.rows(), mat.cols(), svd_cfg);
        }

        template<typename Scalar>
        std::tuple<Eigen::Tensor<Scalar, 2>, Eigen::Tensor<fp64, 1>, Eigen::Tensor<Scalar, 2>> decompose(const Eigen::Tensor<Scalar, 2> &tensor,
                                                                                                         const svd::config &svd_cfg = svd::config()) {
            auto [U, S, VT] = do_svd_ptr(tensor.data(), tensor.dimension(0), tensor.dimension(1), svd_cfg);
            return std::make_tuple(tenx::TensorCast(U), tenx::TensorCast(S), tenx::TensorCast(VT));
        }
    };
}
