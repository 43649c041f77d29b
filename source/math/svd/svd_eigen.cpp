#include "../svd.h"
#include "debug/exceptions.h"
#include "math/cast.h"
#include <Eigen/QR>
#include <Eigen/SVD>

namespace svd {
#if defined(NDEBUG)
    static constexpr bool ndebug = true;
#else
    static constexpr bool ndebug = false;
#endif
}

/*! \brief Performs SVD on a matrix with Eigen
 *  Uses Eigen::JacobiSVD for the Jacobi routines or for matrices smaller than switchsize_gesdd, and Eigen::BDCSVD otherwise.
 *   \param mat_ptr Pointer to the matrix. Supported are double * and std::complex<double> *
 *   \param rows Rows of the matrix
 *   \param cols Columns of the matrix
 *   \return The thin U, S, and VT matrices (with S as a vector)
 */
template<typename Scalar>
std::tuple<svd::MatrixType<Scalar>, svd::VectorType<fp64>, svd::MatrixType<Scalar>> svd::solver::do_svd_eigen(const Scalar *mat_ptr, long rows,
                                                                                                              long cols) const {
    svd::log->trace("Starting SVD with Eigen");
    auto                                 minRC = std::min(rows, cols);
    Eigen::Map<const MatrixType<Scalar>> mat(mat_ptr, rows, cols);

    if(not mat.allFinite()) throw except::convergence_error("Eigen SVD error: matrix has inf's or nan's");
    if constexpr(!ndebug) {
        if(mat.isZero(1e-12)) svd::log->debug("Eigen SVD: given matrix elements are all close to zero (prec 1e-12)");
    }

    MatrixType<Scalar>     U;
    VectorType<fp64>       S;
    MatrixType<Scalar>     VT;
    Eigen::ComputationInfo info = Eigen::Success;

    auto svd_info   = fmt::format("| {} x {} | switchsize bdc {}", rows, cols, switchsize_gesdd);
    bool use_jacobi = minRC < safe_cast<long>(switchsize_gesdd) or svd_rtn == svd::rtn::gejsv or svd_rtn == svd::rtn::gesvj;
    if(use_jacobi) {
        // We only use Jacobi for precision. So we use all the precision we can get.
        svd::log->debug("Running Eigen::JacobiSVD {}", svd_info);
        Eigen::JacobiSVD<MatrixType<Scalar>, Eigen::ColPivHouseholderQRPreconditioner> SVD(mat, Eigen::ComputeThinU | Eigen::ComputeThinV);
        info = SVD.info();
        U    = SVD.matrixU();
        S    = SVD.singularValues();
        VT   = SVD.matrixV().adjoint();
    } else {
        svd::log->debug("Running Eigen::BDCSVD {}", svd_info);
        Eigen::BDCSVD<MatrixType<Scalar>> SVD;
        SVD.setSwitchSize(safe_cast<int>(std::max<size_t>(switchsize_gesdd, 3)));
        SVD.compute(mat, Eigen::ComputeThinU | Eigen::ComputeThinV);
        info = SVD.info();
        U    = SVD.matrixU();
        S    = SVD.singularValues();
        VT   = SVD.matrixV().adjoint();
    }

    bool U_finite   = U.allFinite();
    bool S_finite   = S.allFinite();
    bool V_finite   = VT.allFinite();
    bool S_positive = (S.array() >= 0).all();
    bool S_sorted   = std::is_sorted(S.data(), S.data() + S.size(), std::greater<>());

    if(info != Eigen::Success or not U_finite or not S_finite or not S_positive or not S_sorted or not V_finite) {
        if(not S_positive) svd::log->critical("Eigen SVD error: S is not positive");
        if(not U_finite or not V_finite) print_matrix(mat.data(), mat.rows(), mat.cols(), "A");
        throw except::convergence_error("Eigen SVD error \n"
                                        "  Dimensions       = ({}, {})\n"
                                        "  Converged        : {}\n"
                                        "  U all finite     : {}\n"
                                        "  S all finite     : {}\n"
                                        "  S all positive   : {}\n"
                                        "  S sorted         : {}\n"
                                        "  V all finite     : {}\n",
                                        rows, cols, info == Eigen::Success, U_finite, S_finite, S_positive, S_sorted, V_finite);
    }

    svd::log->trace("SVD with Eigen finished successfully");
    return std::make_tuple(std::move(U), std::move(S), std::move(VT));
}

//! \relates svd::solver
//! \brief force instantiation of do_svd_eigen for type 'double'
template std::tuple<svd::MatrixType<double>, svd::VectorType<fp64>, svd::MatrixType<double>> svd::solver::do_svd_eigen(const double *, long, long) const;

using cplx = std::complex<double>;
//! \relates svd::solver
//! \brief force instantiation of do_svd_eigen for type 'std::complex<double>'
template std::tuple<svd::MatrixType<cplx>, svd::VectorType<fp64>, svd::MatrixType<cplx>> svd::solver::do_svd_eigen(const cplx *, long, long) const;
