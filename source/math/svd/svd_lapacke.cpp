#include "../svd.h"
#include "debug/exceptions.h"
#include "math/cast.h"
#include <complex>

#ifndef lapack_complex_float
    #define lapack_complex_float std::complex<float>
#endif
#ifndef lapack_complex_double
    #define lapack_complex_double std::complex<double>
#endif

// complex must be included before lapacke!
#include <lapacke.h>

namespace svd {
#if defined(NDEBUG)
    static constexpr bool ndebug = true;
#else
    static constexpr bool ndebug = false;
#endif
}

template<typename Scalar>
std::tuple<svd::MatrixType<Scalar>, svd::VectorType<fp64>, svd::MatrixType<Scalar>> svd::solver::do_svd_lapacke(const Scalar *mat_ptr, long rows,
                                                                                                                long cols) const {
    if(rows < cols and (svd_rtn == rtn::gejsv or svd_rtn == rtn::gesvj)) {
        // The jacobi routines needs a tall matrix
        svd::log->trace("Transposing {}x{} into a tall matrix {}x{}", rows, cols, cols, rows);
        MatrixType<Scalar> A = Eigen::Map<const MatrixType<Scalar>>(mat_ptr, rows, cols).adjoint();
        auto [U, S, VT]      = do_svd_lapacke(A.data(), A.rows(), A.cols());
        return std::make_tuple(MatrixType<Scalar>(VT.adjoint()), std::move(S), MatrixType<Scalar>(U.adjoint()));
    }

    // Setup useful sizes
    int rowsA = safe_cast<int>(rows);
    int colsA = safe_cast<int>(cols);
    int sizeS = std::min(rowsA, colsA);

    MatrixType<Scalar> A = Eigen::Map<const MatrixType<Scalar>>(mat_ptr, rows, cols); // gets destroyed in some routines
    if(not A.allFinite()) throw except::convergence_error("Lapacke SVD error: matrix has inf's or nan's");

    // Initialize containers
    MatrixType<Scalar> U;
    VectorType<fp64>   S;
    MatrixType<Scalar> V;
    MatrixType<Scalar> VT;
    svd::log->trace("Starting SVD with lapacke | rows {} | cols {}", rows, cols);

    int info   = 0;
    int rowsU  = rowsA;
    int colsU  = sizeS;
    int rowsVT = sizeS;
    int colsVT = colsA;
    int rowsV  = colsA;
    int colsV  = sizeS;
    int lda    = rowsA;
    int ldu    = rowsU;
    int ldvt   = rowsVT;
    int ldv    = rowsV;
    int mx     = std::max(rowsA, colsA);
    int mn     = std::min(rowsA, colsA);

    if constexpr(std::is_same_v<Scalar, double>) {
        std::vector<int>    iwork;
        std::vector<double> rwork;
        if constexpr(!ndebug) svd::log->debug("Running Lapacke d{} | switchsize bdc {} | size {}", enum2sv(svd_rtn), switchsize_gesdd, sizeS);
        switch(svd_rtn) {
            case rtn::gesvd: {
                U.resize(rowsU, colsU);
                S.resize(sizeS);
                VT.resize(rowsVT, colsVT);
                rwork.resize(1ul);
                info = LAPACKE_dgesvd_work(LAPACK_COL_MAJOR, 'S', 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, rwork.data(), -1);
                if(info != 0) break;
                int lrwork = safe_cast<int>(rwork[0]);
                rwork.resize(safe_cast<size_t>(std::max(1, lrwork)));
                info = LAPACKE_dgesvd_work(LAPACK_COL_MAJOR, 'S', 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, rwork.data(),
                                           lrwork);
                break;
            }
            case rtn::gesvj: {
                // For this routine we need rows >= cols
                S.resize(sizeS);
                V.resize(rowsV, colsV); // Local matrix gets transposed after computation
                int lrwork = std::max(6, rowsA + colsA);
                rwork.resize(safe_cast<size_t>(lrwork));
                info = LAPACKE_dgesvj_work(LAPACK_COL_MAJOR, 'G', 'U', 'V', rowsA, colsA, A.data(), lda, S.data(), ldv, V.data(), ldv, rwork.data(), lrwork);
                if(info != 0) break;
                U  = std::move(A);
                VT = V.adjoint();
                break;
            }
            case rtn::gejsv: {
                // For this routine we need rows >= cols
                S.resize(sizeS);
                U.resize(rowsU, colsU);
                V.resize(rowsV, colsV); // Local matrix gets transposed after computation
                int lrwork = std::max(2 * rowsA + colsA, 6 * colsA + 2 * colsA * colsA);
                int liwork = std::max(3, rowsA + 3 * colsA);
                rwork.resize(safe_cast<size_t>(lrwork));
                iwork.resize(safe_cast<size_t>(liwork));
                info = LAPACKE_dgejsv_work(LAPACK_COL_MAJOR, 'F' /* 'R' may also work well */, 'U', 'V', 'N' /* 'R' kills small columns of A */,
                                           'T' /* T/N:  T will transpose if faster. Ignored if A is rectangular */,
                                           'N' /* P/N: P will use perturbation to drown denormalized numbers */, rowsA, colsA, A.data(), lda, S.data(),
                                           U.data(), ldu, V.data(), ldv, rwork.data(), lrwork, iwork.data());
                if(info != 0) break;
                VT = V.adjoint();
                break;
            }
            case rtn::gesdd: {
                U.resize(rowsU, colsU);
                S.resize(sizeS);
                VT.resize(rowsVT, colsVT);
                int lrwork = std::max(1, mn * (6 + 4 * mn) + mx);
                int liwork = std::max(1, 8 * mn);
                rwork.resize(safe_cast<size_t>(lrwork));
                iwork.resize(safe_cast<size_t>(liwork));
                info = LAPACKE_dgesdd_work(LAPACK_COL_MAJOR, 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, rwork.data(), -1,
                                           iwork.data());
                if(info != 0) break;
                lrwork = safe_cast<int>(rwork[0]);
                rwork.resize(safe_cast<size_t>(std::max(1, lrwork)));
                info = LAPACKE_dgesdd_work(LAPACK_COL_MAJOR, 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, rwork.data(),
                                           lrwork, iwork.data());
                break;
            }
            default: throw except::logic_error("invalid case for enum svd::rtn: {}", enum2sv(svd_rtn));
        }
    } else if constexpr(std::is_same_v<Scalar, std::complex<double>>) {
        std::vector<int>                  iwork;
        std::vector<std::complex<double>> cwork;
        std::vector<double>               rwork;
        if constexpr(!ndebug) svd::log->debug("Running Lapacke z{} | switchsize bdc {} | size {}", enum2sv(svd_rtn), switchsize_gesdd, sizeS);
        switch(svd_rtn) {
            case rtn::gesvd: {
                U.resize(rowsU, colsU);
                S.resize(sizeS);
                VT.resize(rowsVT, colsVT);
                int lcwork = 1;
                int lrwork = std::max(1, 5 * mn);
                cwork.resize(safe_cast<size_t>(lcwork));
                rwork.resize(safe_cast<size_t>(lrwork));
                info = LAPACKE_zgesvd_work(LAPACK_COL_MAJOR, 'S', 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, cwork.data(), -1,
                                           rwork.data());
                if(info != 0) break;
                lcwork = safe_cast<int>(std::real(cwork[0]));
                cwork.resize(safe_cast<size_t>(std::max(1, lcwork)));
                info = LAPACKE_zgesvd_work(LAPACK_COL_MAJOR, 'S', 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, cwork.data(),
                                           lcwork, rwork.data());
                break;
            }
            case rtn::gesvj: {
                S.resize(sizeS);
                V.resize(rowsV, colsV); // Local matrix gets transposed after computation
                cwork.resize(1);
                rwork.resize(6ul);
                info = LAPACKE_zgesvj_work(LAPACK_COL_MAJOR, 'G', 'U', 'V', rowsA, colsA, A.data(), lda, S.data(), ldv, V.data(), ldv, cwork.data(), -1,
                                           rwork.data(), -1);
                if(info != 0) break;
                int lcwork = safe_cast<int>(std::real(cwork[0]));
                int lrwork = safe_cast<int>(rwork[0]);
                cwork.resize(safe_cast<size_t>(std::max(1, lcwork)));
                rwork.resize(safe_cast<size_t>(std::max(6, lrwork)));
                info = LAPACKE_zgesvj_work(LAPACK_COL_MAJOR, 'G', 'U', 'V', rowsA, colsA, A.data(), lda, S.data(), ldv, V.data(), ldv, cwork.data(), lcwork,
                                           rwork.data(), lrwork);
                if(info != 0) break;
                U  = std::move(A);
                VT = V.adjoint();
                break;
            }
            case rtn::gejsv: {
                S.resize(sizeS);
                U.resize(rowsU, colsU);
                V.resize(rowsV, colsV); // Local matrix gets transposed after computation
                cwork.resize(std::max(2ul, static_cast<size_t>(5 * rowsA + 2 * rowsA * rowsA)));
                rwork.resize(std::max(7ul, static_cast<size_t>(2 * colsA)));
                iwork.resize(std::max(4ul, static_cast<size_t>(2 * rowsA + colsA)));
                info = LAPACKE_zgejsv_work(LAPACK_COL_MAJOR, 'F', 'U', 'V', 'N', 'T', 'N', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, V.data(), ldv,
                                           cwork.data(), -1, rwork.data(), -1, iwork.data());
                if(info != 0) break;
                int lcwork = safe_cast<int>(std::real(cwork[0]));
                int lrwork = safe_cast<int>(rwork[0]);
                int liwork = safe_cast<int>(iwork[0]);
                cwork.resize(safe_cast<size_t>(std::max(2, lcwork)));
                rwork.resize(safe_cast<size_t>(std::max(7, lrwork)));
                iwork.resize(safe_cast<size_t>(std::max({4, 2 * rowsA + colsA, liwork})));
                info = LAPACKE_zgejsv_work(LAPACK_COL_MAJOR, 'F', 'U', 'V', 'N', 'T', 'N', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, V.data(), ldv,
                                           cwork.data(), lcwork, rwork.data(), lrwork, iwork.data());
                if(info != 0) break;
                VT = V.adjoint();
                break;
            }
            case rtn::gesdd: {
                U.resize(rowsU, colsU);
                S.resize(sizeS);
                VT.resize(rowsVT, colsVT);
                int lcwork = 1;
                int lrwork = std::max(1, mn * std::max(5 * mn + 7, 2 * mx + 2 * mn + 1));
                int liwork = std::max(1, 8 * mn);
                cwork.resize(static_cast<size_t>(lcwork));
                rwork.resize(static_cast<size_t>(lrwork));
                iwork.resize(static_cast<size_t>(liwork));
                info = LAPACKE_zgesdd_work(LAPACK_COL_MAJOR, 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, cwork.data(), -1,
                                           rwork.data(), iwork.data());
                if(info != 0) break;
                lcwork = safe_cast<int>(std::real(cwork[0]));
                cwork.resize(safe_cast<size_t>(std::max(1, lcwork)));
                info = LAPACKE_zgesdd_work(LAPACK_COL_MAJOR, 'S', rowsA, colsA, A.data(), lda, S.data(), U.data(), ldu, VT.data(), ldvt, cwork.data(), lcwork,
                                           rwork.data(), iwork.data());
                break;
            }
            default: throw except::logic_error("invalid case for enum svd::rtn: {}", enum2sv(svd_rtn));
        }
    }
    if(info < 0) throw except::logic_error("Lapacke SVD {} error: parameter {} is invalid", enum2sv(svd_rtn), -info);
    if(info > 0) throw except::convergence_error("Lapacke SVD {} error: could not converge: info {}", enum2sv(svd_rtn), info);

    bool uerr = !U.allFinite();
    bool serr = !S.allFinite() or (S.array() < 0).any();
    bool verr = !VT.allFinite();
    if(uerr or serr or verr)
        throw except::convergence_error("Lapacke SVD {} error \n"
                                        "  Dims             = ({}, {})\n"
                                        "  U all finite     : {}\n"
                                        "  S finite and >=0 : {}\n"
                                        "  VT all finite    : {}\n",
                                        enum2sv(svd_rtn), rows, cols, !uerr, !serr, !verr);

    svd::log->trace("SVD with lapacke finished successfully");
    return std::make_tuple(std::move(U), std::move(S), std::move(VT));
}

using real = double;
using cplx = std::complex<double>;

//! \relates svd::solver
//! \brief force instantiation of do_svd_lapacke for type 'double'
template std::tuple<svd::MatrixType<real>, svd::VectorType<fp64>, svd::MatrixType<real>> svd::solver::do_svd_lapacke(const real *, long, long) const;

//! \relates svd::solver
//! \brief force instantiation of do_svd_lapacke for type 'std::complex<double>'
template std::tuple<svd::MatrixType<cplx>, svd::VectorType<fp64>, svd::MatrixType<cplx>> svd::solver::do_svd_lapacke(const cplx *, long, long) const;
