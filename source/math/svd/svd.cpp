#include "math/svd.h"
#include "debug/exceptions.h"
#include <mutex>

std::atomic<long long> svd::solver::count = 0;

svd::solver::solver() { setLogLevel(2); }

svd::config::config(svd::lib svd_lib_) : svd_lib(svd_lib_) {}

svd::config::config(svd::lib svd_lib_, svd::rtn svd_rtn_) : svd_lib(svd_lib_), svd_rtn(svd_rtn_) {}

std::string svd::config::to_string() const {
    /* clang-format off */
    std::string msg;
    if (switchsize_gejsv) msg.append(fmt::format(" | switchsize_gejsv {}", switchsize_gejsv.value()));
    if (switchsize_gesvd) msg.append(fmt::format(" | switchsize_gesvd {}", switchsize_gesvd.value()));
    if (switchsize_gesdd) msg.append(fmt::format(" | switchsize_gesdd {}", switchsize_gesdd.value()));
    if (loglevel) msg.append(fmt::format(" | loglevel {}", loglevel.value()));
    if (svd_lib) msg.append(fmt::format(" | svd_lib {}", enum2sv(svd_lib.value())));
    if (svd_rtn) msg.append(fmt::format(" | svd_rtn {}", enum2sv(svd_rtn.value())));
    return msg.empty() ? msg : "svd settings" + msg;
    /* clang-format on */
}

void svd::solver::copy_config(const svd::config &svd_cfg) {
    if(svd_cfg.switchsize_gejsv) switchsize_gejsv = svd_cfg.switchsize_gejsv.value();
    if(svd_cfg.switchsize_gesvd) switchsize_gesvd = svd_cfg.switchsize_gesvd.value();
    if(svd_cfg.switchsize_gesdd) switchsize_gesdd = svd_cfg.switchsize_gesdd.value();
    if(svd_cfg.loglevel) setLogLevel(svd_cfg.loglevel.value());
    if(svd_cfg.svd_lib) svd_lib = svd_cfg.svd_lib.value();
    if(svd_cfg.svd_rtn) svd_rtn = svd_cfg.svd_rtn.value();
}

svd::solver::solver(const svd::config &svd_cfg) : solver() { copy_config(svd_cfg); }

svd::solver::solver(std::optional<svd::config> svd_cfg) : solver() {
    if(svd_cfg) copy_config(svd_cfg.value());
}

void svd::solver::set_config(const svd::config &svd_cfg) { copy_config(svd_cfg); }

void svd::solver::set_config(std::optional<svd::config> svd_cfg) {
    if(svd_cfg) copy_config(svd_cfg.value());
}

void svd::solver::setLogLevel(size_t logLevel) {
    static std::once_flag log_created;
    std::call_once(log_created, [] {
        log = spdlog::get("svd");
        if(!log) {
            log = spdlog::stdout_color_mt("svd", spdlog::color_mode::always);
            log->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n]%^[%=8l]%$ %v");
        }
    });
    if(static_cast<spdlog::level::level_enum>(logLevel) != log->level()) log->set_level(static_cast<spdlog::level::level_enum>(logLevel));
}

long long svd::solver::get_count() { return count.load(); }

/*! \brief Performs SVD on a matrix
 *  This function is defined in cpp to avoid long compilation times when having Eigen::BDCSVD included everywhere in headers.
 *   \param mat_ptr Pointer to the matrix. Supported are double * and std::complex<double> *
 *   \param rows Rows of the matrix
 *   \param cols Columns of the matrix
 *   \param svd_cfg Optional overrides to default svd configuration
 *   \return The U, S, and VT matrices (with S as a vector), untruncated.
 */
template<typename Scalar>
std::tuple<svd::MatrixType<Scalar>, svd::VectorType<fp64>, svd::MatrixType<Scalar>> svd::solver::do_svd_ptr(const Scalar *mat_ptr, long rows, long cols,
                                                                                                            const svd::config &svd_cfg) {
    copy_config(svd_cfg);
    if(rows <= 0) throw except::invalid_argument("SVD error: rows = {}", rows);
    if(cols <= 0) throw except::invalid_argument("SVD error: cols = {}", cols);
    auto sizeS = std::min(rows, cols);

    // Resolve geauto locally, so that the next call with a different size gets resolved again
    auto rtn_resolved = svd_rtn;
    if(rtn_resolved == svd::rtn::geauto) {
        rtn_resolved = svd::rtn::gesvj;
        if(switchsize_gejsv != -1ul and std::cmp_greater_equal(sizeS, switchsize_gejsv)) rtn_resolved = svd::rtn::gejsv;
        if(switchsize_gesvd != -1ul and std::cmp_greater_equal(sizeS, switchsize_gesvd)) rtn_resolved = svd::rtn::gesvd;
        if(switchsize_gesdd != -1ul and std::cmp_greater_equal(sizeS, switchsize_gesdd)) rtn_resolved = svd::rtn::gesdd;
    }
    auto rtn_backup = svd_rtn;
    svd_rtn         = rtn_resolved;
    count++;
    svd::log->trace("SVD #{} | {} x {} | lib {} | rtn {}", count.load(), rows, cols, enum2sv(svd_lib), enum2sv(svd_rtn));

    std::tuple<MatrixType<Scalar>, VectorType<fp64>, MatrixType<Scalar>> usv;
    try {
        switch(svd_lib) {
            case svd::lib::lapacke: {
#if defined(TNDECOMP_LAPACKE_AVAILABLE)
                usv = do_svd_lapacke(mat_ptr, rows, cols);
                break;
#else
                throw except::logic_error("svd::lib::lapacke requested but this build has no LAPACKE support");
#endif
            }
            case svd::lib::eigen: {
                usv = do_svd_eigen(mat_ptr, rows, cols);
                break;
            }
            default: throw except::logic_error("Unrecognized svd library");
        }
    } catch(const std::exception &ex) {
        svd_rtn = rtn_backup;
        svd::log->error("{} {} failed to perform SVD: {}", enum2sv(svd_lib), enum2sv(rtn_resolved), ex.what());
        throw;
    }
    svd_rtn = rtn_backup;
    return usv;
}

using real = double;
using cplx = std::complex<double>;

//! \relates svd::solver
//! \brief force instantiation of do_svd_ptr for type 'double'
template std::tuple<svd::MatrixType<real>, svd::VectorType<fp64>, svd::MatrixType<real>> svd::solver::do_svd_ptr(const real *, long, long, const svd::config &);

//! \relates svd::solver
//! \brief force instantiation of do_svd_ptr for type 'std::complex<double>'
template std::tuple<svd::MatrixType<cplx>, svd::VectorType<fp64>, svd::MatrixType<cplx>> svd::solver::do_svd_ptr(const cplx *, long, long, const svd::config &);

template<typename Scalar>
void svd::solver::print_matrix([[maybe_unused]] const Scalar *mat_ptr, [[maybe_unused]] long rows, [[maybe_unused]] long cols,
                               [[maybe_unused]] std::string_view tag, [[maybe_unused]] long dec) const {
#if !defined(NDEBUG)
    auto A = Eigen::Map<const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>>(mat_ptr, rows, cols);
    log->warn("Matrix [{}] with dimensions {}x{}\n", tag, rows, cols);
    for(long r = 0; r < A.rows(); r++) {
        if constexpr(std::is_same_v<Scalar, std::complex<double>>)
            for(long c = 0; c < A.cols(); c++) fmt::print("({1:.{0}f},{2:+.{0}f}) ", dec, std::real(A(r, c)), std::imag(A(r, c)));
        else
            for(long c = 0; c < A.cols(); c++) fmt::print("{1:.{0}f} ", dec, A(r, c));
        fmt::print("\n");
    }
#endif
}

template void svd::solver::print_matrix<real>(const real *mat_ptr, long rows, long cols, std::string_view tag, long dec) const;
template void svd::solver::print_matrix<cplx>(const cplx *mat_ptr, long rows, long cols, std::string_view tag, long dec) const;
