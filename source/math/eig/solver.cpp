#include "solver.h"
#include "debug/exceptions.h"
#include "log.h"

eig::solver::solver() {
    if(config.loglevel)
        eig::setLevel(config.loglevel.value());
    else
        eig::setLevel(2ul);
    eig::setTimeStamp();
}

eig::solver::solver(const eig::settings &config_) : eig::solver::solver() {
    config = config_;
    if(config.loglevel) eig::setLevel(config.loglevel.value());
}

void eig::solver::eig_init(Form form, Type type, Vecs compute_eigvecs) {
    eig::log->trace("eig init");
    result.reset();
    config.compute_eigvecs = config.compute_eigvecs.value_or(compute_eigvecs);
    config.type            = type;
    config.form            = form;
    config.lib             = config.lib.value_or(Lib::EIGEN);
}

template<eig::Form form, typename Scalar>
void eig::solver::eig(const Scalar *matrix, size_type L, Vecs compute_eigvecs_) {
    if(L <= 0) throw except::invalid_argument("eig: matrix dimension must be positive. Got L = {}", L);
    int info = 0;
    if constexpr(std::is_same_v<Scalar, real>)
        eig_init(form, Type::REAL, compute_eigvecs_);
    else if constexpr(std::is_same_v<Scalar, cplx>)
        eig_init(form, Type::CPLX, compute_eigvecs_);
    else
        static_assert(std::is_same_v<Scalar, real> or std::is_same_v<Scalar, cplx>, "eig: unsupported scalar type");

    eig::log->trace("eig {} x {} | {}", L, L, config.to_string());
    try {
        switch(config.lib.value()) {
            case Lib::EIGEN: {
                if constexpr(form == Form::SYMM) {
                    if(config.tag.empty()) config.tag = "SelfAdjointEigenSolver";
                    info = eigen_selfadjoint(matrix, L);
                } else if constexpr(form == Form::NSYM) {
                    if(config.tag.empty()) config.tag = "EigenSolver";
                    info = eigen_general(matrix, L);
                }
                break;
            }
            case Lib::LAPACKE: {
#if defined(TNDECOMP_LAPACKE_AVAILABLE)
                if constexpr(std::is_same_v<Scalar, real>) {
                    if constexpr(form == Form::SYMM) {
                        if(config.tag.empty()) config.tag = "dsyevd";
                        info = dsyevd(matrix, L);
                    } else if constexpr(form == Form::NSYM) {
                        if(config.tag.empty()) config.tag = "dgeev";
                        info = dgeev(matrix, L);
                    }
                } else if constexpr(std::is_same_v<Scalar, cplx>) {
                    if constexpr(form == Form::SYMM) {
                        if(config.tag.empty()) config.tag = "zheevd";
                        info = zheevd(matrix, L);
                    } else if constexpr(form == Form::NSYM) {
                        if(config.tag.empty()) config.tag = "zgeev";
                        info = zgeev(matrix, L);
                    }
                }
                break;
#else
                throw except::logic_error("eig::Lib::LAPACKE requested but this build has no LAPACKE support");
#endif
            }
            default: throw except::logic_error("Unrecognized eig library");
        }
    } catch(const except::convergence_error &ex) {
        eig::log->error("Eigenvalue solver {} failed: {}", config.tag, ex.what());
        throw;
    }
    result.meta.tag = config.tag;
    eig::log->trace("eig {} finished with info {}", config.tag, info);
}

template void eig::solver::eig<eig::Form::SYMM>(const real *matrix, size_type, Vecs);
template void eig::solver::eig<eig::Form::NSYM>(const real *matrix, size_type, Vecs);
template void eig::solver::eig<eig::Form::SYMM>(const cplx *matrix, size_type, Vecs);
template void eig::solver::eig<eig::Form::NSYM>(const cplx *matrix, size_type, Vecs);
