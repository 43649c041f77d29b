#include "debug/exceptions.h"
#include "log.h"
#include "solver.h"
#include <Eigen/Eigenvalues>

namespace eig {
    template<typename Scalar>
    using MatrixType = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
}

template<typename Scalar>
int eig::solver::eigen_selfadjoint(const Scalar *matrix, size_type L) {
    eig::log->trace("Starting eig SelfAdjointEigenSolver");
    auto A = Eigen::Map<const MatrixType<Scalar>>(matrix, L, L);
    if(not A.allFinite()) throw except::convergence_error("SelfAdjointEigenSolver error: matrix has inf's or nan's");

    int  options = config.compute_eigvecs == Vecs::ON ? Eigen::ComputeEigenvectors : Eigen::EigenvaluesOnly;
    auto es      = Eigen::SelfAdjointEigenSolver<MatrixType<Scalar>>(A, options);
    if(es.info() != Eigen::Success) throw except::convergence_error("SelfAdjointEigenSolver error: could not converge | {} x {}", L, L);

    auto &eigvals = result.get_eigvals<Form::SYMM>();
    eigvals.assign(es.eigenvalues().data(), es.eigenvalues().data() + L);
    if(config.compute_eigvecs == Vecs::ON) {
        auto &eigvecs = result.get_eigvecs<Scalar>();
        eigvecs.assign(es.eigenvectors().data(), es.eigenvectors().data() + L * L);
        result.meta.eigvecsR_found = true;
    }
    result.meta.eigvals_found = true;
    result.meta.form          = Form::SYMM;
    result.meta.type          = std::is_same_v<Scalar, real> ? Type::REAL : Type::CPLX;
    return 0;
}

template int eig::solver::eigen_selfadjoint(const real *matrix, size_type L);
template int eig::solver::eigen_selfadjoint(const cplx *matrix, size_type L);

template<typename Scalar>
int eig::solver::eigen_general(const Scalar *matrix, size_type L) {
    auto A = Eigen::Map<const MatrixType<Scalar>>(matrix, L, L);
    if(not A.allFinite()) throw except::convergence_error("General eigensolver error: matrix has inf's or nan's");
    bool compute_eigvecs = config.compute_eigvecs == Vecs::ON;

    Eigen::Matrix<cplx, Eigen::Dynamic, 1>              evals;
    Eigen::Matrix<cplx, Eigen::Dynamic, Eigen::Dynamic> evecs;
    if constexpr(std::is_same_v<Scalar, real>) {
        eig::log->trace("Starting eig EigenSolver");
        auto es = Eigen::EigenSolver<MatrixType<real>>(A, compute_eigvecs);
        if(es.info() != Eigen::Success) throw except::convergence_error("EigenSolver error: could not converge | {} x {}", L, L);
        evals = es.eigenvalues();
        if(compute_eigvecs) evecs = es.eigenvectors();
    } else {
        eig::log->trace("Starting eig ComplexEigenSolver");
        auto es = Eigen::ComplexEigenSolver<MatrixType<cplx>>(A, compute_eigvecs);
        if(es.info() != Eigen::Success) throw except::convergence_error("ComplexEigenSolver error: could not converge | {} x {}", L, L);
        evals = es.eigenvalues();
        if(compute_eigvecs) evecs = es.eigenvectors();
    }
    if(not evals.allFinite() or not evecs.allFinite())
        throw except::convergence_error("General eigensolver error: result has inf's or nan's | {} x {}", L, L);

    auto &eigvals = result.get_eigvals<Form::NSYM>();
    eigvals.assign(evals.data(), evals.data() + L);
    if(compute_eigvecs) {
        auto &eigvecs = result.get_eigvecs<cplx>();
        eigvecs.assign(evecs.data(), evecs.data() + L * L);
        result.meta.eigvecsR_found = true;
    }
    result.meta.eigvals_found = true;
    result.meta.form          = Form::NSYM;
    result.meta.type          = std::is_same_v<Scalar, real> ? Type::REAL : Type::CPLX;
    return 0;
}

template int eig::solver::eigen_general(const real *matrix, size_type L);
template int eig::solver::eigen_general(const cplx *matrix, size_type L);
