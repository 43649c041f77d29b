#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <debug/exceptions.h>
#include <Eigen/Core>
#include <math/eig/solver.h>
#include <tools/common/log.h>

namespace {
    // Largest residual |A v - lambda v| over all eigenpairs
    template<typename Scalar>
    double max_residual(const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &A, const eig::solution &result) {
        auto   L       = A.rows();
        auto  &eigvals = result.get_eigvals<eig::cplx>();
        auto  &eigvecs = result.get_eigvecs<eig::cplx>();
        auto   V       = Eigen::Map<const Eigen::MatrixXcd>(eigvecs.data(), L, L);
        double res     = 0;
        for(long i = 0; i < L; i++) {
            Eigen::VectorXcd v = V.col(i);
            res                = std::max(res, (A.template cast<eig::cplx>() * v - eigvals[static_cast<size_t>(i)] * v).norm());
        }
        return res;
    }
}

TEST_CASE("Full diagonalization with Eigen", "[eig]") {
    SECTION("Real symmetric") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(6, 6);
        A                 = (A + A.transpose()).eval();
        eig::solver solver;
        solver.eig<eig::Form::SYMM>(A.data(), A.rows());
        REQUIRE(solver.result.meta.eigvals_found);
        REQUIRE(solver.result.meta.eigvecsR_found);
        REQUIRE(solver.result.meta.type == eig::Type::REAL);
        REQUIRE(solver.result.eigvals_are_real());
        REQUIRE(solver.result.get_eigvals<eig::real>().size() == 6);
        REQUIRE(max_residual(A, solver.result) < 1e-10);
    }
    SECTION("Complex hermitian") {
        Eigen::MatrixXcd A = Eigen::MatrixXcd::Random(5, 5);
        A                  = (A + A.adjoint()).eval();
        eig::solver solver;
        solver.eig<eig::Form::SYMM>(A.data(), A.rows());
        REQUIRE(solver.result.eigvals_are_real());
        REQUIRE(max_residual(A, solver.result) < 1e-10);
    }
    SECTION("Real general") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(7, 7);
        eig::solver     solver;
        solver.eig<eig::Form::NSYM>(A.data(), A.rows());
        REQUIRE(solver.result.meta.form == eig::Form::NSYM);
        REQUIRE(solver.result.get_eigvals<eig::cplx>().size() == 7);
        REQUIRE(max_residual(A, solver.result) < 1e-10);
    }
    SECTION("Complex general") {
        Eigen::MatrixXcd A = Eigen::MatrixXcd::Random(6, 6);
        eig::solver      solver;
        solver.eig<eig::Form::NSYM>(A.data(), A.rows());
        REQUIRE(max_residual(A, solver.result) < 1e-10);
    }
    SECTION("Eigenvalues only") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(4, 4);
        eig::solver     solver;
        solver.eig<eig::Form::NSYM>(A.data(), A.rows(), eig::Vecs::OFF);
        REQUIRE(solver.result.meta.eigvals_found);
        REQUIRE_FALSE(solver.result.meta.eigvecsR_found);
    }
}

TEST_CASE("Full diagonalization failures", "[eig]") {
    eig::solver solver;
    SECTION("Empty matrix") {
        Eigen::MatrixXd A(0, 0);
        REQUIRE_THROWS_AS(solver.eig<eig::Form::SYMM>(A.data(), A.rows()), except::invalid_argument);
    }
    SECTION("Non-finite input") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Identity(3, 3);
        A(0, 1)           = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(solver.eig<eig::Form::NSYM>(A.data(), A.rows()), except::convergence_error);
    }
}

TEST_CASE("Full diagonalization with Lapacke", "[eig][lapacke]") {
    Eigen::MatrixXd A = Eigen::MatrixXd::Random(6, 6);
    eig::settings   config;
    config.lib = eig::Lib::LAPACKE;
#if defined(TNDECOMP_LAPACKE_AVAILABLE)
    SECTION("dsyevd") {
        Eigen::MatrixXd H = A + A.transpose();
        eig::solver     solver(config);
        solver.eig<eig::Form::SYMM>(H.data(), H.rows());
        REQUIRE(max_residual(H, solver.result) < 1e-10);
    }
    SECTION("dgeev") {
        eig::solver solver(config);
        solver.eig<eig::Form::NSYM>(A.data(), A.rows());
        REQUIRE(max_residual(A, solver.result) < 1e-10);
    }
    SECTION("zheevd and zgeev") {
        Eigen::MatrixXcd Z = Eigen::MatrixXcd::Random(5, 5);
        Eigen::MatrixXcd H = Z + Z.adjoint();
        eig::solver      solver(config);
        solver.eig<eig::Form::SYMM>(H.data(), H.rows());
        REQUIRE(max_residual(H, solver.result) < 1e-10);
        solver.eig<eig::Form::NSYM>(Z.data(), Z.rows());
        REQUIRE(max_residual(Z, solver.result) < 1e-10);
    }
#else
    eig::solver solver(config);
    REQUIRE_THROWS_AS(solver.eig<eig::Form::NSYM>(A.data(), A.rows()), except::logic_error);
#endif
}

int main(int argc, char **argv) {
    tools::Logger::setLogLevel(tools::get_log(), 2ul);
    return Catch::Session().run(argc, argv);
}
