#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <debug/exceptions.h>
#include <math/svd.h>
#include <tools/common/log.h>

namespace {
    template<typename Scalar>
    void check_svd(const svd::MatrixType<Scalar> &A, const svd::config &svd_cfg) {
        svd::solver svd_solver;
        auto [U, S, VT] = svd_solver.do_svd(A, svd_cfg);
        auto k          = std::min(A.rows(), A.cols());
        REQUIRE(U.rows() == A.rows());
        REQUIRE(U.cols() == k);
        REQUIRE(S.size() == k);
        REQUIRE(VT.rows() == k);
        REQUIRE(VT.cols() == A.cols());
        for(long i = 0; i < k; i++) {
            REQUIRE(S[i] >= 0);
            if(i > 0) REQUIRE(S[i] <= S[i - 1]);
        }
        svd::MatrixType<Scalar> A_rec = U * S.template cast<Scalar>().asDiagonal() * VT;
        REQUIRE(A_rec.isApprox(A, 1e-10));
    }
}

TEST_CASE("Singular value decomposition in Eigen", "[svd]") {
    SECTION("Jacobi on small matrices") {
        check_svd<double>(Eigen::MatrixXd::Random(6, 4), svd::config(svd::lib::eigen, svd::rtn::gejsv));
        check_svd<double>(Eigen::MatrixXd::Random(3, 7), svd::config(svd::lib::eigen, svd::rtn::gesvd));
        check_svd<std::complex<double>>(Eigen::MatrixXcd::Random(5, 5), svd::config(svd::lib::eigen, svd::rtn::gesvj));
    }
    SECTION("Divide and conquer on large matrices") {
        check_svd<double>(Eigen::MatrixXd::Random(90, 70), svd::config(svd::lib::eigen, svd::rtn::gesdd));
        check_svd<std::complex<double>>(Eigen::MatrixXcd::Random(70, 90), svd::config(svd::lib::eigen, svd::rtn::geauto));
    }
    SECTION("Rank deficient matrix") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(6, 2) * Eigen::MatrixXd::Random(2, 5);
        check_svd<double>(A, svd::config(svd::lib::eigen));
        auto [U, S, VT] = svd::solver().do_svd(A);
        REQUIRE(S[2] == Approx(0.0).margin(1e-12));
    }
    SECTION("Zero matrix") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Zero(4, 3);
        auto [U, S, VT]   = svd::solver().do_svd(A);
        REQUIRE(S.isZero());
    }
    SECTION("Rank-2 tensor") {
        Eigen::Tensor<std::complex<double>, 2> tensor = tenx::TensorRandom<std::complex<double>>(5, 3);
        auto [U, S, VT]                                = svd::solver().decompose(tensor);
        REQUIRE(U.dimensions() == tenx::array2{5, 3});
        REQUIRE(S.dimensions() == tenx::array1{3});
        REQUIRE(VT.dimensions() == tenx::array2{3, 3});
        Eigen::MatrixXcd rec = tenx::MatrixMap(U) * tenx::VectorMap(S).cast<std::complex<double>>().asDiagonal() * tenx::MatrixMap(VT);
        REQUIRE(rec.isApprox(tenx::MatrixMap(tensor), 1e-10));
    }
    SECTION("Invocation counter") {
        auto count_before = svd::solver::get_count();
        auto [U, S, VT]   = svd::solver().do_svd(Eigen::MatrixXd::Random(3, 3).eval());
        REQUIRE(svd::solver::get_count() == count_before + 1);
    }
}

TEST_CASE("Singular value decomposition failures", "[svd]") {
    svd::solver svd_solver;
    SECTION("Empty matrix") {
        Eigen::MatrixXd A(0, 3);
        REQUIRE_THROWS_AS(svd_solver.do_svd(A), except::invalid_argument);
    }
    SECTION("Non-finite input") {
        Eigen::MatrixXd A = Eigen::MatrixXd::Random(4, 4);
        A(1, 2)           = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(svd_solver.do_svd(A), except::convergence_error);
    }
}

TEST_CASE("Singular value decomposition in Lapacke", "[svd][lapacke]") {
    Eigen::MatrixXcd A = Eigen::MatrixXcd::Random(12, 9);
#if defined(TNDECOMP_LAPACKE_AVAILABLE)
    for(auto rtn : {svd::rtn::gesvj, svd::rtn::gejsv, svd::rtn::gesvd, svd::rtn::gesdd}) {
        INFO("routine " << enum2sv(rtn));
        check_svd<std::complex<double>>(A, svd::config(svd::lib::lapacke, rtn));
        check_svd<double>(A.real(), svd::config(svd::lib::lapacke, rtn));
    }
    auto S_eigen   = std::get<1>(svd::solver(svd::config(svd::lib::eigen)).do_svd(A));
    auto S_lapacke = std::get<1>(svd::solver(svd::config(svd::lib::lapacke)).do_svd(A));
    REQUIRE(S_eigen.isApprox(S_lapacke, 1e-12));
#else
    svd::solver svd_solver(svd::config(svd::lib::lapacke));
    REQUIRE_THROWS_AS(svd_solver.do_svd(A), except::logic_error);
#endif
}

int main(int argc, char **argv) {
    tools::Logger::setLogLevel(tools::get_log(), 2ul);
    return Catch::Session().run(argc, argv);
}
