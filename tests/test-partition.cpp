#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <decomp/partition.h>
#include <math/tenx.h>
#include <tools/common/log.h>

TEST_CASE("Flatten a tensor into a matrix", "[partition]") {
    SECTION("Permuted axis groups") {
        auto tensor = tenx::TensorRandom<double>(2, 3, 4);
        auto grp    = decomp::partition(tensor, tenx::array2{2, 0}, tenx::array1{1});
        REQUIRE(grp.perm == std::array<long, 3>{2, 0, 1});
        REQUIRE(grp.shape_a == std::array<long, 2>{4, 2});
        REQUIRE(grp.shape_b == std::array<long, 1>{3});
        REQUIRE(grp.dim_a == 8);
        REQUIRE(grp.dim_b == 3);
        REQUIRE(grp.matrix.rows() == 8);
        REQUIRE(grp.matrix.cols() == 3);
        // Column-major: the first axis of each group varies fastest
        for(long i = 0; i < 2; i++)
            for(long j = 0; j < 3; j++)
                for(long k = 0; k < 4; k++) REQUIRE(grp.matrix(k + 4 * i, j) == tensor(i, j, k));
    }
    SECTION("Identity permutation keeps the memory layout") {
        auto tensor = tenx::TensorRandom<std::complex<double>>(3, 2, 5);
        auto grp    = decomp::partition(tensor, tenx::array2{0, 1}, tenx::array1{2});
        auto map    = tenx::MatrixMap(tensor, 6, 5);
        REQUIRE(grp.matrix.isApprox(map));
    }
    SECTION("Bare axis indices") {
        auto tensor = tenx::TensorRandom<double>(2, 3, 4);
        auto grp    = decomp::partition(tensor, 1, tenx::array2{0, 2});
        REQUIRE(grp.shape_a == std::array<long, 1>{3});
        REQUIRE(grp.shape_b == std::array<long, 2>{2, 4});
        REQUIRE(grp.dim_a == 3);
        REQUIRE(grp.dim_b == 8);
        auto mat = decomp::partition(Eigen::Tensor<double, 2>(tensor.reshape(tenx::array2{6, 4})), 1, 0);
        REQUIRE(mat.dim_a == 4);
        REQUIRE(mat.dim_b == 6);
    }
}

TEST_CASE("Reject invalid axis groups", "[partition]") {
    auto tensor = tenx::TensorRandom<double>(2, 3, 4);
    SECTION("Repeated axis") { REQUIRE_THROWS_AS(decomp::partition(tensor, tenx::array2{0, 1}, tenx::array1{1}), except::invalid_argument); }
    SECTION("Axis out of range") {
        REQUIRE_THROWS_AS(decomp::partition(tensor, tenx::array2{0, 1}, tenx::array1{3}), except::invalid_argument);
        REQUIRE_THROWS_AS(decomp::partition(tensor, tenx::array2{-1, 1}, tenx::array1{2}), except::invalid_argument);
    }
    SECTION("Groups do not cover the tensor") {
        REQUIRE_THROWS_AS(decomp::partition(tensor, tenx::array1{0}, tenx::array1{1}), except::invalid_argument);
        REQUIRE_THROWS_AS(decomp::partition(tensor, tenx::array2{0, 1}, tenx::array2{2, 0}), except::invalid_argument);
    }
}

int main(int argc, char **argv) {
    tools::Logger::setLogLevel(tools::get_log(), 2ul);
    return Catch::Session().run(argc, argv);
}
