#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <decomp/decompose.h>
#include <exception>
#include <latch>
#include <thread>
#include <vector>

// No logger is touched before the threads start, so the first calls below create them concurrently.

TEST_CASE("Concurrent decompositions", "[decomp][threads]") {
    constexpr size_t num_threads  = 16;
    auto             count_before = svd::solver::get_count();

    std::vector<Eigen::Tensor<double, 3>> tensors;
    for(size_t i = 0; i < num_threads; i++) tensors.emplace_back(tenx::TensorRandom<double>(3, 4, 3));

    std::vector<long>               svd_ranks(num_threads, -1);
    std::vector<long>               eig_ranks(num_threads, -1);
    std::vector<double>             svd_rec_err(num_threads, -1.0);
    std::vector<std::exception_ptr> errors(num_threads);
    std::vector<std::thread>        threads;
    std::latch                      start(num_threads);

    for(size_t i = 0; i < num_threads; i++) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            try {
                const auto &tensor = tensors[i];
                auto        res_svd = decomp::svd(tensor, tenx::array2{0, 2}, 1);
                svd_ranks[i]        = res_svd.S.size();

                auto grp = decomp::partition(tensor, tenx::array2{0, 2}, 1);
                Eigen::Tensor<double, 3> U = res_svd.U;
                Eigen::Tensor<double, 2> V = res_svd.V;
                Eigen::MatrixXd rec = tenx::MatrixMap(U, Eigen::Index{9}, res_svd.S.size()) * tenx::VectorMap(res_svd.S).asDiagonal() * tenx::MatrixMap(V);
                svd_rec_err[i]      = (rec - grp.matrix).norm();

                auto res_eig = decomp::eig(tensor, 0, 2);
                eig_ranks[i] = res_eig.S.size();
            } catch(...) { errors[i] = std::current_exception(); }
        });
    }
    for(auto &t : threads) t.join();

    for(size_t i = 0; i < num_threads; i++) {
        if(errors[i]) std::rethrow_exception(errors[i]);
        REQUIRE(svd_ranks[i] == 4);
        REQUIRE(svd_rec_err[i] < 1e-10);
        REQUIRE(eig_ranks[i] == 3);
    }
    REQUIRE(svd::solver::get_count() == count_before + static_cast<long long>(num_threads));
    REQUIRE(spdlog::get("svd") != nullptr);
    REQUIRE(spdlog::get("decomp") != nullptr);
}

int main(int argc, char *argv[]) { return Catch::Session().run(argc, argv); }
