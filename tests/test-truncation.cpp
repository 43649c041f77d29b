#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <debug/exceptions.h>
#include <decomp/truncation.h>
#include <tools/common/log.h>

namespace {
    Eigen::VectorXd values(std::initializer_list<double> list) {
        Eigen::VectorXd m(static_cast<long>(list.size()));
        std::copy(list.begin(), list.end(), m.data());
        return m;
    }
}

TEST_CASE("Canonical candidate ranks", "[truncation]") {
    using chis_t = std::optional<std::vector<long>>;
    SECTION("No candidates") {
        REQUIRE(decomp::canonicalize_chis(std::nullopt, 1e-3, 3) == std::vector<long>{0, 1, 2, 3});
        REQUIRE(decomp::canonicalize_chis(std::nullopt, 0, 3) == std::vector<long>{3});
        REQUIRE(decomp::canonicalize_chis(chis_t{std::vector<long>{}}, 0, 4) == std::vector<long>{4});
    }
    SECTION("Given candidates") {
        REQUIRE(decomp::canonicalize_chis(chis_t{std::vector<long>{5, 1, 2}}, 1e-3, 3) == std::vector<long>{1, 2, 3});
        REQUIRE(decomp::canonicalize_chis(chis_t{std::vector<long>{2, 5}}, 0, 6) == std::vector<long>{5});
        REQUIRE(decomp::canonicalize_chis(chis_t{std::vector<long>{2, 5}}, -1, 6) == std::vector<long>{5});
        REQUIRE(decomp::canonicalize_chis(chis_t{std::vector<long>{4}}, 0.5, 6) == std::vector<long>{4});
    }
    SECTION("Negative candidates") { REQUIRE_THROWS_AS(decomp::canonicalize_chis(chis_t{std::vector<long>{2, -1}}, 0, 6), except::invalid_argument); }
}

TEST_CASE("Degeneracy guard", "[truncation]") {
    auto m = values({3, 2, 2, 2, 1});
    REQUIRE(decomp::adjust_for_degeneracy(3, m, 1e-6) == 1);
    REQUIRE(decomp::adjust_for_degeneracy(2, m, 1e-6) == 1);
    REQUIRE(decomp::adjust_for_degeneracy(4, m, 1e-6) == 4);
    REQUIRE(decomp::adjust_for_degeneracy(0, m, 1e-6) == 0);
    REQUIRE(decomp::adjust_for_degeneracy(5, m, 1e-6) == 5);
    // A loose threshold joins 3 and 2 as well
    REQUIRE(decomp::adjust_for_degeneracy(3, m, 0.5) == 0);
    // Zero average falls back to the plain difference
    REQUIRE(decomp::adjust_for_degeneracy(2, values({1, 0, 0}), 1e-6) == 1);
}

TEST_CASE("Relative truncation error", "[truncation]") {
    auto m = values({4, 3});
    REQUIRE(decomp::truncation_error(0, m) == Approx(1.0));
    REQUIRE(decomp::truncation_error(1, m) == Approx(0.6));
    REQUIRE(decomp::truncation_error(2, m) == 0.0);
    REQUIRE(decomp::truncation_error(1, values({0, 0, 0})) == 0.0);

    auto s = values({5, 4, 3, 2, 1, 0.5, 0.1});
    for(long chi = 1; chi <= s.size(); chi++) REQUIRE(decomp::truncation_error(chi, s) <= decomp::truncation_error(chi - 1, s));
}

TEST_CASE("Rank selection", "[truncation]") {
    SECTION("Smallest rank within eps skips the degenerate pair") {
        auto trunc = decomp::select_rank(values({10, 10, 1, 0.1}), 0.05, std::nullopt, false, 1e-6);
        REQUIRE(trunc.chi == 3);
        REQUIRE(trunc.error == Approx(std::sqrt(0.01 / 201.01)));
    }
    SECTION("All zeros") {
        auto trunc = decomp::select_rank(Eigen::VectorXd::Zero(5), 0.1, std::vector<long>{3, 2}, false, 1e-6);
        REQUIRE(trunc.chi == 2);
        REQUIRE(trunc.error == 0.0);
        REQUIRE(decomp::select_rank(Eigen::VectorXd::Zero(5), 0.1, std::nullopt, false, 1e-6).chi == 0);
        REQUIRE(decomp::select_rank(Eigen::VectorXd::Zero(5), 0, std::nullopt, false, 1e-6).chi == 5);
    }
    SECTION("Exact mode keeps the largest candidate") {
        auto trunc = decomp::select_rank(values({6, 5, 4, 3, 2, 1}), 0, std::vector<long>{2, 5}, false, 1e-6);
        REQUIRE(trunc.chi == 5);
        REQUIRE(trunc.error == Approx(1.0 / std::sqrt(91.0)));
    }
    SECTION("No candidate reaches eps") {
        auto trunc = decomp::select_rank(values({6, 5, 4, 3, 2, 1}), 1e-3, std::vector<long>{1, 2}, false, 1e-6);
        REQUIRE(trunc.chi == 2);
        REQUIRE(trunc.error == Approx(std::sqrt(30.0 / 91.0)));
    }
    SECTION("Breaking degeneracies") {
        auto m = values({10, 10, 1, 0.1});
        REQUIRE(decomp::select_rank(m, 0, std::vector<long>{1}, false, 1e-6).chi == 0);
        REQUIRE(decomp::select_rank(m, 0, std::vector<long>{1}, true, 1e-6).chi == 1);
        REQUIRE(decomp::select_rank(m, 0.05, std::nullopt, false, 1e-6).chi == 3);
        REQUIRE(decomp::select_rank(m, 0.75, std::nullopt, true, 1e-6).chi == 1);
        REQUIRE(decomp::select_rank(m, 0.75, std::nullopt, false, 1e-6).chi == 2);
    }
    SECTION("Chosen rank never exceeds the sequence") {
        auto trunc = decomp::select_rank(values({3, 2, 1}), 0, std::vector<long>{10}, false, 1e-6);
        REQUIRE(trunc.chi == 3);
        REQUIRE(trunc.error == 0.0);
    }
    SECTION("Unsorted magnitudes") {
        REQUIRE_THROWS_AS(decomp::select_rank(values({1, 2, 3}), 0, std::nullopt, false, 1e-6), except::logic_error);
        REQUIRE_THROWS_AS(decomp::select_rank(values({1, -2}), 0, std::nullopt, false, 1e-6), except::logic_error);
    }
}

int main(int argc, char **argv) {
    tools::Logger::setLogLevel(tools::get_log(), 2ul);
    return Catch::Session().run(argc, argv);
}
