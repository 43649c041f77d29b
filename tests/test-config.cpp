#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <config/loader.h>
#include <config/settings.h>
#include <decomp/config.h>
#include <tools/common/log.h>

namespace {
    void reset_settings() {
        settings::console::loglevel         = 2;
        settings::console::timestamp        = false;
        settings::decomp::break_degenerate  = false;
        settings::decomp::degeneracy_eps    = 1e-6;
        settings::svd::svd_lib              = svd::lib::eigen;
        settings::svd::svd_rtn              = svd::rtn::geauto;
        settings::svd::switchsize_gesdd     = 64;
        settings::eig::lib                  = eig::Lib::EIGEN;
    }
}

TEST_CASE("Parse enums from strings", "[config]") {
    REQUIRE(sv2enum<svd::lib>("lapacke") == svd::lib::lapacke);
    REQUIRE(sv2enum<svd::rtn>("gesdd") == svd::rtn::gesdd);
    REQUIRE(sv2enum<eig::Lib>("EIGEN") == eig::Lib::EIGEN);
    REQUIRE(enum2sv(sv2enum<svd::rtn>("gejsv")) == "gejsv");
    REQUIRE_THROWS_AS(sv2enum<svd::rtn>("gesvx"), except::invalid_argument);
}

TEST_CASE("Load settings from a config file", "[config]") {
    reset_settings();
    SECTION("Values found in the file replace the defaults") {
        settings::load(TEST_INPUT_DIR "/test.cfg");
        REQUIRE(settings::console::loglevel == 3);
        REQUIRE(settings::console::timestamp);
        REQUIRE(settings::decomp::break_degenerate);
        REQUIRE(settings::decomp::degeneracy_eps == Approx(1e-4));
        REQUIRE(settings::svd::svd_rtn == svd::rtn::gesvd);
        REQUIRE(settings::svd::switchsize_gesdd == 128);
        REQUIRE(settings::input::config_file_contents.find("decomp::break_degenerate") != std::string::npos);
        // Not in the file
        REQUIRE(settings::svd::switchsize_gesvd == 32);

        auto cfg = decomp::config();
        REQUIRE(cfg.break_degenerate);
        REQUIRE(cfg.degeneracy_eps == Approx(1e-4));
        auto svd_cfg = settings::get_svd_config();
        REQUIRE(svd_cfg.svd_rtn == svd::rtn::gesvd);
        REQUIRE(svd_cfg.switchsize_gesdd == 128ul);
        REQUIRE(tools::Logger::getLogLevel(tools::get_log()) == 3);
    }
    SECTION("Keys are case insensitive and comments are stripped") {
        Loader cfg_file(TEST_INPUT_DIR "/test.cfg");
        cfg_file.load();
        double eps = 0;
        cfg_file.load_parameter("DECOMP::Degeneracy_Eps", eps);
        REQUIRE(eps == Approx(1e-4));
        size_t switchsize = 0;
        cfg_file.load_parameter("svd::switchsize_gesdd", switchsize);
        REQUIRE(switchsize == 128);
        std::string missing = "unchanged";
        cfg_file.load_parameter("svd::not_a_key", missing);
        REQUIRE(missing == "unchanged");
    }
    SECTION("Bytes outside of ASCII in keys and comments") {
        Loader cfg_file(TEST_INPUT_DIR "/non-ascii.cfg");
        cfg_file.load();
        std::string mode;
        cfg_file.load_parameter("CAF\xe9::mode", mode);
        REQUIRE(mode == "Slow");
        size_t switchsize = 0;
        cfg_file.load_parameter("SVD::switchsize_gejsv", switchsize);
        REQUIRE(switchsize == 48);
    }
    SECTION("Unknown enum strings") { REQUIRE_THROWS_AS(settings::load(TEST_INPUT_DIR "/bad-enum.cfg"), except::invalid_argument); }
    SECTION("Missing files") {
        REQUIRE_THROWS_AS(settings::load(TEST_INPUT_DIR "/missing.cfg"), except::runtime_error);
        Loader missing(TEST_INPUT_DIR "/missing.cfg");
        REQUIRE_FALSE(missing.file_exists);
        REQUIRE_THROWS_AS(missing.load(), except::file_error);
    }
    reset_settings();
    tools::Logger::setLogLevel(tools::get_log(), settings::console::loglevel);
}

TEST_CASE("Describe a decomposition config", "[config]") {
    reset_settings();
    REQUIRE(decomp::config().to_string().empty());
    auto cfg           = decomp::config(std::vector<long>{4, 8}, 1e-8);
    cfg.hermitian      = true;
    cfg.svd_cfg        = svd::config(svd::lib::eigen, svd::rtn::gesdd);
    auto msg           = cfg.to_string();
    REQUIRE(msg.find("chis [4, 8]") != std::string::npos);
    REQUIRE(msg.find("hermitian") != std::string::npos);
    REQUIRE(msg.find("svd_rtn gesdd") != std::string::npos);
}

TEST_CASE("Named loggers", "[config]") {
    auto logger = tools::Logger::setLogger("test-config", 4ul, true);
    REQUIRE(logger->name() == "test-config");
    REQUIRE(tools::Logger::getLogLevel(logger) == 4);
    tools::Logger::setLogLevel(logger, 1ul);
    REQUIRE(tools::Logger::getLogLevel(logger) == 1);
    REQUIRE(tools::Logger::getLogger("test-config") == logger);
    REQUIRE_THROWS_AS(tools::Logger::setLogLevel(logger, 7ul), except::runtime_error);
}

int main(int argc, char **argv) {
    tools::Logger::setLogLevel(tools::get_log(), 2ul);
    return Catch::Session().run(argc, argv);
}
