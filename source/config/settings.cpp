#include "settings.h"
#include "debug/exceptions.h"
#include "loader.h"

::svd::config settings::get_svd_config() {
    auto svd_cfg             = ::svd::config(settings::svd::svd_lib, settings::svd::svd_rtn);
    svd_cfg.switchsize_gejsv = settings::svd::switchsize_gejsv;
    svd_cfg.switchsize_gesvd = settings::svd::switchsize_gesvd;
    svd_cfg.switchsize_gesdd = settings::svd::switchsize_gesdd;
    svd_cfg.loglevel         = settings::svd::loglevel;
    return svd_cfg;
}

void settings::load(Loader &decomp_config) {
    if(not decomp_config.file_exists) throw except::runtime_error("Could not load config [{}]: File does not exist", decomp_config.file_path.string());
    decomp_config.load();
    input::config_filename      = decomp_config.file_path.string();
    input::config_file_contents = decomp_config.get_config_file_as_string();
    /* clang-format off */
    decomp_config.load_parameter("console::timestamp"                           , console::timestamp);
    decomp_config.load_parameter("console::loglevel"                            , console::loglevel);

    decomp_config.load_parameter("decomp::break_degenerate"                     , decomp::break_degenerate);
    decomp_config.load_parameter("decomp::degeneracy_eps"                       , decomp::degeneracy_eps);

    decomp_config.load_parameter("svd::svd_lib"                                 , svd::svd_lib);
    decomp_config.load_parameter("svd::svd_rtn"                                 , svd::svd_rtn);
    decomp_config.load_parameter("svd::switchsize_gejsv"                        , svd::switchsize_gejsv);
    decomp_config.load_parameter("svd::switchsize_gesvd"                        , svd::switchsize_gesvd);
    decomp_config.load_parameter("svd::switchsize_gesdd"                        , svd::switchsize_gesdd);
    decomp_config.load_parameter("svd::loglevel"                                , svd::loglevel);

    decomp_config.load_parameter("eig::lib"                                     , eig::lib);
    decomp_config.load_parameter("eig::loglevel"                                , eig::loglevel);
    /* clang-format on */

    // Apply the console settings to a logger that may already exist
    if(tools::log) {
        tools::Logger::setLogLevel(tools::log, console::loglevel);
        if(console::timestamp)
            tools::Logger::enableTimestamp(tools::log);
        else
            tools::Logger::disableTimestamp(tools::log);
    }
}

void settings::load(std::string_view config_filename) {
    Loader indata(config_filename);
    settings::load(indata);
}
