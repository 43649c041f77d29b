#pragma once

#include "enums.h"
#include <string>
#include <string_view>
class Loader;

/* clang-format off */

/*!
 *  \namespace settings
 *  This namespace contains global defaults for the decomposition front end, the svd and eig adapters and the console loggers.
 *  Values given explicitly in decomp::config, svd::config or eig::settings take precedence over these.
 */
namespace settings {
    extern void load(Loader &decomp_config);
    extern void load(std::string_view config_filename);

    [[nodiscard]] extern ::svd::config get_svd_config();

    /*!  \namespace settings::input Settings for initialization */
    namespace input{
        inline std::string config_filename                      = "input/input.cfg";            /*!< Default config filename. */
        inline std::string config_file_contents;
    }

    /*!  \namespace settings::console Settings for console output */
    namespace console {
        inline bool   timestamp     = false;                          /*!< Whether to put a timestamp on console outputs */
        inline size_t loglevel      = 2;                              /*!< Verbosity [0-6]. Level 0 prints everything, 6 nothing. Level 2 or 3 is recommended for normal use */
    }

    /*!  \namespace settings::decomp Defaults for decomp::svd and decomp::eig */
    namespace decomp {
        inline bool   break_degenerate    = false;                    /*!< Allow truncation to split a group of degenerate values */
        inline double degeneracy_eps      = 1e-6;                     /*!< Adjacent values whose relative difference is below this are degenerate */
    }

    /*!  \namespace settings::svd Defaults for svd::solver */
    namespace svd {
        inline ::svd::lib  svd_lib          = ::svd::lib::eigen;      /*!< Choose the SVD library {eigen, lapacke} */
        inline ::svd::rtn  svd_rtn          = ::svd::rtn::geauto;     /*!< Choose the SVD routine {gesvj, gejsv, gesvd, gesdd, geauto} */
        inline size_t      switchsize_gejsv = 1;                      /*!< Linear size of a matrix, below which SVD will use slower but more precise gesvj instead of gejsv */
        inline size_t      switchsize_gesvd = 32;                     /*!< Linear size of a matrix, below which SVD will use gejsv instead of gesvd */
        inline size_t      switchsize_gesdd = 64;                     /*!< Linear size of a matrix, below which SVD will use gesvd instead of gesdd */
        inline size_t      loglevel         = 2;                      /*!< Verbosity of the svd logger [0-6] */
    }

    /*!  \namespace settings::eig Defaults for eig::solver */
    namespace eig {
        inline ::eig::Lib  lib              = ::eig::Lib::EIGEN;      /*!< Choose the eigensolver library {EIGEN, LAPACKE} */
        inline size_t      loglevel         = 2;                      /*!< Verbosity of the eig logger [0-6] */
    }
}
/* clang-format on */
