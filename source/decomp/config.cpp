#include "config.h"
#include "io/fmt.h"

decomp::config::config(long chi, double eps_) : chis(std::vector<long>{chi}), eps(eps_) {}

decomp::config::config(std::vector<long> chis_, double eps_) : chis(std::move(chis_)), eps(eps_) {}

std::string decomp::config::to_string() const {
    /* clang-format off */
    std::string msg;
    if(chis)                                                 msg.append(fmt::format(" | chis {}", chis.value()));
    if(eps > 0)                                              msg.append(fmt::format(" | eps {:.3e}", eps));
    if(return_rel_err)                                       msg.append(" | return_rel_err");
    if(break_degenerate)                                     msg.append(" | break_degenerate");
    if(degeneracy_eps != settings::decomp::degeneracy_eps)   msg.append(fmt::format(" | degeneracy_eps {:.3e}", degeneracy_eps));
    if(hermitian)                                            msg.append(" | hermitian");
    if(svd_cfg)                                              msg.append(fmt::format(" | {}", svd_cfg->to_string()));
    if(eig_cfg)                                              msg.append(fmt::format(" | {}", eig_cfg->to_string()));
    return msg.empty() ? msg : "decomp settings" + msg;
    /* clang-format on */
}
