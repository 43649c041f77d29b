#include "truncation.h"
#include "debug/exceptions.h"
#include "tools/common/log.h"
#include <algorithm>
#include <cmath>
#include <numeric>

std::vector<long> decomp::canonicalize_chis(const std::optional<std::vector<long>> &chis, double eps, long n) {
    std::vector<long> candidates;
    if(not chis or chis->empty()) {
        if(eps > 0) {
            candidates.resize(static_cast<size_t>(n + 1));
            std::iota(candidates.begin(), candidates.end(), 0l);
        } else {
            candidates = {n};
        }
        return candidates;
    }
    candidates = chis.value();
    for(auto &chi : candidates) {
        if(chi < 0) throw except::invalid_argument("canonicalize_chis: negative rank {} in {}", chi, candidates);
        chi = std::min(chi, n);
    }
    if(eps <= 0)
        candidates = {*std::max_element(candidates.begin(), candidates.end())};
    else
        std::sort(candidates.begin(), candidates.end());
    return candidates;
}

long decomp::adjust_for_degeneracy(long chi, const Eigen::VectorXd &m, double degeneracy_eps) {
    while(0 < chi and chi < m.size()) {
        double last_in  = m[chi - 1];
        double last_out = m[chi];
        double rel_diff = std::abs(last_in - last_out);
        double avg      = (last_in + last_out) / 2;
        if(avg != 0) rel_diff /= avg;
        if(rel_diff < degeneracy_eps)
            chi -= 1;
        else
            break;
    }
    return chi;
}

double decomp::truncation_error(long chi, const Eigen::VectorXd &m) {
    double sum_all_sq = m.squaredNorm();
    if(sum_all_sq == 0) return 0.0;
    chi                = std::clamp(chi, 0l, static_cast<long>(m.size()));
    double sum_disc_sq = m.tail(m.size() - chi).squaredNorm();
    return std::sqrt(sum_disc_sq / sum_all_sq);
}

decomp::truncation decomp::select_rank(const Eigen::VectorXd &m, double eps, const std::optional<std::vector<long>> &chis, bool break_degenerate,
                                       double degeneracy_eps) {
    if(not m.allFinite()) throw except::logic_error("select_rank: magnitudes are not finite");
    for(long i = 0; i < m.size(); i++) {
        if(m[i] < 0) throw except::logic_error("select_rank: negative magnitude {:.6e} at index {}", m[i], i);
        if(i > 0 and m[i] > m[i - 1])
            throw except::logic_error("select_rank: magnitudes are not sorted in descending order: m[{}] = {:.6e} < m[{}] = {:.6e}", i - 1, m[i - 1], i,
                                      m[i]);
    }

    auto       candidates = canonicalize_chis(chis, eps, m.size());
    truncation result;
    if(m.sum() == 0) {
        result.chi   = *std::min_element(candidates.begin(), candidates.end());
        result.error = 0;
    } else {
        for(auto chi : candidates) {
            if(not break_degenerate) chi = adjust_for_degeneracy(chi, m, degeneracy_eps);
            result.chi   = chi;
            result.error = truncation_error(chi, m);
            if(result.error < eps) break;
        }
    }
    tools::get_log()->debug("select_rank: n {} | eps {:.3e} | candidates {} | chi {} | error {:.6e}", m.size(), eps, candidates.size(), result.chi,
                            result.error);
    return result;
}
