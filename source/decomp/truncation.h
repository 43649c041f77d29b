#pragma once
#include <Eigen/Core>
#include <optional>
#include <vector>

namespace decomp {
    /*! The rank chosen for a decomposition and the relative error of discarding the rest */
    struct truncation {
        long   chi   = 0;
        double error = 0;
    };

    /*! \brief Brings the candidate ranks to canonical form for a value sequence of length n.
     *  No candidates (or an empty list) means every rank in [0,n] when eps > 0, and {n} otherwise.
     *  Candidates above n are clamped to n. With eps <= 0 only the largest candidate remains, otherwise they are sorted ascending.
     *  Throws except::invalid_argument on negative candidates.
     */
    [[nodiscard]] extern std::vector<long> canonicalize_chis(const std::optional<std::vector<long>> &chis, double eps, long n);

    /*! \brief Shrinks chi until the values at chi-1 and chi are not degenerate, i.e. while 0 < chi < n and
     *  |m[chi-1] - m[chi]| / ((m[chi-1] + m[chi])/2) < degeneracy_eps. The plain difference is used when the average is zero.
     */
    [[nodiscard]] extern long adjust_for_degeneracy(long chi, const Eigen::VectorXd &m, double degeneracy_eps);

    /*! \brief Relative error sqrt(sum m[chi:]^2 / sum m^2) of keeping the first chi values, or 0 if all values are zero */
    [[nodiscard]] extern double truncation_error(long chi, const Eigen::VectorXd &m);

    /*! \brief Chooses the rank at which to truncate a descending sequence of non-negative magnitudes.
     *
     *  The canonical candidates are tried in order: each is shrunk by adjust_for_degeneracy (unless break_degenerate),
     *  and the first one whose truncation error is below eps is returned. If none qualifies the last one tried is returned.
     *  An all-zero sequence gives the smallest candidate with zero error.
     *  Throws except::logic_error if the magnitudes are not sorted in descending order, negative or non-finite.
     */
    [[nodiscard]] extern truncation select_rank(const Eigen::VectorXd &m, double eps, const std::optional<std::vector<long>> &chis,
                                                bool break_degenerate, double degeneracy_eps);
}
