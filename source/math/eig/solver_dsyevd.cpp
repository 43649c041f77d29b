#include "debug/exceptions.h"
#include "lapacke.h"
#include "log.h"
#include "solver.h"
#include <algorithm>

int eig::solver::dsyevd(const real *matrix, size_type L) {
    eig::log->trace("Starting eig dsyevd");
    auto &eigvals = result.get_eigvals<Form::SYMM>();
    auto &eigvecs = result.get_eigvecs<real>();
    eigvals.resize(static_cast<size_t>(L));
    eigvecs.resize(static_cast<size_t>(L * L));
    std::copy(matrix, matrix + L * L, eigvecs.begin());

    // It's better to ask lapack for the workspace sizes with a query.
    int    info = 0;
    char   jobz = config.compute_eigvecs == Vecs::ON ? 'V' : 'N';
    double lwork_query[1];
    int    liwork_query[1];

    info = LAPACKE_dsyevd_work(LAPACK_COL_MAJOR, jobz, 'U', static_cast<int>(L), eigvecs.data(), static_cast<int>(L), eigvals.data(), lwork_query, -1,
                               liwork_query, -1);
    if(info != 0) throw except::logic_error("LAPACK dsyevd workspace query failed with info {}", info);

    int lwork  = static_cast<int>(2 * lwork_query[0]);  // Make it twice as big for performance.
    int liwork = static_cast<int>(3 * liwork_query[0]); // Make it thrice as big for performance.
    eig::log->trace(" lwork  = {}", lwork);
    eig::log->trace(" liwork = {}", liwork);

    std::vector<double> work(static_cast<size_t>(lwork));
    std::vector<int>    iwork(static_cast<size_t>(liwork));

    info = LAPACKE_dsyevd_work(LAPACK_COL_MAJOR, jobz, 'U', static_cast<int>(L), eigvecs.data(), static_cast<int>(L), eigvals.data(), work.data(), lwork,
                               iwork.data(), liwork);

    if(info < 0) throw except::logic_error("LAPACK dsyevd error: parameter {} is invalid", -info);
    if(info > 0) throw except::convergence_error("LAPACK dsyevd error: could not converge: info {}", info);
    if(jobz == 'N') eigvecs.clear();
    result.meta.eigvecsR_found = jobz == 'V';
    result.meta.eigvals_found  = true;
    result.meta.form           = Form::SYMM;
    result.meta.type           = Type::REAL;
    return info;
}
