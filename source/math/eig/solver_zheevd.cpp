#include "debug/exceptions.h"
#include "lapacke.h"
#include "log.h"
#include "solver.h"
#include <algorithm>

int eig::solver::zheevd(const cplx *matrix, size_type L) {
    eig::log->trace("Starting eig zheevd");
    auto &eigvals = result.get_eigvals<Form::SYMM>();
    auto &eigvecs = result.get_eigvecs<cplx>();
    eigvals.resize(static_cast<size_t>(L));
    eigvecs.resize(static_cast<size_t>(L * L));
    std::copy(matrix, matrix + L * L, eigvecs.begin());

    int    info = 0;
    char   jobz = config.compute_eigvecs == Vecs::ON ? 'V' : 'N';
    cplx   lwork_query[1];
    double lrwork_query[1];
    int    liwork_query[1];

    info = LAPACKE_zheevd_work(LAPACK_COL_MAJOR, jobz, 'U', static_cast<int>(L), eigvecs.data(), static_cast<int>(L), eigvals.data(), lwork_query, -1,
                               lrwork_query, -1, liwork_query, -1);
    if(info != 0) throw except::logic_error("LAPACK zheevd workspace query failed with info {}", info);

    int lwork  = static_cast<int>(2 * std::real(lwork_query[0])); // Make it twice as big for performance.
    int lrwork = static_cast<int>(3 * lrwork_query[0]);
    int liwork = static_cast<int>(2 * liwork_query[0]);
    eig::log->trace(" lwork  = {}", lwork);
    eig::log->trace(" lrwork = {}", lrwork);
    eig::log->trace(" liwork = {}", liwork);

    std::vector<cplx>   work(static_cast<size_t>(lwork));
    std::vector<double> rwork(static_cast<size_t>(lrwork));
    std::vector<int>    iwork(static_cast<size_t>(liwork));

    info = LAPACKE_zheevd_work(LAPACK_COL_MAJOR, jobz, 'U', static_cast<int>(L), eigvecs.data(), static_cast<int>(L), eigvals.data(), work.data(), lwork,
                               rwork.data(), lrwork, iwork.data(), liwork);

    if(info < 0) throw except::logic_error("LAPACK zheevd error: parameter {} is invalid", -info);
    if(info > 0) throw except::convergence_error("LAPACK zheevd error: could not converge: info {}", info);
    if(jobz == 'N') eigvecs.clear();
    result.meta.eigvecsR_found = jobz == 'V';
    result.meta.eigvals_found  = true;
    result.meta.form           = Form::SYMM;
    result.meta.type           = Type::CPLX;
    return info;
}
