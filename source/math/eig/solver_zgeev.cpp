#include "debug/exceptions.h"
#include "lapacke.h"
#include "log.h"
#include "solver.h"

int eig::solver::zgeev(const cplx *matrix, size_type L) {
    eig::log->trace("Starting eig zgeev");
    auto &eigvals  = result.get_eigvals<Form::NSYM>();
    auto &eigvecsR = result.get_eigvecs<cplx>();
    eigvals.resize(static_cast<size_t>(L));
    eigvecsR.resize(static_cast<size_t>(L * L));

    std::vector<cplx> A(matrix, matrix + L * L); // gets destroyed by zgeev
    cplx              eigvecsL_dummy[1];

    // It's better to ask lapack for the workspace size with a query.
    int               lrwork = static_cast<int>(2 * L);
    int               info   = 0;
    cplx              lwork_query;
    std::vector<real> rwork(static_cast<size_t>(lrwork));
    char              jobvr = config.compute_eigvecs == Vecs::ON ? 'V' : 'N';

    info = LAPACKE_zgeev_work(LAPACK_COL_MAJOR, 'N', jobvr, static_cast<int>(L), A.data(), static_cast<int>(L), eigvals.data(), eigvecsL_dummy, 1,
                              eigvecsR.data(), static_cast<int>(L), &lwork_query, -1, rwork.data());
    if(info != 0) throw except::logic_error("LAPACK zgeev workspace query failed with info {}", info);
    int               lwork = static_cast<int>(std::real(2.0 * lwork_query)); // Make it twice as big for performance.
    std::vector<cplx> work(static_cast<size_t>(lwork));

    info = LAPACKE_zgeev_work(LAPACK_COL_MAJOR, 'N', jobvr, static_cast<int>(L), A.data(), static_cast<int>(L), eigvals.data(), eigvecsL_dummy, 1,
                              eigvecsR.data(), static_cast<int>(L), work.data(), lwork, rwork.data());

    if(info < 0) throw except::logic_error("LAPACK zgeev error: parameter {} is invalid", -info);
    if(info > 0) throw except::convergence_error("LAPACK zgeev error: could not converge: info {}", info);
    if(jobvr == 'N') eigvecsR.clear();
    result.meta.eigvecsR_found = jobvr == 'V';
    result.meta.eigvals_found  = true;
    result.meta.form           = Form::NSYM;
    result.meta.type           = Type::CPLX;
    return info;
}
