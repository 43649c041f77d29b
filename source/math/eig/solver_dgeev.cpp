#include "debug/exceptions.h"
#include "lapacke.h"
#include "log.h"
#include "solver.h"

int eig::solver::dgeev(const real *matrix, size_type L) {
    eig::log->trace("Starting eig dgeev");
    auto rows = static_cast<size_t>(L);
    auto cols = static_cast<size_t>(L);

    std::vector<double> A(matrix, matrix + L * L); // gets destroyed by dgeev
    std::vector<double> wr(rows);
    std::vector<double> wi(rows);
    std::vector<double> eigvecsR_tmp(rows * cols);
    double              eigvecsL_dummy[1];

    int    info = 0;
    double lwork_query;
    char   jobvr = config.compute_eigvecs == Vecs::ON ? 'V' : 'N';

    info = LAPACKE_dgeev_work(LAPACK_COL_MAJOR, 'N', jobvr, static_cast<int>(L), A.data(), static_cast<int>(L), wr.data(), wi.data(), eigvecsL_dummy, 1,
                              eigvecsR_tmp.data(), static_cast<int>(L), &lwork_query, -1);
    if(info != 0) throw except::logic_error("LAPACK dgeev workspace query failed with info {}", info);
    int lwork = static_cast<int>(2.0 * lwork_query); // Make it twice as big for performance.
    std::vector<double> work(static_cast<size_t>(lwork));
    info = LAPACKE_dgeev_work(LAPACK_COL_MAJOR, 'N', jobvr, static_cast<int>(L), A.data(), static_cast<int>(L), wr.data(), wi.data(), eigvecsL_dummy, 1,
                              eigvecsR_tmp.data(), static_cast<int>(L), work.data(), lwork);

    if(info < 0) throw except::logic_error("LAPACK dgeev error: parameter {} is invalid", -info);
    if(info > 0) throw except::convergence_error("LAPACK dgeev error: could not converge: info {}", info);

    auto &eigvals = result.get_eigvals<Form::NSYM>();
    eigvals.resize(rows);
    for(size_t j = 0; j < rows; j++) eigvals[j] = cplx(wr[j], wi[j]);

    if(jobvr == 'V') {
        // Complex conjugate pairs are packed as (re, im) in consecutive columns
        auto &eigvecsR = result.get_eigvecs<cplx>();
        eigvecsR.resize(rows * cols);
        size_t j = 0;
        while(j < cols) {
            if(wi[j] == 0.0 or j + 1 == cols) {
                for(size_t i = 0; i < rows; i++) eigvecsR[i + j * rows] = eigvecsR_tmp[i + j * rows];
                j++;
            } else {
                for(size_t i = 0; i < rows; i++) {
                    eigvecsR[i + j * rows]       = cplx(eigvecsR_tmp[i + j * rows], eigvecsR_tmp[i + (j + 1) * rows]);
                    eigvecsR[i + (j + 1) * rows] = cplx(eigvecsR_tmp[i + j * rows], -eigvecsR_tmp[i + (j + 1) * rows]);
                }
                j += 2;
            }
        }
    }

    result.meta.eigvecsR_found = jobvr == 'V';
    result.meta.eigvals_found  = true;
    result.meta.form           = Form::NSYM;
    result.meta.type           = Type::REAL;
    return info;
}
