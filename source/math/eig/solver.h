#pragma once
#include "enums.h"
#include "settings.h"
#include "solution.h"

namespace eig {

    /*! \brief Full diagonalization of a dense, column-major L x L matrix.
     *  Form::SYMM selects the hermitian solvers and yields real eigenvalues, Form::NSYM the general ones.
     *  The solver library is taken from config.lib (Lib::EIGEN unless set otherwise).
     *  Eigenpairs are stored in result in the order the backend returns them.
     */
    class solver {
        public:
        eig::settings config;
        eig::solution result;

        solver();
        explicit solver(const eig::settings &config_);

        // Functions for full diagonalization of explicit matrix with LAPACKE
        int dsyevd(const real *matrix, size_type L);
        int zheevd(const cplx *matrix, size_type L);
        int dgeev(const real *matrix, size_type L);
        int zgeev(const cplx *matrix, size_type L);

        // Functions for full diagonalization of explicit matrix with Eigen
        template<typename Scalar>
        int eigen_selfadjoint(const Scalar *matrix, size_type L);
        template<typename Scalar>
        int eigen_general(const Scalar *matrix, size_type L);

        void eig_init(Form form, Type type, Vecs compute_eigvecs);
        template<Form form = Form::SYMM, typename Scalar>
        void eig(const Scalar *matrix, size_type L, Vecs compute_eigvecs = Vecs::ON);
    };
}
