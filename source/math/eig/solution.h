#pragma once
#include "enums.h"
#include <string>
#include <vector>

namespace eig {
    class solver;

    /*! \brief Eigenvalues and right eigenvectors of a dense L x L matrix.
     *  Eigenvectors are stored column-major, i.e. eigenvector i occupies elements [i*L, (i+1)*L).
     *  Results from real nonsymmetric solvers are stored as real and imaginary parts, and are combined on demand.
     */
    class solution {
        public:
        friend class solver;

        private:
        mutable std::vector<real> eigvals_real;
        mutable std::vector<real> eigvals_imag;
        mutable std::vector<cplx> eigvals_cplx;
        mutable std::vector<real> eigvecsR_real;
        mutable std::vector<real> eigvecsR_imag;
        mutable std::vector<cplx> eigvecsR_cplx;

        void build_eigvecs_cplx() const;
        void build_eigvecs_real() const;
        void build_eigvals_cplx() const;
        void build_eigvals_real() const;

        struct Meta {
            bool           eigvals_found  = false;
            bool           eigvecsR_found = false;
            Form           form           = Form::SYMM;
            Type           type           = Type::REAL;
            std::string    tag;
        };

        public:
        Meta meta;

        template<typename Scalar>
        std::vector<Scalar> &get_eigvecs() const;

        template<typename Scalar>
        std::vector<Scalar> &get_eigvals() const;

        template<Form form = Form::SYMM>
        auto &get_eigvals() const {
            if constexpr(form == Form::SYMM) { return get_eigvals<real>(); }
            if constexpr(form == Form::NSYM) { return get_eigvals<cplx>(); }
        }

        void reset();

        [[nodiscard]] bool eigvals_are_real() const;
    };
}
