#include "solution.h"
#include "debug/exceptions.h"
#include <cmath>

namespace eig {

    template<typename Scalar>
    std::vector<Scalar> &solution::get_eigvecs() const {
        if constexpr(std::is_same_v<Scalar, real>) {
            build_eigvecs_real();
            return eigvecsR_real;
        }
        if constexpr(std::is_same_v<Scalar, cplx>) {
            build_eigvecs_cplx();
            return eigvecsR_cplx;
        }
    }

    template std::vector<eig::real> &solution::get_eigvecs<eig::real>() const;
    template std::vector<eig::cplx> &solution::get_eigvecs<eig::cplx>() const;

    template<typename Scalar>
    std::vector<Scalar> &solution::get_eigvals() const {
        if constexpr(std::is_same_v<Scalar, real>) {
            build_eigvals_real();
            return eigvals_real;
        }
        if constexpr(std::is_same_v<Scalar, cplx>) {
            build_eigvals_cplx();
            return eigvals_cplx;
        }
    }

    template std::vector<eig::real> &solution::get_eigvals<eig::real>() const;
    template std::vector<eig::cplx> &solution::get_eigvals<eig::cplx>() const;

    void solution::reset() {
        eigvals_real.clear();
        eigvals_imag.clear();
        eigvals_cplx.clear();
        eigvecsR_real.clear();
        eigvecsR_imag.clear();
        eigvecsR_cplx.clear();
        meta = Meta();
    }

    bool solution::eigvals_are_real() const { return meta.form == Form::SYMM; }

    void solution::build_eigvecs_cplx() const {
        bool build_eigvecsR_cplx = eigvecsR_cplx.empty() and (not eigvecsR_real.empty() or not eigvecsR_imag.empty());
        if(build_eigvecsR_cplx) {
            eigvecsR_cplx.resize(std::max(eigvecsR_real.size(), eigvecsR_imag.size()));
            for(size_t i = 0; i < eigvecsR_cplx.size(); i++) {
                if(i < eigvecsR_real.size() and i < eigvecsR_imag.size())
                    eigvecsR_cplx[i] = cplx(eigvecsR_real[i], eigvecsR_imag[i]);
                else if(i < eigvecsR_real.size())
                    eigvecsR_cplx[i] = cplx(eigvecsR_real[i], 0.0);
                else
                    eigvecsR_cplx[i] = cplx(0.0, eigvecsR_imag[i]);
            }
            eigvecsR_real.clear();
            eigvecsR_imag.clear();
        }
    }

    void solution::build_eigvecs_real() const {
        bool build_eigvecsR_real = eigvecsR_real.empty() and not eigvecsR_cplx.empty();
        if(build_eigvecsR_real) {
            eigvecsR_real.resize(eigvecsR_cplx.size());
            for(size_t i = 0; i < eigvecsR_real.size(); i++) {
                if(std::abs(std::imag(eigvecsR_cplx[i])) > 1e-12)
                    throw except::runtime_error("Error building real eigvecR: Nonzero imaginary part {:.3e}", std::imag(eigvecsR_cplx[i]));
                eigvecsR_real[i] = std::real(eigvecsR_cplx[i]);
            }
            eigvecsR_cplx.clear();
        }
    }

    void solution::build_eigvals_cplx() const {
        bool build_cplx = eigvals_cplx.empty() and not eigvals_real.empty();
        if(build_cplx) {
            eigvals_cplx.resize(eigvals_real.size());
            for(size_t i = 0; i < eigvals_real.size(); i++) {
                auto imag       = i < eigvals_imag.size() ? eigvals_imag[i] : 0.0;
                eigvals_cplx[i] = cplx(eigvals_real[i], imag);
            }
            eigvals_real.clear();
            eigvals_imag.clear();
        }
    }

    void solution::build_eigvals_real() const {
        bool build_real = eigvals_real.empty() and not eigvals_cplx.empty();
        if(build_real) {
            eigvals_real.resize(eigvals_cplx.size());
            eigvals_imag.resize(eigvals_cplx.size());
            for(size_t i = 0; i < eigvals_cplx.size(); i++) {
                eigvals_real[i] = std::real(eigvals_cplx[i]);
                eigvals_imag[i] = std::imag(eigvals_cplx[i]);
            }
            eigvals_cplx.clear();
        }
    }
}
