#include <complex>
#ifndef lapack_complex_float
    #define lapack_complex_float  std::complex<float>
#endif
#ifndef lapack_complex_double
    #define lapack_complex_double std::complex<double>
#endif
#include <lapacke.h>

int main() {
    double     a[9] = {4, 1, 0, 1, 3, 1, 0, 1, 2};
    double     s[3];
    double     superb[2];
    lapack_int info = LAPACKE_dgesvd(LAPACK_COL_MAJOR, 'N', 'N', 3, 3, a, 3, s, nullptr, 1, nullptr, 1, superb);
    return static_cast<int>(info);
}
