#pragma once
#include "debug/exceptions.h"
#include "math/num.h"
#include "math/tenx.h"
#include <array>

namespace decomp {

    /*! \brief A tensor with its axes split in two groups and flattened into a dim_a x dim_b matrix */
    template<typename Scalar, size_t NA, size_t NB>
    struct grouping {
        std::array<long, NA + NB>  perm;    /*!< The axes of group a followed by the axes of group b */
        std::array<long, NA>       shape_a; /*!< Extents of the axes in group a */
        std::array<long, NB>       shape_b; /*!< Extents of the axes in group b */
        long                       dim_a = 1;
        long                       dim_b = 1;
        tenx::MatrixType<Scalar>   matrix;
    };

    // A bare axis index is a group of one
    inline std::array<long, 1> as_axes(long axis) { return {axis}; }
    template<size_t M>
    const std::array<long, M> &as_axes(const std::array<long, M> &axes) {
        return axes;
    }

    template<size_t M>
    std::array<long, M + 1> append(const std::array<long, M> &shape, long dim) {
        std::array<long, M + 1> res{};
        std::copy(shape.begin(), shape.end(), res.begin());
        res[M] = dim;
        return res;
    }
    template<size_t M>
    std::array<long, M + 1> prepend(long dim, const std::array<long, M> &shape) {
        std::array<long, M + 1> res{};
        res[0] = dim;
        std::copy(shape.begin(), shape.end(), res.begin() + 1);
        return res;
    }

    /*! \brief Shuffles the tensor to the axis order a ++ b and flattens it to a dim_a x dim_b column-major matrix.
     *  Throws except::invalid_argument unless a ++ b lists every axis of the tensor exactly once.
     */
    template<typename Scalar, int N, size_t NA, size_t NB>
    grouping<Scalar, NA, NB> partition(const Eigen::Tensor<Scalar, N> &tensor, const std::array<long, NA> &a, const std::array<long, NB> &b) {
        if constexpr(NA + NB != static_cast<size_t>(N)) {
            throw except::invalid_argument("partition: axis groups {} and {} do not cover a tensor of rank {}", a, b, N);
        } else {
            grouping<Scalar, NA, NB> grp;
            std::copy(a.begin(), a.end(), grp.perm.begin());
            std::copy(b.begin(), b.end(), grp.perm.begin() + NA);

            std::array<bool, NA + NB> seen{};
            for(const auto &ax : grp.perm) {
                if(ax < 0 or ax >= N) throw except::invalid_argument("partition: axis {} is out of range for a tensor of rank {}", ax, N);
                if(seen[static_cast<size_t>(ax)]) throw except::invalid_argument("partition: axis {} appears more than once in {} | {}", ax, a, b);
                seen[static_cast<size_t>(ax)] = true;
            }

            const auto &dims = tensor.dimensions();
            for(size_t i = 0; i < NA; i++) grp.shape_a[i] = dims[a[i]];
            for(size_t i = 0; i < NB; i++) grp.shape_b[i] = dims[b[i]];
            grp.dim_a = num::prod(grp.shape_a);
            grp.dim_b = num::prod(grp.shape_b);

            Eigen::Tensor<Scalar, N> shuffled = tensor.shuffle(grp.perm);
            grp.matrix                        = tenx::MatrixMap(shuffled, grp.dim_a, grp.dim_b);
            return grp;
        }
    }

    template<typename Scalar, int N, typename AxesA, typename AxesB>
    auto partition(const Eigen::Tensor<Scalar, N> &tensor, const AxesA &a, const AxesB &b) {
        return partition(tensor, as_axes(a), as_axes(b));
    }
}
