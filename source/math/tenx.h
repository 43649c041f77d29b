#pragma once

#include "math/cast.h"
#include "math/float.h"
#include <array>
#include <cassert>
#include <complex>
#include <Eigen/Core>
#include <type_traits>
#include <unsupported/Eigen/CXX11/Tensor>

/*! \brief **tenx**: "Tensor Extra". Provides extra functionality to Eigen::Tensor.*/

/*!
 *  \namespace tenx
 *  This namespace makes shorthand typedef's to Eigen's unsupported Tensor module, and provides handy functions
 *  to interface between `Eigen::Tensor` and `Eigen::Matrix` objects.
 *  All maps and casts assume Eigen's default column-major layout.
 */

/*clang-format off */
namespace tenx {
    template<typename Scalar>
    using MatrixType = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

    template<typename Scalar>
    using VectorType = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

    template<Eigen::Index rank>
    using array = std::array<Eigen::Index, rank>;

    using array4 = array<4>;
    using array3 = array<3>;
    using array2 = array<2>;
    using array1 = array<1>;

    template<typename Scalar, auto rank>
    auto TensorRandom(const std::array<Eigen::Index, rank> &dims) {
        Eigen::Tensor<Scalar, rank> tensor(dims);
        tensor.setRandom();
        return tensor;
    }

    template<typename Scalar, typename... Dims>
    auto TensorRandom(const Dims... dims) {
        return TensorRandom<Scalar>(std::array<Eigen::Index, sizeof...(Dims)>{dims...});
    }

    //    //****************************//
    //    //Matrix to tensor conversions//
    //    //****************************//

    // Detects if Derived is a plain object, like "MatrixXd" or similar.
    // std::decay removes pointer or ref qualifiers if present
    template<typename Derived>
    using is_plain_object = std::is_base_of<Eigen::PlainObjectBase<std::decay_t<Derived>>, std::decay_t<Derived>>;
    template<typename Derived>
    inline constexpr bool is_plain_object_v = is_plain_object<Derived>::value;

    template<typename Derived, typename T, auto rank>
    Eigen::Tensor<typename Derived::Scalar, rank> TensorCast(const Eigen::EigenBase<Derived> &matrix, const std::array<T, rank> &dims) {
        if constexpr(is_plain_object_v<Derived>) {
            assert(matrix.size() == Eigen::internal::array_prod(dims));
            return Eigen::TensorMap<const Eigen::Tensor<const typename Derived::Scalar, rank>>(matrix.derived().data(), dims);
        } else {
            using PlainType = typename Derived::PlainObject;
            PlainType plain = matrix.derived();
            return Eigen::TensorMap<const Eigen::Tensor<const typename Derived::Scalar, rank>>(plain.data(), dims);
        }
    }

    // Helpful overload
    template<typename Derived, typename... Dims>
    auto TensorCast(const Eigen::EigenBase<Derived> &matrix, const Dims... dims) {
        static_assert(sizeof...(Dims) > 0, "TensorCast: sizeof... (Dims) must be larger than 0");
        return TensorCast(matrix, std::array<Eigen::Index, sizeof...(Dims)>{dims...});
    }

    template<typename Derived>
    auto TensorCast(const Eigen::EigenBase<Derived> &matrix) {
        if constexpr(Derived::ColsAtCompileTime == 1 or Derived::RowsAtCompileTime == 1) {
            return TensorCast(matrix, matrix.size());
        } else {
            return TensorCast(matrix, matrix.rows(), matrix.cols());
        }
    }


    //    //****************************//
    //    //Tensor to matrix conversions//
    //    //****************************//

    template<typename Scalar, auto rank, typename sizeType>
    auto MatrixMap(const Eigen::Tensor<Scalar, rank> &tensor, const sizeType rows, const sizeType cols) {
        return Eigen::Map<const MatrixType<Scalar>>(tensor.data(), rows, cols);
    }
    template<typename Scalar, auto rank, typename sizeType>
    auto MatrixMap(Eigen::Tensor<Scalar, rank> &tensor, const sizeType rows, const sizeType cols) {
        return Eigen::Map<MatrixType<Scalar>>(tensor.data(), rows, cols);
    }
    template<typename Scalar, auto rank, typename sizeType>
    auto MatrixMap(const Eigen::Tensor<Scalar, rank> &&tensor, const sizeType rows, const sizeType cols) = delete; // Prevent map from temporary

    template<typename Scalar>
    auto MatrixMap(const Eigen::Tensor<Scalar, 2> &tensor) {
        return Eigen::Map<const MatrixType<Scalar>>(tensor.data(), tensor.dimension(0), tensor.dimension(1));
    }
    template<typename Scalar>
    auto MatrixMap(const Eigen::Tensor<Scalar, 2> &&tensor) = delete; // Prevent map from temporary

    template<typename Scalar, auto rank>
    auto VectorMap(const Eigen::Tensor<Scalar, rank> &tensor) {
        return Eigen::Map<const VectorType<Scalar>>(tensor.data(), tensor.size());
    }
    template<typename Scalar, auto rank>
    auto VectorMap(const Eigen::Tensor<Scalar, rank> &&tensor) = delete; // Prevent map from temporary

}
/*clang-format on */
