#pragma once

#include "cast.h"
#include "float.h"
#include <algorithm>
#include <cmath>
#include <complex>
#include <functional>
#include <iterator>
#include <numeric>
#include <vector>

/*!
 *  \namespace num
 *  \brief Small convenience-type num functions
 */

namespace num {
    /*! \brief Product operator for containers such as vector
     *   \param in a vector, array or any 1D container with "<code> .data() </code>" method.
     *   \param from first element to multiply
     *   \param num number of elements to multiply
     *   \return product of of elements with type Input::value_type .
     *   \example Let <code> v = {1,2,3,4}</code>. Then <code> prod(v,0,3) = 6 </code>.
     */
    template<typename Input>
    [[nodiscard]] auto prod(const Input &in, size_t from = 0, size_t num = -1ul) {
        if(num == -1ul) num = static_cast<size_t>(std::size(in)) - from;
        using value_type = typename Input::value_type;
        return std::accumulate(std::begin(in) + safe_cast<long>(from), std::begin(in) + safe_cast<long>(from + num), value_type{1}, std::multiplies<>());
    }

    /*! \brief Returns the permutation of indices that sorts <code>in</code> by the given comparator. Equal elements keep their order. */
    template<typename Input, typename Compare>
    [[nodiscard]] std::vector<long> argsort(const Input &in, Compare comp) {
        std::vector<long> idx(std::size(in));
        std::iota(idx.begin(), idx.end(), 0l);
        std::stable_sort(idx.begin(), idx.end(), [&in, &comp](long i, long j) { return comp(in[static_cast<size_t>(i)], in[static_cast<size_t>(j)]); });
        return idx;
    }
}
