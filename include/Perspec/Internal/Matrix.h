#pragma once

/**
 * @file Matrix.h
 * @brief Fixed-size storage for small dense linear systems
 *
 * Vec<N> and Mat<M,N> hold the operands of the Gaussian solver: the 8x8
 * DLT system and its augmented form. Row-major, stack storage, zero on
 * construction.
 */

#include <algorithm>
#include <initializer_list>

namespace Perspec::Internal {

/**
 * @brief Fixed-size vector
 * @tparam N Vector dimension
 */
template<int N>
class Vec {
    static_assert(N >= 1 && N <= 16, "Vec dimension must be between 1 and 16");

public:
    Vec() {
        std::fill(data_, data_ + N, 0.0);
    }

    /// Missing trailing elements stay zero
    Vec(std::initializer_list<double> init) {
        std::fill(data_, data_ + N, 0.0);
        std::copy_n(init.begin(), std::min<int>(N, static_cast<int>(init.size())), data_);
    }

    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    static constexpr int Size() { return N; }

private:
    double data_[N];
};

/**
 * @brief Fixed-size matrix
 * @tparam M Number of rows
 * @tparam N Number of columns
 */
template<int M, int N>
class Mat {
    static_assert(M >= 1 && M <= 16, "Mat rows must be between 1 and 16");
    static_assert(N >= 1 && N <= 16, "Mat cols must be between 1 and 16");

public:
    Mat() {
        std::fill(data_, data_ + M * N, 0.0);
    }

    /// Row-major; missing trailing elements stay zero
    Mat(std::initializer_list<double> init) {
        std::fill(data_, data_ + M * N, 0.0);
        std::copy_n(init.begin(), std::min<int>(M * N, static_cast<int>(init.size())), data_);
    }

    double& operator()(int row, int col) { return data_[row * N + col]; }
    const double& operator()(int row, int col) const { return data_[row * N + col]; }

    void SwapRows(int a, int b) {
        if (a == b) return;
        std::swap_ranges(data_ + a * N, data_ + (a + 1) * N, data_ + b * N);
    }

    static Mat Zero() {
        return Mat();
    }

private:
    double data_[M * N];
};

using Vec8 = Vec<8>;
using Mat88 = Mat<8, 8>;

} // namespace Perspec::Internal
