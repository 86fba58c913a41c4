/**
 * @file Solver.cpp
 * @brief Implementation of the Gaussian elimination solver
 */

#include <Perspec/Internal/Solver.h>

#include <cmath>

namespace Perspec::Internal {

template<int N>
GaussResult<N> SolveGaussian(const Mat<N, N>& A, const Vec<N>& b, double pivotThreshold) {
    GaussResult<N> result;

    // Augmented matrix [A|b]
    Mat<N, N + 1> aug;
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            aug(i, j) = A(i, j);
        }
        aug(i, N) = b[i];
    }

    // Forward elimination
    for (int k = 0; k < N; ++k) {
        // Find pivot
        int maxIdx = k;
        double maxVal = std::abs(aug(k, k));
        for (int i = k + 1; i < N; ++i) {
            double absVal = std::abs(aug(i, k));
            if (absVal > maxVal) {
                maxVal = absVal;
                maxIdx = i;
            }
        }

        // NaN entries compare false everywhere, so test the negation
        if (!(maxVal >= pivotThreshold)) {
            result.status = SolveStatus::SingularPivot;
            result.failedRow = k;
            return result;
        }

        aug.SwapRows(k, maxIdx);

        for (int i = k + 1; i < N; ++i) {
            double factor = aug(i, k) / aug(k, k);
            for (int j = k; j <= N; ++j) {
                aug(i, j) -= factor * aug(k, j);
            }
        }
    }

    // Back substitution
    Vec<N> x;
    for (int i = N - 1; i >= 0; --i) {
        if (!(std::abs(aug(i, i)) >= pivotThreshold)) {
            result.status = SolveStatus::ZeroBackPivot;
            result.failedRow = i;
            return result;
        }

        double sum = aug(i, N);
        for (int j = i + 1; j < N; ++j) {
            sum -= aug(i, j) * x[j];
        }
        x[i] = sum / aug(i, i);

        if (!std::isfinite(x[i])) {
            result.status = SolveStatus::NonFiniteSolution;
            result.failedRow = i;
            return result;
        }
    }

    result.x = x;
    result.status = SolveStatus::Ok;
    result.valid = true;
    return result;
}

// Sizes used by the library and its tests
template GaussResult<2> SolveGaussian<2>(const Mat<2, 2>&, const Vec<2>&, double);
template GaussResult<3> SolveGaussian<3>(const Mat<3, 3>&, const Vec<3>&, double);
template GaussResult<4> SolveGaussian<4>(const Mat<4, 4>&, const Vec<4>&, double);
template GaussResult<8> SolveGaussian<8>(const Mat<8, 8>&, const Vec<8>&, double);

const char* SolveStatusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::Ok:                return "Ok";
        case SolveStatus::SingularPivot:     return "SingularPivot";
        case SolveStatus::ZeroBackPivot:     return "ZeroBackPivot";
        case SolveStatus::NonFiniteSolution: return "NonFiniteSolution";
    }
    return "Unknown";
}

} // namespace Perspec::Internal
