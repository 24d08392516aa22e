#pragma once

#include <privateType.h>

namespace kdg {

/**
 * @brief computeBox Tight axis-aligned bounding box of points [start, end)
 * @param points Flat row-major coordinates
 * @param dimension Coordinates per point
 * @param start First point
 * @param end One past the last point, must be greater than start
 * @param min Output, dimension values
 * @param max Output, dimension values
 */
template <typename T>
void computeBox(const T *points, int dimension, uint32_t start, uint32_t end, T *min, T *max) {
    // row-major [N, D] is column-major [D, N]
    Eigen::Map<const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>> P(
        points + std::size_t(start) * dimension, dimension, end - start);
    PointMap<T>(min, dimension) = P.rowwise().minCoeff();
    PointMap<T>(max, dimension) = P.rowwise().maxCoeff();
}

/**
 * @brief boxDistance2 Squared distance from point to the closest point of the box
 *
 * Zero when the point is inside. Never larger than the distance to any point in the box.
 */
template <typename T> T boxDistance2(const T *point, const T *min, const T *max, int dimension) {
    ConstPointMap<T> p(point, dimension);
    ConstPointMap<T> lo(min, dimension);
    ConstPointMap<T> hi(max, dimension);
    return (lo - p).cwiseMax(p - hi).cwiseMax(T(0)).squaredNorm();
}

/**
 * @brief intersectsRadius Whether the sphere (point, radius) touches the box
 * @param radius2 radius * radius
 * @return boxDistance2 <= radius2
 */
template <typename T>
bool intersectsRadius(const T *point, const T *min, const T *max, int dimension, T radius,
                      T radius2) {
    T sum = 0;
    for (int axis = 0; axis < dimension; axis++) {
        T gap = 0;
        if (point[ axis ] < min[ axis ])
            gap = min[ axis ] - point[ axis ];
        else if (point[ axis ] > max[ axis ])
            gap = point[ axis ] - max[ axis ];
        else
            continue;

        // one axis alone is already too far
        if (gap > radius)
            return false;
        sum += gap * gap;
    }
    return sum <= radius2;
}

// summed axis by axis in the same order as intersectsRadius so the box test stays a lower bound
template <typename T> T distance2(const T *a, const T *b, int dimension) {
    T sum = 0;
    for (int axis = 0; axis < dimension; axis++) {
        T diff = a[ axis ] - b[ axis ];
        sum += diff * diff;
    }
    return sum;
}

} // namespace kdg
