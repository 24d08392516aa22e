#pragma once

#include <type.h>

#include <Eigen/Core>
#include <xsimd/xsimd.hpp>

#include <cstdint>
#include <limits>
#include <vector>

namespace kdg {

template <typename T> using AlignedVector = std::vector<T, xsimd::aligned_allocator<T>>;

using VectorI = AlignedVector<uint32_t>;

// read-only view of one point (or one bounding box corner) inside a flat buffer
template <typename T> using ConstPointMap = Eigen::Map<const Eigen::Matrix<T, Eigen::Dynamic, 1>>;
template <typename T> using PointMap      = Eigen::Map<Eigen::Matrix<T, Eigen::Dynamic, 1>>;

const uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

// largest point count addressable by 32 bit indices, INVALID_INDEX stays free
const std::size_t MAX_POINTS = std::numeric_limits<uint32_t>::max() - 1;

template <typename T> struct DTypeOf;
template <> struct DTypeOf<float> {
    static constexpr DType value = DType::Float32;
};
template <> struct DTypeOf<double> {
    static constexpr DType value = DType::Float64;
};

} // namespace kdg
