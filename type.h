#pragma once

#include <apiExport.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace kdg {

enum class DType {
    Float32, // float
    Float64  // double
};

KDG_PUBLIC const char *dtypeName(DType dtype);

enum class ErrorCode {
    InvalidArgument,   // malformed shape, non-positive dimension/leaf size, bad radius, bad file
    DimensionMismatch, // source and target coordinate count disagree
    DTypeMismatch,     // float32 mixed with float64
    EmptyInput,        // zero points where at least one is required
    NoEdgesFound,      // radius query produced no edge
    Internal           // broken invariant inside the algorithm
};

KDG_PUBLIC const char *errorCodeName(ErrorCode code);

class KDG_PUBLIC Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string &what);

    [[nodiscard]] ErrorCode code() const noexcept;

private:
    ErrorCode code_;
};

/**
 * @brief Flat row-major point set: point i occupies [i * dimension, (i + 1) * dimension)
 *
 * Shape is not validated on construction, operations taking a point set do that and report
 * InvalidArgument.
 */
class KDG_PUBLIC Points {
public:
    Points();
    Points(std::vector<float> data, int dimension);
    Points(std::vector<double> data, int dimension);

    [[nodiscard]] DType       dtype() const;
    [[nodiscard]] int         dimension() const;
    [[nodiscard]] std::size_t length() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool        empty() const;

    /**
     * @brief flat coordinates
     *
     * @throw Error DTypeMismatch when T is not the stored coordinate type
     */
    template <typename T> [[nodiscard]] const std::vector<T> &data() const {
        auto *ptr = std::get_if<std::vector<T>>(&data_);
        if (!ptr)
            throw Error(ErrorCode::DTypeMismatch,
                        std::string("Invalid Input: points are ") + dtypeName(dtype()) +
                            " in Points::data()");
        return *ptr;
    }

private:
    std::variant<std::vector<float>, std::vector<double>> data_;
    int                                                   dimension_;
};

/**
 * @brief Edge list, edge i connects source[ i ] to target[ i ]
 *
 * Indices refer to the order of the point sets handed to the query.
 */
struct KDG_PUBLIC Edges {
public:
    std::vector<uint32_t> source;
    std::vector<uint32_t> target;

    Edges() = default;
    Edges(std::vector<uint32_t> source, std::vector<uint32_t> target);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool        empty() const;

    void push_back(uint32_t src, uint32_t dst);
    void append(const Edges &other);
    void reserve(std::size_t count);
};

/**
 * @brief parameter for building the kd-tree
 *
 */
struct KDG_PUBLIC BuildParam {
public:
    /**
     * @brief Nodes holding at most this many points become leaves
     *
     */
    int minLeafSize;

    explicit BuildParam(int minLeafSize = 16);
};

} // namespace kdg
