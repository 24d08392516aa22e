#pragma once

#include <apiExport.h>
#include <memory>
#include <string>
#include <type.h>

namespace kdg {

/**
 * @brief Static kd-tree index over one point set, float32 or float64
 *
 * Built once, read-only afterwards; const member functions may be called from several threads.
 */
class KDG_PUBLIC Index {
public:
    /**
     * @brief Construct an empty index, see build() and load()
     */
    Index();

    /**
     * @brief Construct and build, see build()
     */
    explicit Index(const Points &points, BuildParam param = BuildParam());

    ~Index();
    Index(Index &&other) noexcept;
    Index &operator=(Index &&other) noexcept;

    /**
     * @brief build the kd-tree, the points are copied
     *
     * @param points Points to index
     * @param param please see BuildParam
     * @throw Error InvalidArgument for empty points, non-positive dimension or a length that is
     * not a multiple of the dimension
     */
    void build(const Points &points, BuildParam param = BuildParam());

    [[nodiscard]] bool        empty() const;
    [[nodiscard]] DType       dtype() const;
    [[nodiscard]] int         dimension() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t numNodes() const;
    [[nodiscard]] std::size_t depth() const;

    /**
     * @brief edges between indexed (source) points and target points closer than radius
     *
     * @param target Target points, same dimension and dtype as the index
     * @param radius Inclusive distance threshold, must be positive
     * @return edges with source indices into the indexed points, target indices into target
     * @throw Error DimensionMismatch, DTypeMismatch, InvalidArgument, EmptyInput for a target
     * without points, NoEdgesFound when no pair is close enough
     */
    [[nodiscard]] Edges radiusEdges(const Points &target, double radius) const;

    /**
     * @brief edge from every source point to its closest indexed (target) point
     *
     * @param source Query points, same dimension and dtype as the index
     * @return one edge per source point, source[ i ] == i
     * @throw Error EmptyInput, DimensionMismatch, DTypeMismatch, InvalidArgument
     */
    [[nodiscard]] Edges nearestEdges(const Points &source) const;

    /**
     * @brief human readable dump of the tree
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief save built index to file
     *
     * @param filename
     */
    void save(const std::string &filename) const;

    /**
     * @brief load index from file
     *
     * @param filename
     */
    void load(const std::string &filename);

private:
    struct IMPL;
    std::unique_ptr<IMPL> impl_;
};

/**
 * @brief build an index over source, then Index::radiusEdges(target, radius)
 */
KDG_PUBLIC Edges radiusEdges(const Points &source, const Points &target, double radius,
                             BuildParam param = BuildParam());

/**
 * @brief build an index over target, then Index::nearestEdges(source)
 *
 * @throw Error EmptyInput when either set has no points
 */
KDG_PUBLIC Edges nearestEdges(const Points &source, const Points &target,
                              BuildParam param = BuildParam());

} // namespace kdg
