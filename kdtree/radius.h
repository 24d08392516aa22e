#pragma once

#include <kdtree/box.h>
#include <kdtree/kdtree.h>

#include <omp.h>

#include <numeric>

namespace kdg {

/**
 * @brief All (source, target) pairs closer than radius, source points indexed by the tree
 *
 * Descends the source tree carrying the target points that can still reach the current box.
 * Targets are only filtered, never partitioned, and every source point lives in exactly one
 * leaf, so no pair is emitted twice.
 */
template <typename T> class RadiusSearch {
public:
    RadiusSearch(const KDTree<T> &tree, const T *target, uint32_t numTarget, T radius)
        : tree_(tree)
        , target_(target)
        , numTarget_(numTarget)
        , dimension_(tree.dimension())
        , radius_(radius)
        , radius2_(radius * radius) {
    }

    /**
     * @brief run the query
     *
     * Top levels of the descent run as OpenMP tasks. Each branch collects its own edges and the
     * lists are joined left then right, so the output order does not depend on scheduling.
     */
    Edges run() const {
        Edges result;
        if (tree_.empty() || numTarget_ == 0)
            return result;

        VectorI all(numTarget_);
        std::iota(all.begin(), all.end(), 0u);

        auto threads   = omp_get_max_threads();
        int  taskDepth = 0;
        for (int branches = 1; threads > 1 && branches < threads * 4; branches *= 2)
            taskDepth++;

#pragma omp parallel if (taskDepth > 0)
#pragma omp single
        descend(0, all, taskDepth, result);

        return result;
    }

private:
    void descend(uint32_t nodeIdx, const VectorI &candidates, int taskDepth, Edges &out) const {
        auto &node = tree_.node(nodeIdx);
        auto *min  = tree_.boxMin(nodeIdx);
        auto *max  = tree_.boxMax(nodeIdx);

        VectorI remaining;
        remaining.reserve(candidates.size());
        for (auto idx : candidates) {
            if (intersectsRadius(targetPoint(idx), min, max, dimension_, radius_, radius2_))
                remaining.push_back(idx);
        }
        if (remaining.empty())
            return;

        if (node.isLeaf()) {
            auto &order = tree_.order();
            for (auto i = node.start; i < node.end; i++) {
                auto *src = tree_.point(i);
                for (auto idx : remaining) {
                    if (distance2(src, targetPoint(idx), dimension_) <= radius2_)
                        out.push_back(order[ i ], idx);
                }
            }
            return;
        }

        if (taskDepth <= 0) {
            descend(node.left, remaining, 0, out);
            descend(node.right, remaining, 0, out);
            return;
        }

        Edges leftEdges;
        Edges rightEdges;
        auto *leftOut  = &leftEdges;
        auto *working  = &remaining;
        auto  left     = node.left;
        auto  subDepth = taskDepth - 1;
#pragma omp task firstprivate(leftOut, working, left, subDepth)
        descend(left, *working, subDepth, *leftOut);

        descend(node.right, remaining, subDepth, rightEdges);
#pragma omp taskwait

        out.reserve(out.size() + leftEdges.size() + rightEdges.size());
        out.append(leftEdges);
        out.append(rightEdges);
    }

    const T *targetPoint(uint32_t idx) const {
        return target_ + std::size_t(idx) * dimension_;
    }

    const KDTree<T> &tree_;
    const T         *target_;
    uint32_t         numTarget_;
    int              dimension_;
    T                radius_;
    T                radius2_;
};

template <typename T>
Edges radiusSearch(const KDTree<T> &tree, const T *target, uint32_t numTarget, T radius) {
    return RadiusSearch<T>(tree, target, numTarget, radius).run();
}

} // namespace kdg
