#pragma once

#include <kdtree/box.h>
#include <kdtree/kdtree.h>

#include <limits>
#include <utility>
#include <vector>

namespace kdg {

template <typename T> struct NearestResult {
    uint32_t position  = INVALID_INDEX; // position in the tree, INVALID_INDEX if nothing matched
    T        distance2 = std::numeric_limits<T>::infinity();
};

// (node, squared distance to the plane that separates it from the query)
template <typename T> using SearchStack = std::vector<std::pair<uint32_t, T>>;

/**
 * @brief nearestSearch Closest tree point to query, branch and bound
 *
 * The child on the query's side of the split is searched first, the other one only when the
 * splitting plane is closer than the best match so far. A candidate replaces the best only when
 * strictly closer, so on ties the first point visited wins.
 *
 * @param stack Scratch storage, reused across calls by the same thread
 */
template <typename T>
NearestResult<T> nearestSearch(const KDTree<T> &tree, const T *query, SearchStack<T> &stack) {
    NearestResult<T> best;
    if (tree.empty())
        return best;

    // near children and the root are always visited
    const T always    = T(-1);
    auto    dimension = tree.dimension();

    stack.clear();
    stack.emplace_back(0, always);
    while (!stack.empty()) {
        auto [ nodeIdx, bound ] = stack.back();
        stack.pop_back();
        if (bound >= best.distance2)
            continue;

        auto &node = tree.node(nodeIdx);
        if (node.isLeaf()) {
            for (auto i = node.start; i < node.end; i++) {
                auto dist2 = distance2(query, tree.point(i), dimension);
                if (dist2 < best.distance2) {
                    best.distance2 = dist2;
                    best.position  = i;
                }
            }
            continue;
        }

        T    diff      = query[ node.splitAxis ] - node.splitValue;
        bool isLeft    = query[ node.splitAxis ] < node.splitValue;
        auto nearChild = isLeft ? node.left : node.right;
        auto farChild  = isLeft ? node.right : node.left;

        // far child is popped after the whole near subtree, when the bound is as tight as it gets
        stack.emplace_back(farChild, diff * diff);
        stack.emplace_back(nearChild, always);
    }

    return best;
}

template <typename T>
NearestResult<T> nearestSearch(const KDTree<T> &tree, const T *query) {
    SearchStack<T> stack;
    return nearestSearch(tree, query, stack);
}

/**
 * @brief nearestEdges One edge per query point to its closest tree point
 *
 * source[ i ] is i, target[ i ] the original index of the match, INVALID_INDEX when no finite
 * distance exists (non-finite coordinates).
 */
template <typename T> Edges nearestEdges(const KDTree<T> &tree, const T *queries, uint32_t count) {
    Edges result;
    result.source.resize(count);
    result.target.resize(count);
    auto &order = tree.order();
    auto  dim   = tree.dimension();

#pragma omp parallel
    {
        SearchStack<T> stack;
        stack.reserve(2 * std::size_t(tree.depth()) + 2);
#pragma omp for schedule(static)
        for (int64_t i = 0; i < int64_t(count); i++) {
            auto match         = nearestSearch(tree, queries + std::size_t(i) * dim, stack);
            result.source[ i ] = static_cast<uint32_t>(i);
            result.target[ i ] =
                match.position == INVALID_INDEX ? INVALID_INDEX : order[ match.position ];
        }
    }

    return result;
}

} // namespace kdg
