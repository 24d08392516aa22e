#pragma once

#include <apiExport.h>
#include <type.h>
#include <vector>

namespace kdg {

/**
 * @brief checkEdges Validate the [2, numEdges] layout
 * @param edges Edge list
 * @throw Error InvalidArgument when source and target differ in length
 */
KDG_PUBLIC void checkEdges(const Edges &edges);

/**
 * @brief unionEdges Combine edge lists, every distinct (source, target) pair kept once
 *
 * Pairs come out in the order they are first seen. Empty lists contribute nothing.
 *
 * @param edges Edge lists to combine
 * @return Unique edges
 * @throw Error InvalidArgument when no list is given or one of them is malformed
 */
KDG_PUBLIC Edges unionEdges(const std::vector<Edges> &edges);

/**
 * @brief sortEdgesBySource Sort in place by source index, then by target index
 * @param edges Input/Output edge list
 */
KDG_PUBLIC void sortEdgesBySource(Edges &edges);

} // namespace kdg
