#pragma once

#include <kdgraph.h>
#include <kdtree/kdtree.h>

#include <variant>

namespace kdg {

struct Index::IMPL {
public:
    std::variant<KDTree<float>, KDTree<double>> tree;
};

} // namespace kdg
