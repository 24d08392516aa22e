#include <edges.h>
#include <logger.h>

#include <gtl/phmap.hpp>

#include <algorithm>

namespace kdg {

namespace {
inline uint64_t edgeKey(uint32_t source, uint32_t target) {
    return (uint64_t(source) << 32) | target;
}
} // namespace

void checkEdges(const Edges &edges) {
    if (edges.source.size() != edges.target.size())
        throw Error(ErrorCode::InvalidArgument,
                    "Invalid Input: edges have " + std::to_string(edges.source.size()) +
                        " source and " + std::to_string(edges.target.size()) +
                        " target indices in checkEdges()");
}

Edges unionEdges(const std::vector<Edges> &edges) {
    if (edges.empty())
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: no input edges in unionEdges()");

    std::size_t total = 0;
    for (auto &item : edges) {
        checkEdges(item);
        total += item.size();
    }

    gtl::flat_hash_set<uint64_t> seen;
    seen.reserve(total);

    Edges result;
    result.reserve(total);
    for (auto &item : edges) {
        for (std::size_t i = 0; i < item.size(); i++) {
            if (seen.insert(edgeKey(item.source[ i ], item.target[ i ])).second)
                result.push_back(item.source[ i ], item.target[ i ]);
        }
    }

    logger()->debug("unionEdges: {} lists, {} edges, {} unique", edges.size(), total,
                    result.size());
    return result;
}

void sortEdgesBySource(Edges &edges) {
    checkEdges(edges);

    // (source << 32 | target) orders lexicographically by source then target
    std::vector<uint64_t> keys(edges.size());
    for (std::size_t i = 0; i < keys.size(); i++)
        keys[ i ] = edgeKey(edges.source[ i ], edges.target[ i ]);
    std::sort(keys.begin(), keys.end());

    for (std::size_t i = 0; i < keys.size(); i++) {
        edges.source[ i ] = static_cast<uint32_t>(keys[ i ] >> 32);
        edges.target[ i ] = static_cast<uint32_t>(keys[ i ]);
    }
}

} // namespace kdg
