#include <edges.h>
#include <filePLY.h>
#include <helper.h>
#include <kdgraph.h>
#include <logger.h>

#include <cstdlib>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {

    if (argc < 3) {
        kdg::logger()->error("usage: {} <source.ply> <target.ply> [radius] [minLeafSize]",
                             argv[ 0 ]);
        return 1;
    }
    if (std::getenv("KDG_DEBUG"))
        kdg::setLogLevel(spdlog::level::debug);

    kdg::Points source;
    kdg::Points target;
    if (!kdg::readPLY(argv[ 1 ], source) || !kdg::readPLY(argv[ 2 ], target))
        return 1;

    try {
        kdg::BuildParam param(argc > 4 ? std::stoi(argv[ 4 ]) : 16);

        kdg::Index targetIndex;
        {
            kdg::Timer t("build target index");
            targetIndex.build(target, param);
        }
        kdg::logger()->info("target index: {} points, {} nodes, depth {}", targetIndex.size(),
                            targetIndex.numNodes(), targetIndex.depth());

        kdg::Edges nearest;
        {
            kdg::Timer t("nearest edges");
            nearest = targetIndex.nearestEdges(source);
        }

        // matched target point for every source point
        auto              &targetData = target.data<float>();
        std::vector<float> matched;
        matched.reserve(nearest.size() * 3);
        for (auto idx : nearest.target)
            matched.insert(matched.end(), targetData.begin() + idx * 3,
                           targetData.begin() + idx * 3 + 3);
        if (!kdg::writePLY("nearest.ply", kdg::Points(std::move(matched), 3)))
            kdg::logger()->warn("matched points not written");

        if (argc > 3) {
            auto radius = std::stod(argv[ 3 ]);

            kdg::Index sourceIndex;
            {
                kdg::Timer t("build source index");
                sourceIndex.build(source, param);
            }

            kdg::Edges radiusEdges;
            {
                kdg::Timer t("radius edges");
                radiusEdges = sourceIndex.radiusEdges(target, radius);
            }

            auto graph = kdg::unionEdges({nearest, radiusEdges});
            kdg::sortEdgesBySource(graph);
            kdg::logger()->info("radius edges: {}, nearest edges: {}, union: {}",
                                radiusEdges.size(), nearest.size(), graph.size());
        } else {
            kdg::logger()->info("nearest edges: {}", nearest.size());
        }
    } catch (const kdg::Error &e) {
        kdg::logger()->error("{}: {}", kdg::errorCodeName(e.code()), e.what());
        return 1;
    } catch (const std::exception &e) {
        kdg::logger()->error("{}", e.what());
        return 1;
    }

    return 0;
}
