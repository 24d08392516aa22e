#include <helper.h>
#include <kdgraph.h>
#include <kdtree/nearest.h>
#include <kdtree/radius.h>
#include <private.h>
#include <serialize.h>

#include <omp.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace kdg {

const int VERSION    = 100;
const int MAGIC      = 0x4B44470;
const int maxThreads = 8;

namespace {

std::string shapeOf(const Points &points) {
    return std::string("[") + std::to_string(points.size()) + ", " +
           std::to_string(points.dimension()) + "] " + dtypeName(points.dtype());
}

void checkShape(const Points &points, const char *name, const char *func) {
    if (points.dimension() < 1)
        throw Error(ErrorCode::InvalidArgument, std::string("Invalid Input: ") + name +
                                                    " dimension must be positive in " + func +
                                                    "()");
    if (points.length() % points.dimension() != 0)
        throw Error(ErrorCode::InvalidArgument,
                    std::string("Invalid Input: length of ") + name + " (" +
                        std::to_string(points.length()) + ") must be a multiple of dimension (" +
                        std::to_string(points.dimension()) + ") in " + func + "()");
    if (points.size() > MAX_POINTS)
        throw Error(ErrorCode::InvalidArgument,
                    std::string("Invalid Input: too many ") + name + " in " + func + "()");
}

void checkCompatible(DType dtype, int dimension, const Points &other, const char *name,
                     const char *func) {
    if (other.dimension() != dimension)
        throw Error(ErrorCode::DimensionMismatch,
                    std::string("Invalid Input: dimension of ") + name + " (" +
                        std::to_string(other.dimension()) + ") must match the index (" +
                        std::to_string(dimension) + ") in " + func + "()");
    if (other.dtype() != dtype)
        throw Error(ErrorCode::DTypeMismatch, std::string("Invalid Input: dtype of ") + name +
                                                  " (" + dtypeName(other.dtype()) +
                                                  ") must match the index (" + dtypeName(dtype) +
                                                  ") in " + func + "()");
}

void checkEdgeCount(const Edges &edges, const char *func) {
    if (edges.source.size() != edges.target.size())
        throw Error(ErrorCode::Internal, std::string("edges number of source indices (") +
                                             std::to_string(edges.source.size()) +
                                             ") different from the number of target indices (" +
                                             std::to_string(edges.target.size()) + ") in " +
                                             func + "()");
}

} // namespace

Index::Index()
    : impl_(nullptr) {
    auto numThreads = omp_get_max_threads();
    if (numThreads > maxThreads)
        omp_set_num_threads(maxThreads);
}

Index::Index(const Points &points, BuildParam param)
    : Index() {
    build(points, param);
}

Index::~Index() {
}

Index::Index(Index &&other) noexcept = default;

Index &Index::operator=(Index &&other) noexcept = default;

void Index::build(const Points &points, BuildParam param) {
    auto impl = std::make_unique<IMPL>();
    if (points.dtype() == DType::Float32) {
        auto &data = points.data<float>();
        impl->tree.emplace<KDTree<float>>(data.data(), data.size(), points.dimension(), param);
    } else {
        auto &data = points.data<double>();
        impl->tree.emplace<KDTree<double>>(data.data(), data.size(), points.dimension(), param);
    }
    impl_ = std::move(impl);
}

bool Index::empty() const {
    return !impl_;
}

DType Index::dtype() const {
    if (!impl_)
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: index not built in dtype()");
    return impl_->tree.index() == 0 ? DType::Float32 : DType::Float64;
}

int Index::dimension() const {
    if (!impl_)
        return 0;
    return std::visit([](const auto &tree) { return tree.dimension(); }, impl_->tree);
}

std::size_t Index::size() const {
    if (!impl_)
        return 0;
    return std::visit([](const auto &tree) -> std::size_t { return tree.numPoints(); },
                      impl_->tree);
}

std::size_t Index::numNodes() const {
    if (!impl_)
        return 0;
    return std::visit([](const auto &tree) { return tree.numNodes(); }, impl_->tree);
}

std::size_t Index::depth() const {
    if (!impl_)
        return 0;
    return std::visit([](const auto &tree) -> std::size_t { return tree.depth(); }, impl_->tree);
}

Edges Index::radiusEdges(const Points &target, double radius) const {
    //[1] check input
    if (!impl_)
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: index not built in radiusEdges()");
    checkCompatible(dtype(), dimension(), target, "target", "radiusEdges");
    checkShape(target, "target", "radiusEdges");
    if (!(radius > 0) || !std::isfinite(radius))
        throw Error(ErrorCode::InvalidArgument,
                    "Invalid Input: radius must be positive in radiusEdges()");
    if (target.empty())
        throw Error(ErrorCode::EmptyInput, "Invalid Input: empty target in radiusEdges()");

    //[2] search
    auto edges = std::visit(
        [ & ](const auto &tree) {
            using T    = typename std::decay_t<decltype(tree)>::value_type;
            auto &data = target.data<T>();
            return radiusSearch(tree, data.data(), static_cast<uint32_t>(target.size()),
                                static_cast<T>(radius));
        },
        impl_->tree);

    //[3] check output
    checkEdgeCount(edges, "radiusEdges");
    if (edges.empty())
        throw Error(ErrorCode::NoEdgesFound,
                    "no edges found with radius set to " + std::to_string(radius));

    logger()->debug("radiusEdges: {} edges between {} source and {} target points", edges.size(),
                    size(), target.size());
    return edges;
}

Edges Index::nearestEdges(const Points &source) const {
    //[1] check input
    if (!impl_)
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: index not built in nearestEdges()");
    if (source.empty())
        throw Error(ErrorCode::EmptyInput, "Invalid Input: empty source in nearestEdges()");
    checkCompatible(dtype(), dimension(), source, "source", "nearestEdges");
    checkShape(source, "source", "nearestEdges");

    //[2] search
    auto edges = std::visit(
        [ & ](const auto &tree) {
            using T    = typename std::decay_t<decltype(tree)>::value_type;
            auto &data = source.data<T>();
            return kdg::nearestEdges(tree, data.data(), static_cast<uint32_t>(source.size()));
        },
        impl_->tree);

    //[3] check output
    checkEdgeCount(edges, "nearestEdges");
    if (edges.size() != source.size())
        throw Error(ErrorCode::Internal, "number of edges (" + std::to_string(edges.size()) +
                                             ") != number of source points (" +
                                             std::to_string(source.size()) +
                                             ") in nearestEdges()");
    for (std::size_t i = 0; i < edges.size(); i++) {
        if (edges.target[ i ] == INVALID_INDEX)
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: no finite distance for source point " +
                            std::to_string(i) + " in nearestEdges()");
    }

    logger()->debug("nearestEdges: {} source points matched against {} target points",
                    edges.size(), size());
    return edges;
}

std::string Index::toString() const {
    if (!impl_)
        return "KDTree: No points\n";

    std::ostringstream ss;
    std::visit([ & ](const auto &tree) { tree.dump(ss); }, impl_->tree);
    return ss.str();
}

void Index::save(const std::string &filename) const {
    if (!impl_)
        throw Error(ErrorCode::InvalidArgument, "No built index in save");
    std::ofstream of(filename, std::ios::out | std::ios::binary);
    if (!of.is_open())
        throw Error(ErrorCode::InvalidArgument, "failed to open file:" + filename);

    serialize(&of, MAGIC);
    serialize(&of, VERSION);
    serialize(&of, dtype());
    std::visit([ & ](const auto &tree) { serialize(&of, tree); }, impl_->tree);
    of.close();
}

void Index::load(const std::string &filename) {
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open())
        throw Error(ErrorCode::InvalidArgument, "failed to open file:" + filename);

    int magic = 0;
    deserialize(&ifs, magic);
    if (MAGIC != magic)
        throw Error(ErrorCode::InvalidArgument, "unsupported file format:" + filename);
    int version = 0;
    deserialize(&ifs, version);
    if (version > VERSION)
        throw Error(ErrorCode::InvalidArgument,
                    "unsupported file version " + std::to_string(version) + ":" + filename);

    DType type = DType::Float32;
    deserialize(&ifs, type);
    auto impl = std::make_unique<IMPL>();
    if (type == DType::Float32) {
        KDTree<float> tree;
        deserialize(&ifs, tree);
        impl->tree = std::move(tree);
    } else {
        KDTree<double> tree;
        deserialize(&ifs, tree);
        impl->tree = std::move(tree);
    }
    ifs.close();
    impl_ = std::move(impl);
}

Edges radiusEdges(const Points &source, const Points &target, double radius, BuildParam param) {
    Timer t("radiusEdges", spdlog::level::debug);
    if (target.dimension() != source.dimension())
        throw Error(ErrorCode::DimensionMismatch,
                    "Invalid Input: dimension of the points for source (" + shapeOf(source) +
                        ") and target (" + shapeOf(target) + ") must match in radiusEdges()");
    if (target.dtype() != source.dtype())
        throw Error(ErrorCode::DTypeMismatch,
                    "Invalid Input: dtype of the source (" + shapeOf(source) + ") and target (" +
                        shapeOf(target) + ") must match in radiusEdges()");

    Index index(source, param);
    return index.radiusEdges(target, radius);
}

Edges nearestEdges(const Points &source, const Points &target, BuildParam param) {
    Timer t("nearestEdges", spdlog::level::debug);
    if (source.empty() || target.empty())
        throw Error(ErrorCode::EmptyInput, "Invalid Input: nearest edges source (" +
                                               shapeOf(source) + ") or target (" +
                                               shapeOf(target) + ") are empty in nearestEdges()");
    if (target.dimension() != source.dimension())
        throw Error(ErrorCode::DimensionMismatch,
                    "Invalid Input: dimension of the points for source (" + shapeOf(source) +
                        ") and target (" + shapeOf(target) + ") must match in nearestEdges()");
    if (target.dtype() != source.dtype())
        throw Error(ErrorCode::DTypeMismatch,
                    "Invalid Input: dtype of the source (" + shapeOf(source) + ") and target (" +
                        shapeOf(target) + ") must match in nearestEdges()");

    Index index(target, param);
    return index.nearestEdges(source);
}

} // namespace kdg
