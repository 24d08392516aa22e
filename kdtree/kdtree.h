#pragma once

#include <kdtree/box.h>
#include <logger.h>
#include <privateType.h>

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace kdg {

/**
 * @brief Static kd-tree over a flat row-major point buffer
 *
 * The tree keeps its own copy of the points, sorted so that every node covers a contiguous
 * range [start, end). order()[ i ] is the index, in the buffer handed to the constructor, of
 * the point now stored at position i. Nothing changes after construction, so concurrent
 * queries need no locking.
 */
template <typename T> class KDTree {
public:
    using value_type = T;

    struct Node {
        uint32_t start = 0;             // first point position
        uint32_t end   = 0;             // one past the last point position
        uint32_t left  = INVALID_INDEX; // node index, coord[ splitAxis ] < splitValue
        uint32_t right = INVALID_INDEX; // node index, coord[ splitAxis ] >= splitValue
        int      splitAxis  = -1;       // internal nodes only
        T        splitValue = 0;        // internal nodes only

        [[nodiscard]] bool isLeaf() const {
            return left == INVALID_INDEX && right == INVALID_INDEX;
        }
    };

    KDTree() = default;

    /**
     * @brief Build the tree
     *
     * @param data Flat coordinates, cloned
     * @param length Number of values in data, a multiple of dimension
     * @param dimension Coordinates per point
     * @param param see BuildParam
     * @throw Error InvalidArgument on empty or malformed input
     */
    KDTree(const T *data, std::size_t length, int dimension, const BuildParam &param)
        : dimension_(dimension)
        , param_(param) {
        logger()->debug("KDTree<{}>::build(dimension={}, minLeafSize={})",
                        dtypeName(DTypeOf<T>::value), dimension, param.minLeafSize);

        if (length == 0 || data == nullptr)
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: empty points in KDTree()");
        if (dimension < 1)
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: dimension must be positive in KDTree()");
        if (length % dimension != 0)
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: length of points (" + std::to_string(length) +
                            ") must be a multiple of dimension (" + std::to_string(dimension) +
                            ") in KDTree()");
        if (param.minLeafSize < 1)
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: minLeafSize must be at least 1 in KDTree()");
        if (length / dimension > MAX_POINTS)
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: too many points in KDTree()");

        numPoints_ = static_cast<uint32_t>(length / dimension);
        points_.assign(data, data + length);
        order_.resize(numPoints_);
        std::iota(order_.begin(), order_.end(), 0u);

        build();
        logger()->debug("KDTree built: {} points, {} nodes, depth {}", numPoints_, nodes_.size(),
                        depth_);
    }

    /**
     * @brief Reassemble a tree from previously built parts, used when loading from file
     *
     * @throw Error InvalidArgument when the parts are inconsistent
     */
    static KDTree fromParts(int dimension, const BuildParam &param, AlignedVector<T> points,
                            VectorI order, std::vector<Node> nodes, AlignedVector<T> bounds,
                            uint32_t depth) {
        if (dimension < 1 || points.empty() || points.size() % dimension != 0)
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: corrupt points in KDTree()");

        auto numPoints = points.size() / dimension;
        if (order.size() != numPoints || nodes.empty() ||
            bounds.size() != nodes.size() * 2 * std::size_t(dimension))
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: corrupt tree in KDTree()");

        if (numPoints > MAX_POINTS)
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: too many points in KDTree()");

        // order must be a permutation of [0, numPoints)
        std::vector<bool> seen(numPoints, false);
        for (auto idx : order) {
            if (idx >= numPoints || seen[ idx ])
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: corrupt point order in KDTree()");
            seen[ idx ] = true;
        }

        if (nodes[ 0 ].start != 0 || nodes[ 0 ].end != numPoints)
            throw Error(ErrorCode::InvalidArgument, "Invalid Input: corrupt root node in KDTree()");

        // children always come after their parent, each node has one parent
        std::vector<uint32_t> level(nodes.size(), 0);
        level[ 0 ]             = 1;
        uint32_t computedDepth = 1;
        for (std::size_t idx = 0; idx < nodes.size(); idx++) {
            auto &node = nodes[ idx ];
            if (level[ idx ] == 0)
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: unreachable node in KDTree()");
            if (node.start >= node.end || node.end > numPoints)
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: corrupt node range in KDTree()");
            if ((node.left == INVALID_INDEX) != (node.right == INVALID_INDEX))
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: corrupt node children in KDTree()");
            computedDepth = std::max(computedDepth, level[ idx ]);
            if (node.isLeaf())
                continue;

            if (node.left <= idx || node.right <= idx || node.left >= nodes.size() ||
                node.right >= nodes.size() || node.left == node.right ||
                level[ node.left ] != 0 || level[ node.right ] != 0)
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: corrupt node children in KDTree()");
            if (node.splitAxis < 0 || node.splitAxis >= dimension)
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: corrupt split axis in KDTree()");

            auto &left  = nodes[ node.left ];
            auto &right = nodes[ node.right ];
            if (left.start != node.start || left.end != right.start || right.end != node.end)
                throw Error(ErrorCode::InvalidArgument,
                            "Invalid Input: child ranges do not cover their parent in KDTree()");
            level[ node.left ]  = level[ idx ] + 1;
            level[ node.right ] = level[ idx ] + 1;
        }
        if (depth != computedDepth)
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: corrupt tree depth in KDTree()");

        KDTree tree;
        tree.dimension_ = dimension;
        tree.numPoints_ = static_cast<uint32_t>(numPoints);
        tree.param_     = param;
        tree.points_    = std::move(points);
        tree.order_     = std::move(order);
        tree.nodes_     = std::move(nodes);
        tree.bounds_    = std::move(bounds);
        tree.depth_     = depth;
        return tree;
    }

    [[nodiscard]] int dimension() const {
        return dimension_;
    }

    [[nodiscard]] uint32_t numPoints() const {
        return numPoints_;
    }

    [[nodiscard]] std::size_t numNodes() const {
        return nodes_.size();
    }

    // number of levels, a single leaf has depth 1
    [[nodiscard]] uint32_t depth() const {
        return depth_;
    }

    [[nodiscard]] const BuildParam &param() const {
        return param_;
    }

    [[nodiscard]] bool empty() const {
        return nodes_.empty();
    }

    [[nodiscard]] const Node &root() const {
        return nodes_[ 0 ];
    }

    [[nodiscard]] const Node &node(uint32_t idx) const {
        return nodes_[ idx ];
    }

    [[nodiscard]] const std::vector<Node> &nodes() const {
        return nodes_;
    }

    [[nodiscard]] const T *boxMin(uint32_t nodeIdx) const {
        return bounds_.data() + std::size_t(nodeIdx) * 2 * dimension_;
    }

    [[nodiscard]] const T *boxMax(uint32_t nodeIdx) const {
        return boxMin(nodeIdx) + dimension_;
    }

    [[nodiscard]] const T *point(uint32_t pos) const {
        return points_.data() + std::size_t(pos) * dimension_;
    }

    [[nodiscard]] const AlignedVector<T> &points() const {
        return points_;
    }

    [[nodiscard]] const VectorI &order() const {
        return order_;
    }

    [[nodiscard]] const AlignedVector<T> &bounds() const {
        return bounds_;
    }

    [[nodiscard]] uint32_t numPointsForNode(const Node &node) const {
        return node.end - node.start;
    }

    void dump(std::ostream &os) const {
        if (nodes_.empty()) {
            os << "KDTree: No points\n";
            return;
        }

        os << "KDTree (NumPoints: " << numPoints_ << ", Dimension: " << dimension_ << "):\n";
        os << "-------------------------------------------\n";

        struct Item {
            uint32_t    node;
            uint32_t    level;
            const char *label;
        };
        std::vector<Item> stack{{0, 0, "Root"}};
        while (!stack.empty()) {
            auto item = stack.back();
            stack.pop_back();

            std::string indent(item.level * 2, ' ');
            auto       &node = nodes_[ item.node ];
            if (!node.isLeaf()) {
                os << indent << item.label << " node (axis: " << node.splitAxis
                   << ", value: " << std::fixed << std::setprecision(2) << node.splitValue
                   << ", bounding-box=" << formatPoint(boxMin(item.node), 2) << " - "
                   << formatPoint(boxMax(item.node), 2) << "):\n";
                stack.push_back({node.right, item.level + 1, "Right"});
                stack.push_back({node.left, item.level + 1, "Left"});
                continue;
            }

            os << indent << item.label << " leaf node:\n";
            for (auto i = node.start; i < node.end; i++)
                os << indent << "  " << formatPoint(point(i), 2)
                   << " (original index: " << order_[ i ] << ")\n";
        }
        os << "-------------------------------------------\n";
    }

private:
    std::string formatPoint(const T *values, int precision) const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << '[';
        for (int axis = 0; axis < dimension_; axis++) {
            if (axis > 0)
                ss << ", ";
            ss << values[ axis ];
        }
        ss << ']';
        return ss.str();
    }

    uint32_t pushNode(uint32_t start, uint32_t end) {
        auto idx = static_cast<uint32_t>(nodes_.size());
        Node node;
        node.start = start;
        node.end   = end;
        nodes_.push_back(node);
        bounds_.resize(bounds_.size() + 2 * std::size_t(dimension_));
        auto *min = bounds_.data() + std::size_t(idx) * 2 * dimension_;
        computeBox(points_.data(), dimension_, start, end, min, min + dimension_);
        return idx;
    }

    // axis with the largest extent, lowest axis on ties; -1 when every extent is zero
    int chooseAxis(uint32_t nodeIdx) const {
        auto *min      = boxMin(nodeIdx);
        auto *max      = boxMax(nodeIdx);
        int   axis     = -1;
        T     maxRange = 0;
        for (int d = 0; d < dimension_; d++) {
            T range = max[ d ] - min[ d ];
            if (range > maxRange) {
                maxRange = range;
                axis     = d;
            }
        }
        return axis;
    }

    // sort [start, end) by the axis coordinate, points and order move together
    void sortRange(uint32_t start, uint32_t end, int axis) {
        auto count = end - start;
        perm_.resize(count);
        std::iota(perm_.begin(), perm_.end(), 0u);
        std::sort(perm_.begin(), perm_.end(), [ & ](uint32_t a, uint32_t b) {
            return points_[ std::size_t(start + a) * dimension_ + axis ] <
                   points_[ std::size_t(start + b) * dimension_ + axis ];
        });

        tmpPoints_.resize(std::size_t(count) * dimension_);
        tmpOrder_.resize(count);
        for (uint32_t dst = 0; dst < count; dst++) {
            auto src = start + perm_[ dst ];
            std::copy_n(point(src), dimension_, tmpPoints_.begin() + std::size_t(dst) * dimension_);
            tmpOrder_[ dst ] = order_[ src ];
        }
        std::copy(tmpPoints_.begin(), tmpPoints_.end(),
                  points_.begin() + std::size_t(start) * dimension_);
        std::copy(tmpOrder_.begin(), tmpOrder_.end(), order_.begin() + start);
    }

    void build() {
        nodes_.clear();
        bounds_.clear();
        nodes_.reserve(2 * (numPoints_ / param_.minLeafSize) + 1);

        // explicit stack: duplicate heavy input must not exhaust the call stack
        std::vector<std::pair<uint32_t, uint32_t>> stack; // node, level
        stack.emplace_back(pushNode(0, numPoints_), 1);
        depth_ = 0;

        while (!stack.empty()) {
            auto [ idx, level ] = stack.back();
            stack.pop_back();
            depth_ = std::max(depth_, level);

            auto start = nodes_[ idx ].start;
            auto end   = nodes_[ idx ].end;
            if (end - start <= static_cast<uint32_t>(param_.minLeafSize))
                continue;

            // all points identical
            auto axis = chooseAxis(idx);
            if (axis < 0)
                continue;

            sortRange(start, end, axis);

            auto mid        = start + (end - start) / 2;
            T    splitValue = points_[ std::size_t(mid) * dimension_ + axis ];
            while (mid > start && points_[ std::size_t(mid - 1) * dimension_ + axis ] >= splitValue)
                mid--;
            // too many ties below the median, no strict split possible
            if (mid == start)
                continue;

            auto left  = pushNode(start, mid);
            auto right = pushNode(mid, end);

            auto &node      = nodes_[ idx ];
            node.left       = left;
            node.right      = right;
            node.splitAxis  = axis;
            node.splitValue = splitValue;

            stack.emplace_back(right, level + 1);
            stack.emplace_back(left, level + 1);
        }

        perm_.clear();
        perm_.shrink_to_fit();
        tmpPoints_.clear();
        tmpPoints_.shrink_to_fit();
        tmpOrder_.clear();
        tmpOrder_.shrink_to_fit();
    }

    int              dimension_ = 0;
    uint32_t         numPoints_ = 0;
    uint32_t         depth_     = 0;
    BuildParam       param_;
    AlignedVector<T> points_; // reordered copy of the input
    VectorI          order_;  // position -> original index
    std::vector<Node> nodes_; // nodes_[ 0 ] is the root
    AlignedVector<T> bounds_; // per node: dimension min values then dimension max values

    // scratch for sortRange, released after build
    std::vector<uint32_t> perm_;
    std::vector<T>        tmpPoints_;
    std::vector<uint32_t> tmpOrder_;
};

} // namespace kdg
