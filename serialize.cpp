#include <serialize.h>

#include <string>

namespace kdg {

namespace {

template <typename T> void readRaw(std::istream *is, T &val) {
    is->read(reinterpret_cast<char *>(&val), sizeof(val));
}

template <typename T> void writeRaw(std::ostream *os, const T &val) {
    os->write(reinterpret_cast<const char *>(&val), sizeof(val));
}

template <typename V> void deserializeVector(std::istream *is, V &val) {
    uint64_t size = 0;
    deserialize(is, size);
    if (!*is)
        return;

    // the size prefix is untrusted, it cannot exceed what is left in the stream
    std::streamoff pos = is->tellg();
    if (pos >= 0) {
        is->seekg(0, std::ios::end);
        std::streamoff end = is->tellg();
        is->seekg(pos, std::ios::beg);
        if (end < pos || size > uint64_t(end - pos) / sizeof(typename V::value_type))
            throw Error(ErrorCode::InvalidArgument,
                        "Invalid Input: vector size " + std::to_string(size) +
                            " exceeds the remaining data");
    }
    val.resize(size);
    is->read(reinterpret_cast<char *>(val.data()), sizeof(typename V::value_type) * size);
}

template <typename V> void serializeVector(std::ostream *os, const V &val) {
    uint64_t size = val.size();
    serialize(os, size);
    os->write(reinterpret_cast<const char *>(val.data()), sizeof(typename V::value_type) * size);
}

template <typename T> void deserializeNode(std::istream *is, typename KDTree<T>::Node &val) {
    deserialize(is, val.start);
    deserialize(is, val.end);
    deserialize(is, val.left);
    deserialize(is, val.right);
    deserialize(is, val.splitAxis);
    readRaw(is, val.splitValue);
}

template <typename T> void serializeNode(std::ostream *os, const typename KDTree<T>::Node &val) {
    serialize(os, val.start);
    serialize(os, val.end);
    serialize(os, val.left);
    serialize(os, val.right);
    serialize(os, val.splitAxis);
    writeRaw(os, val.splitValue);
}

template <typename T> void deserializeTree(std::istream *is, KDTree<T> &val) {
    int        dimension = 0;
    uint32_t   depth     = 0;
    BuildParam param;
    deserialize(is, dimension);
    deserialize(is, param);
    deserialize(is, depth);

    AlignedVector<T> points;
    VectorI          order;
    deserialize(is, points);
    deserialize(is, order);

    uint64_t count = 0;
    deserialize(is, count);
    std::vector<typename KDTree<T>::Node> nodes;
    for (uint64_t i = 0; i < count && *is; i++) {
        typename KDTree<T>::Node node;
        deserialize(is, node);
        nodes.push_back(node);
    }

    AlignedVector<T> bounds;
    deserialize(is, bounds);
    if (!*is)
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: truncated kd-tree data");

    val = KDTree<T>::fromParts(dimension, param, std::move(points), std::move(order),
                               std::move(nodes), std::move(bounds), depth);
}

template <typename T> void serializeTree(std::ostream *os, const KDTree<T> &val) {
    serialize(os, val.dimension());
    serialize(os, val.param());
    serialize(os, val.depth());
    serialize(os, val.points());
    serialize(os, val.order());

    uint64_t count = val.numNodes();
    serialize(os, count);
    for (auto &node : val.nodes())
        serialize(os, node);

    serialize(os, val.bounds());
}

} // namespace

void deserialize(std::istream *is, int &val) {
    readRaw(is, val);
}

void serialize(std::ostream *os, const int &val) {
    writeRaw(os, val);
}

void deserialize(std::istream *is, uint32_t &val) {
    readRaw(is, val);
}

void serialize(std::ostream *os, const uint32_t &val) {
    writeRaw(os, val);
}

void deserialize(std::istream *is, uint64_t &val) {
    readRaw(is, val);
}

void serialize(std::ostream *os, const uint64_t &val) {
    writeRaw(os, val);
}

void deserialize(std::istream *is, DType &val) {
    int raw = 0;
    deserialize(is, raw);
    if (raw != static_cast<int>(DType::Float32) && raw != static_cast<int>(DType::Float64))
        throw Error(ErrorCode::InvalidArgument, "Invalid Input: unknown dtype in index file");
    val = static_cast<DType>(raw);
}

void serialize(std::ostream *os, const DType &val) {
    serialize(os, static_cast<int>(val));
}

void deserialize(std::istream *is, BuildParam &val) {
    int minLeafSize = 0;
    deserialize(is, minLeafSize);
    val = BuildParam(minLeafSize);
}

void serialize(std::ostream *os, const BuildParam &val) {
    serialize(os, val.minLeafSize);
}

void deserialize(std::istream *is, VectorI &val) {
    deserializeVector(is, val);
}

void serialize(std::ostream *os, const VectorI &val) {
    serializeVector(os, val);
}

void deserialize(std::istream *is, AlignedVector<float> &val) {
    deserializeVector(is, val);
}

void serialize(std::ostream *os, const AlignedVector<float> &val) {
    serializeVector(os, val);
}

void deserialize(std::istream *is, AlignedVector<double> &val) {
    deserializeVector(is, val);
}

void serialize(std::ostream *os, const AlignedVector<double> &val) {
    serializeVector(os, val);
}

void deserialize(std::istream *is, KDTree<float>::Node &val) {
    deserializeNode<float>(is, val);
}

void serialize(std::ostream *os, const KDTree<float>::Node &val) {
    serializeNode<float>(os, val);
}

void deserialize(std::istream *is, KDTree<double>::Node &val) {
    deserializeNode<double>(is, val);
}

void serialize(std::ostream *os, const KDTree<double>::Node &val) {
    serializeNode<double>(os, val);
}

void deserialize(std::istream *is, KDTree<float> &val) {
    deserializeTree(is, val);
}

void serialize(std::ostream *os, const KDTree<float> &val) {
    serializeTree(os, val);
}

void deserialize(std::istream *is, KDTree<double> &val) {
    deserializeTree(is, val);
}

void serialize(std::ostream *os, const KDTree<double> &val) {
    serializeTree(os, val);
}

} // namespace kdg
