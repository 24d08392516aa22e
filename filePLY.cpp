#include <filePLY.h>
#include <logger.h>
#include <rply.h>

#include <vector>

namespace kdg {

namespace {

namespace ply_point_reader {

struct PLYReaderState {
    std::vector<float> *data_ptr;
    long                vertex_index;
    long                vertex_num;
};

int ReadVertexCallback(p_ply_argument argument) {
    PLYReaderState *state_ptr;
    long            index;
    ply_get_argument_user_data(argument, reinterpret_cast<void **>(&state_ptr), &index);
    if (state_ptr->vertex_index >= state_ptr->vertex_num)
        return 0;

    double value = ply_get_argument_value(argument);
    (*state_ptr->data_ptr)[ state_ptr->vertex_index * 3 + index ] = static_cast<float>(value);
    if (index == 2)
        state_ptr->vertex_index++;

    return 1;
}

} // namespace ply_point_reader

template <typename T> void writeVertices(p_ply ply_file, const std::vector<T> &data) {
    for (auto value : data)
        ply_write(ply_file, value);
}

} // unnamed namespace

bool readPLY(const std::string &filename, Points &points) {
    using namespace ply_point_reader;

    p_ply ply_file = ply_open(filename.c_str(), NULL, 0, NULL);
    if (!ply_file) {
        logger()->error("Read PLY failed: unable to open file: {}", filename);
        return false;
    }
    if (!ply_read_header(ply_file)) {
        logger()->error("Read PLY failed: unable to parse header: {}", filename);
        ply_close(ply_file);
        return false;
    }

    std::vector<float> data;
    PLYReaderState     state;
    state.data_ptr     = &data;
    state.vertex_index = 0;
    state.vertex_num = ply_set_read_cb(ply_file, "vertex", "x", ReadVertexCallback, &state, 0);
    long numY = ply_set_read_cb(ply_file, "vertex", "y", ReadVertexCallback, &state, 1);
    long numZ = ply_set_read_cb(ply_file, "vertex", "z", ReadVertexCallback, &state, 2);

    if (state.vertex_num <= 0) {
        logger()->error("Read PLY failed: number of vertex <= 0: {}", filename);
        ply_close(ply_file);
        return false;
    }
    if (numY != state.vertex_num || numZ != state.vertex_num) {
        logger()->error("Read PLY failed: vertex needs x, y and z properties: {}", filename);
        ply_close(ply_file);
        return false;
    }

    data.resize(state.vertex_num * 3);
    if (!ply_read(ply_file)) {
        logger()->error("Read PLY failed: unable to read file: {}", filename);
        ply_close(ply_file);
        return false;
    }

    ply_close(ply_file);
    points = Points(std::move(data), 3);
    logger()->debug("Read PLY: {} vertices from {}", points.size(), filename);
    return true;
}

bool writePLY(const std::string &filename, const Points &points, bool writeAscii) {
    if (points.empty()) {
        logger()->error("Write PLY failed: point set has 0 vertices.");
        return false;
    }
    if (points.dimension() != 3 || points.length() % 3 != 0) {
        logger()->error("Write PLY failed: dimension {} is not 3.", points.dimension());
        return false;
    }

    p_ply ply_file =
        ply_create(filename.c_str(), writeAscii ? PLY_ASCII : PLY_LITTLE_ENDIAN, NULL, 0, NULL);
    if (!ply_file) {
        logger()->error("Write PLY failed: unable to open file: {}", filename);
        return false;
    }

    auto type = points.dtype() == DType::Float32 ? PLY_FLOAT : PLY_DOUBLE;
    ply_add_comment(ply_file, "Created by kdgraph");
    ply_add_element(ply_file, "vertex", static_cast<long>(points.size()));
    ply_add_property(ply_file, "x", type, type, type);
    ply_add_property(ply_file, "y", type, type, type);
    ply_add_property(ply_file, "z", type, type, type);
    if (!ply_write_header(ply_file)) {
        logger()->error("Write PLY failed: unable to write header.");
        ply_close(ply_file);
        return false;
    }

    if (points.dtype() == DType::Float32)
        writeVertices(ply_file, points.data<float>());
    else
        writeVertices(ply_file, points.data<double>());

    ply_close(ply_file);
    return true;
}

} // namespace kdg
