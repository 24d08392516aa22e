#include <type.h>

#include <utility>

namespace kdg {

const char *dtypeName(DType dtype) {
    switch (dtype) {
        case DType::Float32:
            return "Float32";
        case DType::Float64:
            return "Float64";
    }
    return "Unknown";
}

const char *errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::DimensionMismatch:
            return "DimensionMismatch";
        case ErrorCode::DTypeMismatch:
            return "DTypeMismatch";
        case ErrorCode::EmptyInput:
            return "EmptyInput";
        case ErrorCode::NoEdgesFound:
            return "NoEdgesFound";
        case ErrorCode::Internal:
            return "Internal";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string &what)
    : std::runtime_error(what)
    , code_(code) {
}

ErrorCode Error::code() const noexcept {
    return code_;
}

Points::Points()
    : data_(std::vector<float>{})
    , dimension_(0) {
}

Points::Points(std::vector<float> data, int dimension)
    : data_(std::move(data))
    , dimension_(dimension) {
}

Points::Points(std::vector<double> data, int dimension)
    : data_(std::move(data))
    , dimension_(dimension) {
}

DType Points::dtype() const {
    return data_.index() == 0 ? DType::Float32 : DType::Float64;
}

int Points::dimension() const {
    return dimension_;
}

std::size_t Points::length() const {
    return std::visit([](const auto &vec) { return vec.size(); }, data_);
}

std::size_t Points::size() const {
    if (dimension_ <= 0)
        return 0;
    return length() / dimension_;
}

bool Points::empty() const {
    return length() == 0;
}

Edges::Edges(std::vector<uint32_t> source_, std::vector<uint32_t> target_)
    : source(std::move(source_))
    , target(std::move(target_)) {
}

std::size_t Edges::size() const {
    return source.size();
}

bool Edges::empty() const {
    return source.empty();
}

void Edges::push_back(uint32_t src, uint32_t dst) {
    source.push_back(src);
    target.push_back(dst);
}

void Edges::append(const Edges &other) {
    source.insert(source.end(), other.source.begin(), other.source.end());
    target.insert(target.end(), other.target.begin(), other.target.end());
}

void Edges::reserve(std::size_t count) {
    source.reserve(count);
    target.reserve(count);
}

BuildParam::BuildParam(int minLeafSize_)
    : minLeafSize(minLeafSize_) {

    if (minLeafSize < 1)
        throw Error(ErrorCode::InvalidArgument,
                    "Invalid Input: minLeafSize must be at least 1 in BuildParam()");
}

} // namespace kdg
