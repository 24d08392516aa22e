#pragma once

#include <iostream>
#include <kdtree/kdtree.h>
#include <privateType.h>
#include <type.h>

namespace kdg {

void deserialize(std::istream *is, int &val);
void serialize(std::ostream *os, const int &val);

void deserialize(std::istream *is, uint32_t &val);
void serialize(std::ostream *os, const uint32_t &val);

void deserialize(std::istream *is, uint64_t &val);
void serialize(std::ostream *os, const uint64_t &val);

void deserialize(std::istream *is, DType &val);
void serialize(std::ostream *os, const DType &val);

void deserialize(std::istream *is, BuildParam &val);
void serialize(std::ostream *os, const BuildParam &val);

void deserialize(std::istream *is, VectorI &val);
void serialize(std::ostream *os, const VectorI &val);

void deserialize(std::istream *is, AlignedVector<float> &val);
void serialize(std::ostream *os, const AlignedVector<float> &val);

void deserialize(std::istream *is, AlignedVector<double> &val);
void serialize(std::ostream *os, const AlignedVector<double> &val);

void deserialize(std::istream *is, KDTree<float>::Node &val);
void serialize(std::ostream *os, const KDTree<float>::Node &val);

void deserialize(std::istream *is, KDTree<double>::Node &val);
void serialize(std::ostream *os, const KDTree<double>::Node &val);

void deserialize(std::istream *is, KDTree<float> &val);
void serialize(std::ostream *os, const KDTree<float> &val);

void deserialize(std::istream *is, KDTree<double> &val);
void serialize(std::ostream *os, const KDTree<double> &val);

} // namespace kdg
