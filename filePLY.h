#pragma once

#include <apiExport.h>
#include <string>
#include <type.h>

namespace kdg {

/**
 * @brief readPLY Read the x, y, z vertex properties of a PLY file
 * @param filename PLY file, ascii or binary
 * @param points Output, Float32 with dimension 3
 * @return false when the file cannot be read, the reason is logged
 */
KDG_PUBLIC bool readPLY(const std::string &filename, Points &points);

/**
 * @brief writePLY Write a 3D point set as PLY vertices
 * @param filename Output file
 * @param points Dimension 3 points, Float32 or Float64
 * @param writeAscii Ascii instead of little endian binary
 * @return false when nothing could be written, the reason is logged
 */
KDG_PUBLIC bool writePLY(const std::string &filename, const Points &points,
                         bool writeAscii = false);

} // namespace kdg
