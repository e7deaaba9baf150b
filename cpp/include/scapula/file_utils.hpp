#pragma once

#include <string>
#include <vector>

#include "coordinate_system.hpp"
#include "types.hpp"

namespace scapula {

/**
 * Load point cloud from PLY file.
 * Supports ASCII and binary little-endian PLY with float or double
 * x, y, z vertex properties; other properties are skipped.
 *
 * @param filepath Path to .ply file
 * @return Cloud with one row per vertex
 * @throws std::runtime_error if file cannot be opened or parsed
 */
PointCloud load_ply(const std::string& filepath);


/**
 * Load rigid transforms from a text file.
 * 16 whitespace-separated numbers (row-major 4x4) per transform;
 * everything after '#' on a line is ignored.
 *
 * @throws std::runtime_error on I/O error or a trailing partial matrix
 */
std::vector<Transformation> load_transforms(const std::string& filepath);


/**
 * Load landmarks from lines of the form "NAME x y z".
 * Blank lines and '#' comments are ignored.
 *
 * @throws std::runtime_error on I/O error or malformed line
 */
LandmarkMap load_landmarks(const std::string& filepath);

} // namespace scapula
