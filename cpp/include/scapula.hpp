#pragma once

/**
 * Scapula registration library
 *
 * Rigid ICP alignment of anatomical surface scans and statistics over
 * collections of rigid transforms.
 */

#include "scapula/errors.hpp"
#include "scapula/types.hpp"
#include "scapula/homogeneous.hpp"
#include "scapula/nearest_neighbor.hpp"
#include "scapula/svd.hpp"
#include "scapula/point_to_point.hpp"
#include "scapula/averaging.hpp"
#include "scapula/batch.hpp"
#include "scapula/coordinate_system.hpp"
#include "scapula/file_utils.hpp"
