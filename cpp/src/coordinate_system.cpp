#include "scapula/coordinate_system.hpp"
#include "scapula/errors.hpp"
#include "scapula/homogeneous.hpp"

#include <stdexcept>

namespace scapula {

namespace {

constexpr double kMinAxisNorm = 1e-12;

const Eigen::Vector3d& lookup(const LandmarkMap& landmarks, const std::string& name) {
    auto it = landmarks.find(name);
    if (it == landmarks.end()) {
        throw std::out_of_range("Landmark '" + name + "' not found");
    }
    return it->second;
}

Eigen::Vector3d mean_of(const LandmarkMap& landmarks, const std::vector<std::string>& names) {
    if (names.empty()) {
        throw std::invalid_argument("Empty landmark group");
    }
    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    for (const auto& name : names) {
        sum += lookup(landmarks, name);
    }
    return sum / static_cast<double>(names.size());
}

Eigen::Vector3d evaluate(const LandmarkMap& landmarks, const LandmarkVector& v) {
    return mean_of(landmarks, v.to) - mean_of(landmarks, v.from);
}

Eigen::Vector3d normalized(const Eigen::Vector3d& v, const char* what) {
    const double norm = v.norm();
    if (!(norm > kMinAxisNorm)) {
        throw RegistrationError(ErrorCode::NumericDegeneracy,
                                std::string(what) + " has zero length");
    }
    return v / norm;
}

struct PlaneAxisVisitor {
    const LandmarkMap& landmarks;
    const Eigen::Vector3d& axis;

    Eigen::Vector3d operator()(const PlaneFromVectors& plane) const {
        const Eigen::Vector3d normal = normalized(
            evaluate(landmarks, plane.first).cross(evaluate(landmarks, plane.second)),
            "plane normal");
        return axis.cross(normal);
    }

    Eigen::Vector3d operator()(const PlaneFromDirection& plane) const {
        return lookup(landmarks, plane.landmark);
    }
};

} // namespace

// ============================================================================
// Frame construction
// ============================================================================

Transformation compute_coordinate_system(
    const CoordinateSystemDefinition& definition,
    const LandmarkMap& landmarks
) {
    if (definition.axis_name == definition.plane_name) {
        throw std::invalid_argument("axis_name and plane_name must differ");
    }

    const Eigen::Vector3d origin = mean_of(landmarks, definition.origin);
    Eigen::Vector3d axis = normalized(evaluate(landmarks, definition.axis), "primary axis");
    Eigen::Vector3d plane_axis = normalized(
        std::visit(PlaneAxisVisitor{landmarks, axis}, definition.plane), "plane axis");

    // Gram-Schmidt the axis that is not kept
    if (definition.keep == KeepAxis::Axis) {
        plane_axis = normalized(plane_axis - plane_axis.dot(axis) * axis,
                                "plane axis (parallel to primary axis)");
    } else {
        axis = normalized(axis - axis.dot(plane_axis) * plane_axis,
                          "primary axis (parallel to plane axis)");
    }

    Eigen::Matrix3d R;
    const int a = static_cast<int>(definition.axis_name);
    const int p = static_cast<int>(definition.plane_name);
    const int k = 3 - a - p;
    R.col(a) = axis;
    R.col(p) = plane_axis;
    // e_k = e_{k+1} x e_{k+2} keeps the frame right-handed
    R.col(k) = R.col((k + 1) % 3).cross(R.col((k + 2) % 3));

    return Transformation::from_rt(R, origin);
}

// ============================================================================
// Registry
// ============================================================================

CoordinateSystemRegistry CoordinateSystemRegistry::scapula_defaults() {
    CoordinateSystemRegistry registry;

    // Origin at the acromial angle, x from trigonum spinae to acromial angle,
    // y in the scapular plane (AI, TS, AA)
    CoordinateSystemDefinition isb;
    isb.origin = {"AA"};
    isb.axis = LandmarkVector{{"TS"}, {"AA"}};
    isb.axis_name = Axis::X;
    isb.plane = PlaneFromVectors{LandmarkVector{{"AI"}, {"TS"}}, LandmarkVector{{"AI"}, {"AA"}}};
    isb.plane_name = Axis::Y;
    isb.keep = KeepAxis::Axis;
    registry.add("ISB", isb);

    // Glenoid centre origin, x along the glenoid contour normal,
    // z from inferior to superior glenoid edge
    CoordinateSystemDefinition scs10;
    scs10.origin = {"GC_CONTOUR"};
    scs10.axis = LandmarkVector{{"IE"}, {"SE"}};
    scs10.axis_name = Axis::Z;
    scs10.plane = PlaneFromDirection{"GC_CONTOUR_NORMAL"};
    scs10.plane_name = Axis::X;
    scs10.keep = KeepAxis::Plane;
    registry.add("SCS10", scs10);

    return registry;
}

void CoordinateSystemRegistry::add(const std::string& name, const CoordinateSystemDefinition& definition) {
    if (definition.axis_name == definition.plane_name) {
        throw std::invalid_argument("Coordinate system '" + name + "': axis_name and plane_name must differ");
    }
    if (!definitions_.emplace(name, definition).second) {
        throw std::invalid_argument("Coordinate system '" + name + "' already registered");
    }
}

const CoordinateSystemDefinition& CoordinateSystemRegistry::at(const std::string& name) const {
    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        throw std::out_of_range("Coordinate system '" + name + "' not registered");
    }
    return it->second;
}

std::vector<std::string> CoordinateSystemRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(definitions_.size());
    for (const auto& entry : definitions_) {
        out.push_back(entry.first);
    }
    return out;
}

Transformation CoordinateSystemRegistry::compute(const std::string& name, const LandmarkMap& landmarks) const {
    return compute_coordinate_system(at(name), landmarks);
}

Transformation CoordinateSystemRegistry::relative(
    const std::string& from,
    const std::string& to,
    const LandmarkMap& landmarks
) const {
    return compose_rigid(compute(from, landmarks), compute(to, landmarks));
}

} // namespace scapula
