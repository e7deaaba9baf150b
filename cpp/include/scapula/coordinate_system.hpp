#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace scapula {

/**
 * Named anatomical landmarks (3D positions or directions).
 */
using LandmarkMap = std::map<std::string, Eigen::Vector3d>;

enum class Axis { X = 0, Y = 1, Z = 2 };

/**
 * Vector from the mean of the `from` landmarks to the mean of the `to` landmarks.
 */
struct LandmarkVector {
    std::vector<std::string> from;
    std::vector<std::string> to;
};

/**
 * Plane spanned by two landmark vectors. The derived axis is the in-plane
 * direction orthogonal to the primary axis: normalize(axis x (first x second)).
 * For ISB (first = AI->TS, second = AI->AA, axis = TS->AA) this points away
 * from AI.
 */
struct PlaneFromVectors {
    LandmarkVector first;
    LandmarkVector second;
};

/**
 * A landmark that already holds a direction (e.g. a fitted surface normal).
 */
struct PlaneFromDirection {
    std::string landmark;
};

using PlaneDefinition = std::variant<PlaneFromVectors, PlaneFromDirection>;

/**
 * Which of the two constructed axes is kept exactly; the other is
 * re-orthogonalized against it.
 */
enum class KeepAxis { Axis, Plane };

struct CoordinateSystemDefinition {
    std::vector<std::string> origin;
    LandmarkVector axis;
    Axis axis_name = Axis::X;
    PlaneDefinition plane;
    Axis plane_name = Axis::Y;
    KeepAxis keep = KeepAxis::Axis;
};


/**
 * Evaluate a definition against a set of landmarks.
 *
 * @return 4x4 frame, columns are the x, y, z axes and the origin
 * @throws std::out_of_range if a landmark is missing
 * @throws RegistrationError NumericDegeneracy on zero-length or parallel axes
 */
Transformation compute_coordinate_system(
    const CoordinateSystemDefinition& definition,
    const LandmarkMap& landmarks
);


/**
 * Name -> definition table, resolved against landmarks at call time.
 */
class CoordinateSystemRegistry {
public:
    CoordinateSystemRegistry() = default;

    /**
     * Scapula systems: "ISB" (Wu et al. 2005) and "SCS10" (glenoid based).
     */
    static CoordinateSystemRegistry scapula_defaults();

    /**
     * @throws std::invalid_argument if axis_name == plane_name or the name is taken
     */
    void add(const std::string& name, const CoordinateSystemDefinition& definition);

    bool contains(const std::string& name) const { return definitions_.count(name) > 0; }

    const CoordinateSystemDefinition& at(const std::string& name) const;

    std::vector<std::string> names() const;

    Transformation compute(const std::string& name, const LandmarkMap& landmarks) const;

    /**
     * Transform from system `from` to system `to`: frame_from^-1 * frame_to.
     */
    Transformation relative(
        const std::string& from,
        const std::string& to,
        const LandmarkMap& landmarks
    ) const;

private:
    std::map<std::string, CoordinateSystemDefinition> definitions_;
};

} // namespace scapula
