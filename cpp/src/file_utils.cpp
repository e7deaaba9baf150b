#include "scapula/file_utils.hpp"

#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace scapula {

namespace {

// Strip Windows line endings and '#' comments
std::string clean_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
        line.erase(hash);
    }
    return line;
}

} // namespace

// ============================================================================
// PLY Loading
// ============================================================================

PointCloud load_ply(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::string line;
    int num_vertices = 0;
    bool is_binary = false;
    bool in_vertex_element = false;
    bool header_done = false;
    std::vector<std::pair<std::string, std::string>> properties;  // (name, type)

    // Parse header
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::istringstream iss(line);
        std::string token;
        iss >> token;

        if (token == "format") {
            std::string format_type;
            iss >> format_type;
            if (format_type == "binary_little_endian") {
                is_binary = true;
            } else if (format_type == "binary_big_endian") {
                throw std::runtime_error("Big-endian PLY not supported: " + filepath);
            }
        } else if (token == "element") {
            std::string type;
            iss >> type;
            in_vertex_element = (type == "vertex");
            if (in_vertex_element && (!(iss >> num_vertices) || num_vertices < 0)) {
                throw std::runtime_error("Invalid vertex count in " + filepath);
            }
        } else if (token == "property" && in_vertex_element) {
            std::string dtype, name;
            iss >> dtype >> name;
            if (dtype == "list") {
                throw std::runtime_error("List property in vertex element: " + filepath);
            }
            properties.emplace_back(name, dtype);
        } else if (token == "end_header") {
            header_done = true;
            break;
        }
    }

    if (!header_done) {
        throw std::runtime_error("Missing end_header in PLY file: " + filepath);
    }

    auto get_type_size = [](const std::string& dtype) -> size_t {
        if (dtype == "float" || dtype == "float32") return 4;
        if (dtype == "double" || dtype == "float64") return 8;
        if (dtype == "uchar" || dtype == "uint8" || dtype == "char" || dtype == "int8") return 1;
        if (dtype == "ushort" || dtype == "uint16" || dtype == "short" || dtype == "int16") return 2;
        if (dtype == "uint" || dtype == "uint32" || dtype == "int" || dtype == "int32") return 4;
        return 0;
    };

    // Byte offset (binary) and column (ASCII) of x, y, z
    size_t bytes_per_vertex = 0;
    size_t offsets[3] = {0, 0, 0};
    size_t columns[3] = {0, 0, 0};
    bool is_double[3] = {false, false, false};
    bool found[3] = {false, false, false};

    for (size_t col = 0; col < properties.size(); ++col) {
        const auto& [name, dtype] = properties[col];
        const size_t type_size = get_type_size(dtype);
        if (type_size == 0) {
            throw std::runtime_error("Unknown PLY property type '" + dtype + "' in " + filepath);
        }
        int axis = -1;
        if (name == "x") axis = 0;
        else if (name == "y") axis = 1;
        else if (name == "z") axis = 2;
        if (axis >= 0) {
            if (type_size != 4 && type_size != 8) {
                throw std::runtime_error("PLY coordinate '" + name + "' must be float or double: " + filepath);
            }
            offsets[axis] = bytes_per_vertex;
            columns[axis] = col;
            is_double[axis] = (type_size == 8);
            found[axis] = true;
        }
        bytes_per_vertex += type_size;
    }

    if (!found[0] || !found[1] || !found[2]) {
        throw std::runtime_error("PLY file missing x, y, or z properties: " + filepath);
    }

    PointCloud::Matrix points(num_vertices, 3);

    if (is_binary) {
        std::vector<char> buffer(bytes_per_vertex);
        for (int i = 0; i < num_vertices; ++i) {
            if (!file.read(buffer.data(), static_cast<std::streamsize>(bytes_per_vertex))) {
                throw std::runtime_error("Unexpected end of PLY data in " + filepath);
            }
            for (int axis = 0; axis < 3; ++axis) {
                if (is_double[axis]) {
                    double v;
                    std::memcpy(&v, buffer.data() + offsets[axis], sizeof(double));
                    points(i, axis) = v;
                } else {
                    float v;
                    std::memcpy(&v, buffer.data() + offsets[axis], sizeof(float));
                    points(i, axis) = static_cast<double>(v);
                }
            }
        }
    } else {
        std::vector<double> values(properties.size());
        for (int i = 0; i < num_vertices; ++i) {
            if (!std::getline(file, line)) {
                throw std::runtime_error("Unexpected end of PLY data in " + filepath);
            }
            std::istringstream iss(line);
            for (double& v : values) {
                if (!(iss >> v)) {
                    throw std::runtime_error("Malformed PLY vertex " + std::to_string(i) +
                                             " in " + filepath);
                }
            }
            for (int axis = 0; axis < 3; ++axis) {
                points(i, axis) = values[columns[axis]];
            }
        }
    }

    return PointCloud(std::move(points));
}


// ============================================================================
// Transforms
// ============================================================================

std::vector<Transformation> load_transforms(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::vector<double> values;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(clean_line(line));
        std::string token;
        while (iss >> token) {
            size_t used = 0;
            double value = 0.0;
            try {
                value = std::stod(token, &used);
            } catch (const std::logic_error&) {
                used = 0;  // std::invalid_argument / std::out_of_range
            }
            if (used == 0 || used != token.size()) {
                throw std::runtime_error("Invalid number '" + token + "' in " + filepath);
            }
            values.push_back(value);
        }
    }

    if (values.size() % 16 != 0) {
        throw std::runtime_error("Transform file " + filepath + " holds " +
                                 std::to_string(values.size()) +
                                 " numbers, expected a multiple of 16");
    }

    std::vector<Transformation> transforms;
    transforms.reserve(values.size() / 16);
    for (size_t k = 0; k < values.size(); k += 16) {
        Eigen::Matrix4d M;
        for (int r = 0; r < 4; ++r) {
            for (int c = 0; c < 4; ++c) {
                M(r, c) = values[k + static_cast<size_t>(4 * r + c)];
            }
        }
        transforms.emplace_back(M);
    }
    return transforms;
}


// ============================================================================
// Landmarks
// ============================================================================

LandmarkMap load_landmarks(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    LandmarkMap landmarks;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream iss(clean_line(line));
        std::string name;
        if (!(iss >> name)) {
            continue;
        }
        Eigen::Vector3d p;
        if (!(iss >> p.x() >> p.y() >> p.z())) {
            throw std::runtime_error("Malformed landmark at " + filepath + ":" +
                                     std::to_string(line_number));
        }
        landmarks[name] = p;
    }
    return landmarks;
}

} // namespace scapula
