#include <iomanip>
#include <iostream>
#include <string>

#include "scapula.hpp"

/**
 * Print every registered scapula coordinate system for a landmark file and,
 * with two extra names, the transform between them.
 */
int main(int argc, char* argv[]) {
    if (argc != 2 && argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <landmarks.txt> [FROM TO]\n";
        return 1;
    }

    try {
        const scapula::LandmarkMap landmarks = scapula::load_landmarks(argv[1]);
        const scapula::CoordinateSystemRegistry registry =
            scapula::CoordinateSystemRegistry::scapula_defaults();

        std::cout << "Landmarks: " << landmarks.size() << "\n";
        std::cout << std::fixed << std::setprecision(4);

        for (const auto& name : registry.names()) {
            std::cout << "\n" << name << ":\n";
            try {
                std::cout << registry.compute(name, landmarks).matrix() << "\n";
            } catch (const std::out_of_range& e) {
                std::cout << "  unavailable (" << e.what() << ")\n";
            }
        }

        if (argc == 4) {
            std::cout << "\n" << argv[2] << " -> " << argv[3] << ":\n"
                      << registry.relative(argv[2], argv[3], landmarks).matrix() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
