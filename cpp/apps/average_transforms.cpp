#include <iostream>
#include <string>

#include "scapula.hpp"
#include "common/icp_options.hpp"
#include "common/report.hpp"

int main(int argc, char* argv[]) {
    try {
        const scapula_apps::Options options = scapula_apps::parse_options(argc, argv);
        if (options.positional.size() != 1) {
            std::cerr << "Usage: " << argv[0] << " <transforms.txt> [options]\n";
            scapula_apps::print_averaging_usage(std::cerr);
            return 1;
        }

        scapula::TransformCollection collection;
        collection.label = options.positional[0];
        collection.transforms = scapula::load_transforms(options.positional[0]);

        for (size_t i = 0; i < collection.transforms.size(); ++i) {
            if (!collection.transforms[i].is_rigid(1e-6)) {
                std::cerr << "Warning: transform " << i << " is not rigid to 1e-6\n";
            }
        }

        const scapula::AveragingResult average =
            scapula::average_transforms(collection, options.averaging);

        scapula_apps::print_average(collection.label, collection.transforms.size(), average);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
