#include "quakemigrate/lut/velocity_model.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace quakemigrate {

void VelocityModel1D::addLayer(const VelocityLayer& layer) {
    layers_.push_back(layer);
    std::stable_sort(layers_.begin(), layers_.end(),
        [](const VelocityLayer& a, const VelocityLayer& b) {
            return a.top_depth < b.top_depth;
        });
}

size_t VelocityModel1D::layerIndexAt(double depth) const {
    size_t idx = 0;
    for (size_t i = 1; i < layers_.size(); i++) {
        if (depth >= layers_[i].top_depth) idx = i;
        else break;
    }
    return idx;
}

bool VelocityModel1D::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open velocity model: " << filename << std::endl;
        return false;
    }

    std::vector<VelocityLayer> loaded;
    std::string line;
    int line_no = 0;

    while (std::getline(file, line)) {
        line_no++;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::istringstream iss(line);
        double depth, vp, vs;
        if (!(iss >> depth >> vp >> vs)) {
            std::cerr << "Velocity model " << filename << ":" << line_no
                      << ": expected 'top_depth vp vs'" << std::endl;
            return false;
        }
        if (vp <= 0 || vs <= 0) {
            std::cerr << "Velocity model " << filename << ":" << line_no
                      << ": velocities must be positive" << std::endl;
            return false;
        }
        loaded.emplace_back(depth, vp, vs);
    }

    if (loaded.empty()) {
        std::cerr << "Velocity model " << filename << " has no layers" << std::endl;
        return false;
    }

    layers_.clear();
    for (const auto& layer : loaded) addLayer(layer);

    std::cout << "Loaded velocity model with " << layers_.size()
              << " layers from " << filename << std::endl;
    return true;
}

} // namespace quakemigrate
