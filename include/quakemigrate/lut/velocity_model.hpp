#pragma once

#include "quakemigrate/core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quakemigrate {

/**
 * VelocityModel - Seismic velocity as a function of phase and position
 */
class VelocityModel {
public:
    virtual ~VelocityModel() = default;

    // Velocity in km/s at a point (z is depth, km)
    virtual double velocity(PhaseType phase, const Point3& p) const = 0;

    // True when travel times are straight-line distance / velocity
    virtual bool isHomogeneous() const { return false; }

    virtual std::string name() const = 0;
};

using VelocityModelPtr = std::shared_ptr<VelocityModel>;

/**
 * HomogeneousVelocityModel - One velocity per phase everywhere
 */
class HomogeneousVelocityModel : public VelocityModel {
public:
    HomogeneousVelocityModel(double vp, double vs) : vp_(vp), vs_(vs) {}

    double velocity(PhaseType phase, const Point3&) const override {
        return phase == PhaseType::S ? vs_ : vp_;
    }

    bool isHomogeneous() const override { return true; }
    std::string name() const override { return "homogeneous"; }

    double vp() const { return vp_; }
    double vs() const { return vs_; }

private:
    double vp_;
    double vs_;
};

/**
 * Layer in a 1D velocity model
 */
struct VelocityLayer {
    double top_depth;     // km
    double vp;            // P velocity (km/s)
    double vs;            // S velocity (km/s)

    VelocityLayer() : top_depth(0), vp(6.0), vs(3.5) {}
    VelocityLayer(double depth, double vp_, double vs_)
        : top_depth(depth), vp(vp_), vs(vs_) {}

    double vpvs() const { return vs > 0 ? vp / vs : 1.73; }
};

/**
 * VelocityModel1D - 1D layered velocity model
 *
 * Each layer extends from its top depth to the top of the next one; the
 * last layer is a halfspace. Points above the first layer take its values.
 */
class VelocityModel1D : public VelocityModel {
public:
    VelocityModel1D() = default;
    explicit VelocityModel1D(const std::string& name) : name_(name) {}

    void addLayer(const VelocityLayer& layer);
    void addLayer(double depth, double vp, double vs) {
        addLayer(VelocityLayer(depth, vp, vs));
    }

    const std::vector<VelocityLayer>& layers() const { return layers_; }
    size_t layerCount() const { return layers_.size(); }

    double vpAt(double depth) const {
        return layers_.empty() ? 6.0 : layers_[layerIndexAt(depth)].vp;
    }
    double vsAt(double depth) const {
        return layers_.empty() ? 3.5 : layers_[layerIndexAt(depth)].vs;
    }
    size_t layerIndexAt(double depth) const;

    double velocity(PhaseType phase, const Point3& p) const override {
        return phase == PhaseType::S ? vsAt(p.z) : vpAt(p.z);
    }

    bool isHomogeneous() const override { return layers_.size() <= 1; }
    std::string name() const override { return name_.empty() ? "layered" : name_; }

    // Rows of "top_depth vp vs"; '#' starts a comment
    bool loadFromFile(const std::string& filename);

private:
    std::string name_;
    std::vector<VelocityLayer> layers_;
};

} // namespace quakemigrate
