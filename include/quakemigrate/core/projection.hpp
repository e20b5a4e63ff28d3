#pragma once

#include "types.hpp"
#include <memory>

namespace quakemigrate {

/**
 * Projection - Geographic to grid Cartesian coordinates (km)
 */
class Projection {
public:
    virtual ~Projection() = default;

    virtual Point3 forward(const GeoPoint& geo) const = 0;
    virtual GeoPoint inverse(const Point3& xyz) const = 0;
};

using ProjectionPtr = std::shared_ptr<Projection>;

/**
 * LocalTangentProjection - Equirectangular projection about a reference
 * point. Adequate for grids a few hundred km across.
 */
class LocalTangentProjection : public Projection {
public:
    LocalTangentProjection(double ref_latitude, double ref_longitude);

    Point3 forward(const GeoPoint& geo) const override;
    GeoPoint inverse(const Point3& xyz) const override;

    double referenceLatitude() const { return ref_lat_; }
    double referenceLongitude() const { return ref_lon_; }

private:
    double ref_lat_;
    double ref_lon_;
    double km_per_deg_lon_;
};

} // namespace quakemigrate
