#include "quakemigrate/core/projection.hpp"
#include <cmath>

namespace quakemigrate {

LocalTangentProjection::LocalTangentProjection(double ref_latitude, double ref_longitude)
    : ref_lat_(ref_latitude)
    , ref_lon_(ref_longitude)
    , km_per_deg_lon_(constants::KM_PER_DEG * std::cos(ref_latitude * constants::DEG_TO_RAD))
{
}

Point3 LocalTangentProjection::forward(const GeoPoint& geo) const {
    double dlon = geo.longitude - ref_lon_;
    if (dlon > 180.0) dlon -= 360.0;
    if (dlon < -180.0) dlon += 360.0;
    return Point3(dlon * km_per_deg_lon_,
                  (geo.latitude - ref_lat_) * constants::KM_PER_DEG,
                  geo.depth);
}

GeoPoint LocalTangentProjection::inverse(const Point3& xyz) const {
    double lon = ref_lon_ + (km_per_deg_lon_ != 0 ? xyz.x / km_per_deg_lon_ : 0.0);
    if (lon > 180.0) lon -= 360.0;
    if (lon < -180.0) lon += 360.0;
    return GeoPoint(ref_lat_ + xyz.y / constants::KM_PER_DEG, lon, xyz.z);
}

} // namespace quakemigrate
