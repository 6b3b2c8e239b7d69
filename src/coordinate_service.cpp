/*
 * coordinate_service.cpp
 *
 *  Created on:  2026-10-19
 */

#include "coordinate_service.hpp"

#include <algorithm>
#include <cmath>

#include <osmium/geom/haversine.hpp>
#include <osmium/geom/mercator_projection.hpp>
#include <osmium/geom/util.hpp>

namespace {

    double clamp(const double value, const double min, const double max) {
        return std::max(min, std::min(max, value));
    }

} // anonymous namespace

/*static*/ osmium::Box CoordinateService::box_around(const osmium::Location& center, const double meters) {
    const double lat_diff = osmium::geom::rad_to_deg(meters / osmium::geom::haversine::EARTH_RADIUS_IN_METERS);
    const double cos_lat = std::cos(osmium::geom::deg_to_rad(center.lat()));
    // The box spans all longitudes near the poles.
    double lon_diff = 180.0;
    if (cos_lat > 1e-9) {
        lon_diff = std::min(180.0, osmium::geom::rad_to_deg(meters / (osmium::geom::haversine::EARTH_RADIUS_IN_METERS
            * cos_lat)));
    }
    // Corners outside the valid range would be ignored by Box::extend.
    osmium::Box box;
    box.extend(osmium::Location{clamp(center.lon() - lon_diff, -180.0, 180.0),
        clamp(center.lat() - lat_diff, -90.0, 90.0)});
    box.extend(osmium::Location{clamp(center.lon() + lon_diff, -180.0, 180.0),
        clamp(center.lat() + lat_diff, -90.0, 90.0)});
    return box;
}

osmium::geom::Coordinates MercatorCoordinateService::to_planar(const osmium::Location& location) const {
    return osmium::geom::lonlat_to_mercator(osmium::geom::Coordinates{location});
}

osmium::Location MercatorCoordinateService::to_geographic(const osmium::geom::Coordinates& planar) const {
    const osmium::geom::Coordinates result = osmium::geom::mercator_to_lonlat(planar);
    return osmium::Location{result.x, result.y};
}

double MercatorCoordinateService::great_circle_distance(const osmium::Location& a, const osmium::Location& b) const {
    return osmium::geom::haversine::distance(osmium::geom::Coordinates{a}, osmium::geom::Coordinates{b});
}
