/*
 * geometry_projector.cpp
 *
 *  Created on:  2026-10-19
 */

#include "geometry_projector.hpp"

#include <cmath>
#include <limits>

#include <boost/format.hpp>
#include <geos/geom/Coordinate.h>
#include <geos/geom/LineSegment.h>

#include "bridge_errors.hpp"

GeometryProjector::GeometryProjector(const CoordinateService& coordinates) noexcept :
    m_coordinates(coordinates) {
}

ProjectionResult GeometryProjector::project(const std::vector<osmium::Location>& polyline,
        const osmium::Location& point) const {
    if (polyline.size() < 2) {
        throw NoSegmentFound{(boost::format("Polyline has %1% vertices, at least two are required.")
            % polyline.size()).str()};
    }
    if (!point.valid()) {
        throw NoSegmentFound{"Query point has an invalid location."};
    }
    const osmium::geom::Coordinates query_planar = m_coordinates.to_planar(point);
    const geos::geom::Coordinate query {query_planar.x, query_planar.y};

    ProjectionResult result {0, osmium::Location{}, std::numeric_limits<double>::infinity()};
    bool found = false;
    for (std::size_t i = 0; i + 1 < polyline.size(); ++i) {
        if (!polyline[i].valid() || !polyline[i + 1].valid()) {
            continue;
        }
        const osmium::geom::Coordinates c1 = m_coordinates.to_planar(polyline[i]);
        const osmium::geom::Coordinates c2 = m_coordinates.to_planar(polyline[i + 1]);
        if (c1 == c2) {
            // zero length, the projection is undefined
            continue;
        }
        const geos::geom::LineSegment segment {geos::geom::Coordinate{c1.x, c1.y}, geos::geom::Coordinate{c2.x, c2.y}};
        geos::geom::Coordinate closest;
        segment.closestPoint(query, closest);
        const osmium::Location closest_location = m_coordinates.to_geographic(osmium::geom::Coordinates{closest.x, closest.y});
        const double distance = m_coordinates.great_circle_distance(point, closest_location);
        if (std::isnan(distance)) {
            continue;
        }
        // strict comparison, the first segment wins ties
        if (!found || distance < result.distance) {
            result.segment_index = i;
            result.location = closest_location;
            result.distance = distance;
            found = true;
        }
    }
    if (!found) {
        throw NoSegmentFound{(boost::format("None of the %1% segments has a defined distance to (%2%, %3%).")
            % (polyline.size() - 1) % point.lon() % point.lat()).str()};
    }
    return result;
}
