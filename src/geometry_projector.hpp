/*
 * geometry_projector.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef GEOMETRY_PROJECTOR_HPP_
#define GEOMETRY_PROJECTOR_HPP_

#include <cstddef>
#include <vector>

#include <osmium/osm/location.hpp>

#include "coordinate_service.hpp"

/**
 * Result of the projection of a point onto a polyline.
 */
struct ProjectionResult {
    /// index of the first vertex of the closest segment
    std::size_t segment_index;

    /// closest point on that segment (WGS84)
    osmium::Location location;

    /// great circle distance in meters between the query point and location
    double distance;
};

/**
 * Projects a point onto the nearest segment of a polyline.
 *
 * The projection onto each segment is done in the planar system of the CoordinateService
 * (clamped to the segment), the distance is measured on the sphere.
 */
class GeometryProjector {
    const CoordinateService& m_coordinates;

public:
    explicit GeometryProjector(const CoordinateService& coordinates) noexcept;

    /**
     * Find the segment of the polyline with the smallest distance to the query point.
     *
     * Ties are resolved to the segment with the lowest index. Segments with an invalid vertex,
     * segments of length zero and segments with an undefined distance are ignored.
     *
     * \param polyline vertices of the polyline
     * \param point query point
     *
     * \throws NoSegmentFound if the polyline has less than two vertices or no segment has a defined
     * distance
     */
    ProjectionResult project(const std::vector<osmium::Location>& polyline, const osmium::Location& point) const;
};

#endif /* GEOMETRY_PROJECTOR_HPP_ */
