/*
 * coordinate_service.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef COORDINATE_SERVICE_HPP_
#define COORDINATE_SERVICE_HPP_

#include <osmium/geom/coordinates.hpp>
#include <osmium/osm/box.hpp>
#include <osmium/osm/location.hpp>

/**
 * \brief Abstract class for conversions between geographic and planar coordinates.
 *
 * Projections onto segments are calculated in the planar system, distances are measured on the
 * sphere.
 */
class CoordinateService {
public:
    virtual ~CoordinateService() {
    }

    /**
     * Convert a geographic location (WGS84) into the planar coordinate system.
     */
    virtual osmium::geom::Coordinates to_planar(const osmium::Location& location) const = 0;

    /**
     * Convert planar coordinates back into a geographic location.
     */
    virtual osmium::Location to_geographic(const osmium::geom::Coordinates& planar) const = 0;

    /**
     * Great circle distance in meters between two locations.
     */
    virtual double great_circle_distance(const osmium::Location& a, const osmium::Location& b) const = 0;

    /**
     * Get a box around a location which extends the given distance in all four directions.
     *
     * \param center center of the box
     * \param meters distance from the center to the borders of the box
     */
    static osmium::Box box_around(const osmium::Location& center, const double meters);
};

/**
 * Spherical Mercator (EPSG:3857) as planar system, haversine formula for distances.
 */
class MercatorCoordinateService : public CoordinateService {
public:
    osmium::geom::Coordinates to_planar(const osmium::Location& location) const override;

    osmium::Location to_geographic(const osmium::geom::Coordinates& planar) const override;

    double great_circle_distance(const osmium::Location& a, const osmium::Location& b) const override;
};

#endif /* COORDINATE_SERVICE_HPP_ */
