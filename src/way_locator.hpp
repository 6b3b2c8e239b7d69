/*
 * way_locator.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef WAY_LOCATOR_HPP_
#define WAY_LOCATOR_HPP_

#include "dataset.hpp"
#include "geometry_projector.hpp"

/**
 * A way close to a location.
 */
struct WayMatch {
    osmium::object_id_type way_id;
    ProjectionResult projection;
};

/**
 * \brief Resolves locations and way IDs given by the user to live ways of the dataset.
 */
class WayLocator {
    const Dataset& m_dataset;
    const GeometryProjector& m_projector;

    /// maximum distance (meters) of a way to a location
    double m_radius;

    /**
     * Get the way of a list which is nearest to the location. Ways the location cannot be
     * projected onto are ignored, ties are resolved to the first way of the list.
     *
     * \throws WayNotFound if the location cannot be projected onto any of the ways
     */
    WayMatch nearest_of(const id_vector& ways, const osmium::Location& location) const;

public:
    WayLocator(const Dataset& dataset, const GeometryProjector& projector, const double radius);

    /**
     * Find the live way nearest to a location.
     *
     * \throws WayNotFound if there is no way within the search radius
     */
    WayMatch nearest_way(const osmium::Location& location) const;

    /**
     * Resolve a way ID to a live way.
     *
     * If the way has been split, the live descendant nearest to the location is returned. If the
     * location is invalid, the descendant with the lowest ID is returned.
     *
     * \throws WayNotFound if the way has never been part of the dataset
     */
    osmium::object_id_type resolve_hint(const osmium::object_id_type hint, const osmium::Location& location) const;
};

#endif /* WAY_LOCATOR_HPP_ */
