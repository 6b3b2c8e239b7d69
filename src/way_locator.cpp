/*
 * way_locator.cpp
 *
 *  Created on:  2026-10-19
 */

#include "way_locator.hpp"

#include <boost/format.hpp>

#include "bridge_errors.hpp"

WayLocator::WayLocator(const Dataset& dataset, const GeometryProjector& projector, const double radius) :
    m_dataset(dataset),
    m_projector(projector),
    m_radius(radius) {
}

WayMatch WayLocator::nearest_of(const id_vector& ways, const osmium::Location& location) const {
    WayMatch best {0, ProjectionResult{0, osmium::Location{}, 0.0}};
    bool found = false;
    for (const osmium::object_id_type id : ways) {
        const WayRecord& way = m_dataset.get_way(id);
        try {
            ProjectionResult projection = m_projector.project(m_dataset.way_locations(way), location);
            if (!found || projection.distance < best.projection.distance) {
                best.way_id = id;
                best.projection = projection;
                found = true;
            }
        } catch (NoSegmentFound&) {
            // degenerated geometry, try the next way
        }
    }
    if (!found) {
        throw WayNotFound{(boost::format("None of %1% ways can be matched to (%2%, %3%).")
            % ways.size() % location.lon() % location.lat()).str()};
    }
    return best;
}

WayMatch WayLocator::nearest_way(const osmium::Location& location) const {
    if (!location.valid()) {
        throw WayNotFound{"Cannot search ways around an invalid location."};
    }
    const id_vector ways = m_dataset.search_ways(CoordinateService::box_around(location, m_radius));
    if (ways.empty()) {
        throw WayNotFound{(boost::format("No way within %1% m of (%2%, %3%).")
            % m_radius % location.lon() % location.lat()).str()};
    }
    WayMatch match = nearest_of(ways, location);
    if (match.projection.distance > m_radius) {
        throw WayNotFound{(boost::format("Nearest way %1% is %2$.2f m away from (%3%, %4%), more than %5% m.")
            % match.way_id % match.projection.distance % location.lon() % location.lat() % m_radius).str()};
    }
    return match;
}

osmium::object_id_type WayLocator::resolve_hint(const osmium::object_id_type hint,
        const osmium::Location& location) const {
    const id_vector descendants = m_dataset.live_descendants(hint);
    if (descendants.empty()) {
        throw WayNotFound{(boost::format("Way %1% has no remaining parts.") % hint).str()};
    }
    if (descendants.size() == 1 || !location.valid()) {
        return descendants.front();
    }
    return nearest_of(descendants, location).way_id;
}
