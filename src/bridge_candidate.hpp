/*
 * bridge_candidate.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef BRIDGE_CANDIDATE_HPP_
#define BRIDGE_CANDIDATE_HPP_

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <osmium/osm/location.hpp>

#include "definitions.hpp"

/**
 * One end of a bridge. The location is empty if the end is unknown (missing endpoint).
 */
struct BridgeEndpoint {
    boost::optional<osmium::Location> location;

    /// way the endpoint is expected on, empty if unknown
    boost::optional<osmium::object_id_type> way_hint;

    bool missing() const {
        return !location;
    }
};

/**
 * A bridge which should be tagged.
 */
struct BridgeCandidate {
    std::string bridge_id;

    /// one or two endpoints, start first
    std::vector<BridgeEndpoint> endpoints;

    /// ways between the ways of the two endpoints, they belong to the bridge completely
    id_vector chain;
};

#endif /* BRIDGE_CANDIDATE_HPP_ */
