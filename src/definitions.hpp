/*
 * definitions.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef DEFINITIONS_HPP_
#define DEFINITIONS_HPP_

#include <map>
#include <string>
#include <vector>

#include <osmium/index/map.hpp>
#include <osmium/handler/node_locations_for_ways.hpp>
#include <osmium/osm/types.hpp>

using index_type = osmium::index::map::Map<osmium::unsigned_object_id_type, osmium::Location>;
/// positive and negative node IDs are stored in separate indexes
using location_handler_type = osmium::handler::NodeLocationsForWays<index_type, index_type>;

/// tags of a way, keys are unique
using tag_map = std::map<std::string, std::string>;

using id_vector = std::vector<osmium::object_id_type>;

#endif /* DEFINITIONS_HPP_ */
