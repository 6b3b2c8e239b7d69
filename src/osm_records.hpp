/*
 * osm_records.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef OSM_RECORDS_HPP_
#define OSM_RECORDS_HPP_

#include <string>
#include <utility>

#include <osmium/osm/location.hpp>
#include <osmium/osm/types.hpp>

#include "definitions.hpp"

/**
 * A node of the in-memory dataset.
 */
struct NodeRecord {
    osmium::object_id_type id;
    osmium::Location location;

    NodeRecord() :
        id(0),
        location() {
    }

    NodeRecord(const osmium::object_id_type node_id, const osmium::Location& node_location) :
        id(node_id),
        location(node_location) {
    }
};

/**
 * A way of the in-memory dataset.
 *
 * Ways are never changed in place by the split engine. A split retires the way and creates two
 * new ways.
 */
struct WayRecord {
    osmium::object_id_type id;

    /// IDs of the nodes, at least two
    id_vector nodes;

    tag_map tags;

    WayRecord() :
        id(0),
        nodes(),
        tags() {
    }

    WayRecord(const osmium::object_id_type way_id, id_vector way_nodes, tag_map way_tags) :
        id(way_id),
        nodes(std::move(way_nodes)),
        tags(std::move(way_tags)) {
    }

    osmium::object_id_type front() const {
        return nodes.front();
    }

    osmium::object_id_type back() const {
        return nodes.back();
    }

    /// Check if the two end nodes of the way are exactly the given ones (in any order).
    bool has_ends(const osmium::object_id_type a, const osmium::object_id_type b) const {
        return (front() == a && back() == b) || (front() == b && back() == a);
    }

    /// Get value of a tag or nullptr if the way does not have this key.
    const char* get_value_by_key(const std::string& key) const {
        auto it = tags.find(key);
        if (it == tags.end()) {
            return nullptr;
        }
        return it->second.c_str();
    }
};

#endif /* OSM_RECORDS_HPP_ */
