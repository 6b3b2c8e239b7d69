/*
 * way_split_engine.cpp
 *
 *  Created on:  2026-10-19
 */

#include "way_split_engine.hpp"

#include <algorithm>
#include <iostream>

#include <boost/format.hpp>

#include "bridge_errors.hpp"

WaySplitEngine::WaySplitEngine(Dataset& dataset, CommandLog& log, const GeometryProjector& projector,
        const BridgeSplitConfig& config) :
    m_dataset(dataset),
    m_log(log),
    m_projector(projector),
    m_config(config) {
}

tag_map WaySplitEngine::inherited_tags(const tag_map& tags) const {
    tag_map result;
    for (const auto& tag : tags) {
        if (std::find(m_config.m_identity_tag_keys.begin(), m_config.m_identity_tag_keys.end(), tag.first)
                == m_config.m_identity_tag_keys.end()) {
            result.insert(tag);
        }
    }
    return result;
}

SplitResult WaySplitEngine::insert(const osmium::object_id_type way_id, const osmium::Location& location) {
    // copy, the record is replaced by the commands below
    const WayRecord way = m_dataset.get_way(way_id);
    const std::vector<osmium::Location> locations = m_dataset.way_locations(way);
    const ProjectionResult projection = m_projector.project(locations, location);
    for (std::size_t i = 0; i < locations.size(); ++i) {
        if (locations[i] == projection.location) {
            throw SegmentTooShort{(boost::format("(%1%, %2%) projects onto node %3% of way %4%.")
                % location.lon() % location.lat() % way.nodes[i] % way_id).str()};
        }
    }

    const std::size_t split_index = projection.segment_index + 1;
    const NodeRecord node {m_dataset.allocate_node_id(), projection.location};
    id_vector new_nodes {way.nodes};
    new_nodes.insert(new_nodes.begin() + split_index, node.id);

    m_log.execute(EditCommand::add_node(node), m_dataset);
    m_log.execute(EditCommand::replace_way_nodes(way_id, new_nodes, way.nodes), m_dataset);

    const tag_map tags = inherited_tags(way.tags);
    WayRecord first {m_dataset.allocate_way_id(), id_vector(new_nodes.begin(), new_nodes.begin() + split_index + 1), tags};
    WayRecord second {m_dataset.allocate_way_id(), id_vector(new_nodes.begin() + split_index, new_nodes.end()), tags};
    SplitResult result {node, projection.segment_index, projection.distance, way_id, first.id, second.id};
    m_log.execute(EditCommand::split_way(m_dataset.get_way(way_id), node.id, std::move(first), std::move(second)),
        m_dataset);

    if (m_config.m_verbose) {
        std::cerr << boost::format("Inserted node %1% at (%2$.7f, %3$.7f) into segment %4% of way %5%, new ways %6% and %7%\n")
            % node.id % node.location.lon() % node.location.lat() % projection.segment_index % way_id
            % result.first_child % result.second_child;
    }
    return result;
}
