/*
 * way_split_engine.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef WAY_SPLIT_ENGINE_HPP_
#define WAY_SPLIT_ENGINE_HPP_

#include <cstddef>

#include "bridgesplit_config.hpp"
#include "command_log.hpp"
#include "dataset.hpp"
#include "geometry_projector.hpp"

/**
 * Result of the insertion of a node into a way.
 */
struct SplitResult {
    /// the new node
    NodeRecord node;

    /// segment of the split way the node was inserted into
    std::size_t segment_index;

    /// distance between the requested location and the new node
    double distance;

    /// the way which has been split (retired now)
    osmium::object_id_type parent;

    /// new way from the first node of the parent to the new node
    osmium::object_id_type first_child;

    /// new way from the new node to the last node of the parent
    osmium::object_id_type second_child;
};

/**
 * \brief Inserts nodes into ways and splits the ways at the new nodes.
 *
 * Each insertion appends the commands ADD_NODE, REPLACE_WAY_NODES and SPLIT_WAY (in this order)
 * to the command log and applies them to the dataset.
 */
class WaySplitEngine {
    Dataset& m_dataset;
    CommandLog& m_log;
    const GeometryProjector& m_projector;
    const BridgeSplitConfig& m_config;

    /**
     * Copy the tags of a way except the identity tags.
     */
    tag_map inherited_tags(const tag_map& tags) const;

public:
    WaySplitEngine(Dataset& dataset, CommandLog& log, const GeometryProjector& projector,
            const BridgeSplitConfig& config);

    /**
     * Insert a new node at the point of the way closest to the location and split the way there.
     *
     * \throws WayNotFound if the way is not live (e.g. because it has been split already)
     * \throws NoSegmentFound if the location cannot be projected onto the way
     * \throws SegmentTooShort if the projected location coincides with a node of the way
     */
    SplitResult insert(const osmium::object_id_type way_id, const osmium::Location& location);
};

#endif /* WAY_SPLIT_ENGINE_HPP_ */
