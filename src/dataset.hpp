/*
 * dataset.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef DATASET_HPP_
#define DATASET_HPP_

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include <osmium/osm/box.hpp>

#include "command_target.hpp"
#include "osm_records.hpp"

/**
 * \brief In-memory arena of the nodes and ways of the road network.
 *
 * The dataset is filled once while reading the input file. Afterwards it is only modified by
 * applying edit commands. Ways retired by a split are kept in a lineage map to be able to
 * resolve way IDs referring to them.
 */
class Dataset : public CommandTarget {
    std::map<osmium::object_id_type, NodeRecord> m_nodes;

    /// live ways
    std::map<osmium::object_id_type, WayRecord> m_ways;

    /// ways which have been split, they are not part of the dataset any more
    std::set<osmium::object_id_type> m_retired;

    /// lineage of ways created by splits, child -> parent
    std::map<osmium::object_id_type, osmium::object_id_type> m_parents;

    /// last ID handed out for a new node, new IDs are negative
    osmium::object_id_type m_last_node_id = 0;

    /// last ID handed out for a new way
    osmium::object_id_type m_last_way_id = 0;

    /// smallest node ID of the original data (or 0), all IDs handed out for new nodes are below it
    osmium::object_id_type m_original_node_floor = 0;

    WayRecord& get_way_mutable(const osmium::object_id_type id);

    void insert_way(const WayRecord& way);

    void check_nodes_exist(const id_vector& nodes) const;

public:
    using way_map = std::map<osmium::object_id_type, WayRecord>;

    Dataset() = default;

    /**
     * Add a node while loading the dataset. Adding a node with an ID which exists already is
     * ignored.
     */
    void add_node(const NodeRecord& node);

    /**
     * Add a way while loading the dataset.
     *
     * \throws std::runtime_error if the way has less than two nodes, a node is unknown or the ID
     * is taken
     */
    void add_way(const WayRecord& way);

    /// Get an unused ID for a new node (negative, counting down).
    osmium::object_id_type allocate_node_id();

    /// Get an unused ID for a new way (negative, counting down).
    osmium::object_id_type allocate_way_id();

    bool has_way(const osmium::object_id_type id) const;

    bool is_retired(const osmium::object_id_type id) const;

    /// Check if the way is live or has been live before it was split.
    bool knows_way(const osmium::object_id_type id) const;

    bool has_node(const osmium::object_id_type id) const;

    /**
     * \throws WayNotFound if there is no live way with this ID
     */
    const WayRecord& get_way(const osmium::object_id_type id) const;

    /**
     * \throws std::runtime_error if there is no node with this ID
     */
    const NodeRecord& get_node(const osmium::object_id_type id) const;

    /**
     * Get the locations of the nodes of a way in their order.
     */
    std::vector<osmium::Location> way_locations(const WayRecord& way) const;

    /**
     * Check if a live way descends from a way (or is this way).
     */
    bool descends_from(const osmium::object_id_type way_id, const osmium::object_id_type ancestor) const;

    /**
     * Get all live ways which descend from a way, ordered by ID. If the way itself is live, the
     * result contains only this way.
     *
     * \throws WayNotFound if the way has never been part of the dataset
     */
    id_vector live_descendants(const osmium::object_id_type id) const;

    /**
     * Get the IDs of all live ways whose bounding box overlaps the given box, ordered by ID.
     */
    id_vector search_ways(const osmium::Box& box) const;

    /// IDs of all live ways, ordered
    id_vector way_ids() const;

    const way_map& ways() const noexcept {
        return m_ways;
    }

    const std::map<osmium::object_id_type, NodeRecord>& nodes() const noexcept {
        return m_nodes;
    }

    std::size_t way_count() const noexcept {
        return m_ways.size();
    }

    std::size_t node_count() const noexcept {
        return m_nodes.size();
    }

    void apply(const EditCommand& command) override;

    void revert(const EditCommand& command) override;

    /**
     * Check if the node ID has been handed out by allocate_node_id(). Original data may contain
     * negative IDs, too (e.g. new objects saved by an editor).
     */
    bool is_new_node(const osmium::object_id_type id) const override;
};

#endif /* DATASET_HPP_ */
