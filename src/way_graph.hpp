/*
 * way_graph.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef WAY_GRAPH_HPP_
#define WAY_GRAPH_HPP_

#include <map>

#include "dataset.hpp"

/**
 * \brief Undirected graph of ways. Two ways are adjacent if they share an end node.
 *
 * The graph is built on first use from the state of the dataset at that time. Call invalidate()
 * after the dataset changed.
 */
class WayGraph {
    const Dataset& m_dataset;

    /// restrict the graph to these ways, all live ways if empty
    id_vector m_candidates;

    bool m_built = false;

    /// sorted neighbours of each way
    std::map<osmium::object_id_type, id_vector> m_adjacency;

    void build();

public:
    explicit WayGraph(const Dataset& dataset);

    WayGraph(const Dataset& dataset, id_vector candidates);

    /**
     * Drop the adjacency lists. They will be built again on the next query.
     */
    void invalidate();

    /**
     * Get the ways sharing an end node with the given way, ordered by ID.
     *
     * \throws WayNotFound if the way is not part of the graph
     */
    const id_vector& neighbours(const osmium::object_id_type way_id);

    /**
     * Find a path with the minimal number of ways from one way to another one (breadth-first
     * search). Neighbours are visited in ascending ID order, therefore the result is the same for
     * the same input.
     *
     * \returns all ways of the path including from and to, {from} if both are the same
     *
     * \throws WayNotFound if one of the ways is not part of the graph
     * \throws NoPathFound if the ways are not connected
     */
    id_vector shortest_path(const osmium::object_id_type from, const osmium::object_id_type to);
};

#endif /* WAY_GRAPH_HPP_ */
