/*
 * way_graph.cpp
 *
 *  Created on:  2026-10-19
 */

#include "way_graph.hpp"

#include <algorithm>
#include <queue>

#include <boost/format.hpp>

#include "bridge_errors.hpp"

WayGraph::WayGraph(const Dataset& dataset) :
    m_dataset(dataset),
    m_candidates() {
}

WayGraph::WayGraph(const Dataset& dataset, id_vector candidates) :
    m_dataset(dataset),
    m_candidates(std::move(candidates)) {
}

void WayGraph::invalidate() {
    m_adjacency.clear();
    m_built = false;
}

void WayGraph::build() {
    const id_vector ways = m_candidates.empty() ? m_dataset.way_ids() : m_candidates;
    // end node -> ways starting or ending there
    std::map<osmium::object_id_type, id_vector> ways_at_end;
    for (const osmium::object_id_type id : ways) {
        if (!m_dataset.has_way(id)) {
            continue;
        }
        const WayRecord& way = m_dataset.get_way(id);
        m_adjacency[id];
        ways_at_end[way.front()].push_back(id);
        if (way.back() != way.front()) {
            ways_at_end[way.back()].push_back(id);
        }
    }
    for (const auto& end : ways_at_end) {
        const id_vector& members = end.second;
        for (const osmium::object_id_type a : members) {
            for (const osmium::object_id_type b : members) {
                if (a != b) {
                    m_adjacency[a].push_back(b);
                }
            }
        }
    }
    for (auto& entry : m_adjacency) {
        id_vector& list = entry.second;
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
    m_built = true;
}

const id_vector& WayGraph::neighbours(const osmium::object_id_type way_id) {
    if (!m_built) {
        build();
    }
    auto it = m_adjacency.find(way_id);
    if (it == m_adjacency.end()) {
        throw WayNotFound{(boost::format("Way %1% is not part of the way graph.") % way_id).str()};
    }
    return it->second;
}

id_vector WayGraph::shortest_path(const osmium::object_id_type from, const osmium::object_id_type to) {
    neighbours(from);
    neighbours(to);
    if (from == to) {
        return id_vector{from};
    }
    // way -> way it was reached from
    std::map<osmium::object_id_type, osmium::object_id_type> predecessors;
    predecessors.emplace(from, from);
    std::queue<osmium::object_id_type> queue;
    queue.push(from);
    while (!queue.empty()) {
        const osmium::object_id_type current = queue.front();
        queue.pop();
        for (const osmium::object_id_type next : m_adjacency[current]) {
            if (predecessors.count(next)) {
                continue;
            }
            predecessors.emplace(next, current);
            if (next == to) {
                id_vector path {to};
                osmium::object_id_type step = current;
                while (step != from) {
                    path.push_back(step);
                    step = predecessors[step];
                }
                path.push_back(from);
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push(next);
        }
    }
    throw NoPathFound{(boost::format("Ways %1% and %2% are not connected.") % from % to).str()};
}
