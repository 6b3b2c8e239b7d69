/*
 * dataset.cpp
 *
 *  Created on:  2026-10-19
 */

#include "dataset.hpp"

#include <stdexcept>

#include <boost/format.hpp>

#include "bridge_errors.hpp"

namespace {

    bool overlaps(const osmium::Box& a, const osmium::Box& b) {
        return a.bottom_left().x() <= b.top_right().x() && b.bottom_left().x() <= a.top_right().x()
            && a.bottom_left().y() <= b.top_right().y() && b.bottom_left().y() <= a.top_right().y();
    }

} // anonymous namespace

void Dataset::add_node(const NodeRecord& node) {
    if (m_nodes.count(node.id)) {
        return;
    }
    m_nodes.emplace(node.id, node);
    if (node.id <= m_last_node_id) {
        m_last_node_id = node.id;
    }
    if (node.id < m_original_node_floor) {
        m_original_node_floor = node.id;
    }
}

void Dataset::add_way(const WayRecord& way) {
    if (way.nodes.size() < 2) {
        throw std::runtime_error{(boost::format("Way %1% has only %2% nodes.") % way.id % way.nodes.size()).str()};
    }
    if (knows_way(way.id)) {
        throw std::runtime_error{(boost::format("Way %1% exists already.") % way.id).str()};
    }
    check_nodes_exist(way.nodes);
    m_ways.emplace(way.id, way);
    if (way.id <= m_last_way_id) {
        m_last_way_id = way.id;
    }
}

osmium::object_id_type Dataset::allocate_node_id() {
    return --m_last_node_id;
}

osmium::object_id_type Dataset::allocate_way_id() {
    return --m_last_way_id;
}

bool Dataset::is_new_node(const osmium::object_id_type id) const {
    return id < m_original_node_floor;
}

bool Dataset::has_way(const osmium::object_id_type id) const {
    return m_ways.count(id) > 0;
}

bool Dataset::is_retired(const osmium::object_id_type id) const {
    return m_retired.count(id) > 0;
}

bool Dataset::knows_way(const osmium::object_id_type id) const {
    return has_way(id) || is_retired(id);
}

bool Dataset::has_node(const osmium::object_id_type id) const {
    return m_nodes.count(id) > 0;
}

const WayRecord& Dataset::get_way(const osmium::object_id_type id) const {
    auto it = m_ways.find(id);
    if (it == m_ways.end()) {
        if (is_retired(id)) {
            throw WayNotFound{(boost::format("Way %1% was split already.") % id).str()};
        }
        throw WayNotFound{(boost::format("Way %1% is not in the dataset.") % id).str()};
    }
    return it->second;
}

WayRecord& Dataset::get_way_mutable(const osmium::object_id_type id) {
    auto it = m_ways.find(id);
    if (it == m_ways.end()) {
        throw std::runtime_error{(boost::format("Cannot modify way %1%, it is not in the dataset.") % id).str()};
    }
    return it->second;
}

const NodeRecord& Dataset::get_node(const osmium::object_id_type id) const {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        throw std::runtime_error{(boost::format("Node %1% is not in the dataset.") % id).str()};
    }
    return it->second;
}

std::vector<osmium::Location> Dataset::way_locations(const WayRecord& way) const {
    std::vector<osmium::Location> locations;
    locations.reserve(way.nodes.size());
    for (const osmium::object_id_type id : way.nodes) {
        locations.push_back(get_node(id).location);
    }
    return locations;
}

bool Dataset::descends_from(osmium::object_id_type way_id, const osmium::object_id_type ancestor) const {
    while (true) {
        if (way_id == ancestor) {
            return true;
        }
        auto it = m_parents.find(way_id);
        if (it == m_parents.end()) {
            return false;
        }
        way_id = it->second;
    }
}

id_vector Dataset::live_descendants(const osmium::object_id_type id) const {
    if (has_way(id)) {
        return id_vector{id};
    }
    if (!is_retired(id)) {
        throw WayNotFound{(boost::format("Way %1% is not in the dataset.") % id).str()};
    }
    id_vector result;
    for (const auto& way : m_ways) {
        if (descends_from(way.first, id)) {
            result.push_back(way.first);
        }
    }
    return result;
}

id_vector Dataset::search_ways(const osmium::Box& box) const {
    id_vector result;
    for (const auto& way : m_ways) {
        osmium::Box way_box;
        for (const osmium::object_id_type node_id : way.second.nodes) {
            way_box.extend(get_node(node_id).location);
        }
        if (way_box.valid() && overlaps(way_box, box)) {
            result.push_back(way.first);
        }
    }
    return result;
}

id_vector Dataset::way_ids() const {
    id_vector result;
    result.reserve(m_ways.size());
    for (const auto& way : m_ways) {
        result.push_back(way.first);
    }
    return result;
}

void Dataset::check_nodes_exist(const id_vector& nodes) const {
    for (const osmium::object_id_type id : nodes) {
        if (!has_node(id)) {
            throw std::runtime_error{(boost::format("Node %1% is not in the dataset.") % id).str()};
        }
    }
}

void Dataset::insert_way(const WayRecord& way) {
    if (knows_way(way.id)) {
        throw std::runtime_error{(boost::format("Way %1% exists already.") % way.id).str()};
    }
    check_nodes_exist(way.nodes);
    m_ways.emplace(way.id, way);
}

void Dataset::apply(const EditCommand& command) {
    switch (command.type()) {
    case EditCommandType::ADD_NODE:
        if (has_node(command.node().id)) {
            throw std::runtime_error{(boost::format("Node %1% exists already.") % command.node().id).str()};
        }
        m_nodes.emplace(command.node().id, command.node());
        break;
    case EditCommandType::REPLACE_WAY_NODES: {
        if (command.new_nodes().size() < 2) {
            throw std::runtime_error{(boost::format("New node list of way %1% is too short.") % command.way_id()).str()};
        }
        check_nodes_exist(command.new_nodes());
        get_way_mutable(command.way_id()).nodes = command.new_nodes();
        break;
    }
    case EditCommandType::SPLIT_WAY: {
        const osmium::object_id_type parent = command.way_id();
        if (!has_way(parent)) {
            throw std::runtime_error{(boost::format("Cannot split way %1%, it is not in the dataset.") % parent).str()};
        }
        if (knows_way(command.first_child().id) || knows_way(command.second_child().id)) {
            throw std::runtime_error{(boost::format("IDs of the ways created by splitting way %1% are in use.")
                % parent).str()};
        }
        check_nodes_exist(command.first_child().nodes);
        check_nodes_exist(command.second_child().nodes);
        m_ways.erase(parent);
        m_retired.insert(parent);
        insert_way(command.first_child());
        insert_way(command.second_child());
        m_parents[command.first_child().id] = parent;
        m_parents[command.second_child().id] = parent;
        break;
    }
    case EditCommandType::SET_TAG:
        get_way_mutable(command.way_id()).tags[command.key()] = command.value();
        break;
    }
}

void Dataset::revert(const EditCommand& command) {
    switch (command.type()) {
    case EditCommandType::ADD_NODE:
        m_nodes.erase(command.node().id);
        break;
    case EditCommandType::REPLACE_WAY_NODES:
        get_way_mutable(command.way_id()).nodes = command.old_nodes();
        break;
    case EditCommandType::SPLIT_WAY:
        m_ways.erase(command.first_child().id);
        m_ways.erase(command.second_child().id);
        m_parents.erase(command.first_child().id);
        m_parents.erase(command.second_child().id);
        m_retired.erase(command.way_id());
        m_ways.emplace(command.way_id(), command.parent());
        break;
    case EditCommandType::SET_TAG: {
        WayRecord& way = get_way_mutable(command.way_id());
        if (command.previous_value()) {
            way.tags[command.key()] = command.previous_value().get();
        } else {
            way.tags.erase(command.key());
        }
        break;
    }
    }
}
