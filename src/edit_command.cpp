/*
 * edit_command.cpp
 *
 *  Created on:  2026-10-19
 */

#include "edit_command.hpp"

#include <sstream>

#include <boost/format.hpp>

EditCommand::EditCommand(EditCommandType type) :
    m_type(type) {
}

/*static*/ EditCommand EditCommand::add_node(const NodeRecord& node) {
    EditCommand command {EditCommandType::ADD_NODE};
    command.m_node = node;
    return command;
}

/*static*/ EditCommand EditCommand::replace_way_nodes(const osmium::object_id_type way_id, id_vector new_nodes,
        id_vector old_nodes) {
    EditCommand command {EditCommandType::REPLACE_WAY_NODES};
    command.m_way_id = way_id;
    command.m_new_nodes = std::move(new_nodes);
    command.m_old_nodes = std::move(old_nodes);
    return command;
}

/*static*/ EditCommand EditCommand::split_way(const WayRecord& parent, const osmium::object_id_type split_node,
        WayRecord first_child, WayRecord second_child) {
    EditCommand command {EditCommandType::SPLIT_WAY};
    command.m_way_id = parent.id;
    command.m_parent = parent;
    command.m_split_node = split_node;
    command.m_first_child = std::move(first_child);
    command.m_second_child = std::move(second_child);
    return command;
}

/*static*/ EditCommand EditCommand::set_tag(const osmium::object_id_type way_id, const std::string& key,
        const std::string& value, boost::optional<std::string> previous_value) {
    EditCommand command {EditCommandType::SET_TAG};
    command.m_way_id = way_id;
    command.m_key = key;
    command.m_value = value;
    command.m_previous_value = std::move(previous_value);
    return command;
}

id_vector EditCommand::referenced_nodes() const {
    id_vector result;
    switch (m_type) {
    case EditCommandType::REPLACE_WAY_NODES:
        result = m_new_nodes;
        break;
    case EditCommandType::SPLIT_WAY:
        result = m_first_child.nodes;
        result.insert(result.end(), m_second_child.nodes.begin(), m_second_child.nodes.end());
        break;
    default:
        break;
    }
    return result;
}

namespace {

    void append_id_list(std::ostringstream& out, const id_vector& ids) {
        for (auto it = ids.begin(); it != ids.end(); ++it) {
            if (it != ids.begin()) {
                out << ',';
            }
            out << *it;
        }
    }

} // anonymous namespace

std::string EditCommand::to_string() const {
    std::ostringstream out;
    switch (m_type) {
    case EditCommandType::ADD_NODE:
        out << boost::format("add_node %1% %2$.7f %3$.7f") % m_node.id % m_node.location.lon() % m_node.location.lat();
        break;
    case EditCommandType::REPLACE_WAY_NODES:
        out << "replace_way_nodes " << m_way_id << ' ';
        append_id_list(out, m_new_nodes);
        break;
    case EditCommandType::SPLIT_WAY:
        out << boost::format("split_way %1% at %2% into %3% %4%") % m_way_id % m_split_node
            % m_first_child.id % m_second_child.id;
        break;
    case EditCommandType::SET_TAG:
        out << "set_tag " << m_way_id << ' ' << m_key << '=' << m_value;
        break;
    }
    return out.str();
}
