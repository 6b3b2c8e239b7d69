/*
 * edit_command.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef EDIT_COMMAND_HPP_
#define EDIT_COMMAND_HPP_

#include <string>

#include <boost/optional.hpp>

#include "osm_records.hpp"

enum class EditCommandType : char {
    ADD_NODE = 1,
    REPLACE_WAY_NODES = 2,
    SPLIT_WAY = 3,
    SET_TAG = 4
};

/**
 * \brief An atomic edit operation on the dataset.
 *
 * Each command carries everything a host needs to apply it and to undo it again (old node list,
 * retired way, previous tag value). Use the factory methods to create commands.
 */
class EditCommand {
    EditCommandType m_type;

    /// added node (ADD_NODE)
    NodeRecord m_node;

    /// way to change (REPLACE_WAY_NODES, SET_TAG) or the way being split (SPLIT_WAY)
    osmium::object_id_type m_way_id = 0;

    id_vector m_new_nodes;
    id_vector m_old_nodes;

    /// state of the way being split just before the split (SPLIT_WAY)
    WayRecord m_parent;

    /// node the way is split at (SPLIT_WAY)
    osmium::object_id_type m_split_node = 0;

    WayRecord m_first_child;
    WayRecord m_second_child;

    std::string m_key;
    std::string m_value;

    /// value of the tag before the change, empty if the key was not set (SET_TAG)
    boost::optional<std::string> m_previous_value;

    explicit EditCommand(EditCommandType type);

public:
    static EditCommand add_node(const NodeRecord& node);

    static EditCommand replace_way_nodes(const osmium::object_id_type way_id, id_vector new_nodes, id_vector old_nodes);

    /**
     * Split a way into two.
     *
     * \param parent the way as it is before the split, it will be retired
     * \param split_node node shared by both children
     * \param first_child way from the first node of the parent to the split node
     * \param second_child way from the split node to the last node of the parent
     */
    static EditCommand split_way(const WayRecord& parent, const osmium::object_id_type split_node,
            WayRecord first_child, WayRecord second_child);

    static EditCommand set_tag(const osmium::object_id_type way_id, const std::string& key, const std::string& value,
            boost::optional<std::string> previous_value);

    EditCommandType type() const noexcept {
        return m_type;
    }

    const NodeRecord& node() const noexcept {
        return m_node;
    }

    osmium::object_id_type way_id() const noexcept {
        return m_way_id;
    }

    const id_vector& new_nodes() const noexcept {
        return m_new_nodes;
    }

    const id_vector& old_nodes() const noexcept {
        return m_old_nodes;
    }

    const WayRecord& parent() const noexcept {
        return m_parent;
    }

    osmium::object_id_type split_node() const noexcept {
        return m_split_node;
    }

    const WayRecord& first_child() const noexcept {
        return m_first_child;
    }

    const WayRecord& second_child() const noexcept {
        return m_second_child;
    }

    const std::string& key() const noexcept {
        return m_key;
    }

    const std::string& value() const noexcept {
        return m_value;
    }

    const boost::optional<std::string>& previous_value() const noexcept {
        return m_previous_value;
    }

    /**
     * IDs of all nodes the command references without adding them itself.
     */
    id_vector referenced_nodes() const;

    /**
     * One line text representation, e.g. `set_tag -2 bridge=yes`.
     */
    std::string to_string() const;
};

#endif /* EDIT_COMMAND_HPP_ */
