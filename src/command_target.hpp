/*
 * command_target.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef COMMAND_TARGET_HPP_
#define COMMAND_TARGET_HPP_

#include "edit_command.hpp"

/**
 * \brief Interface of everything edit commands can be applied to.
 *
 * The command log forwards commands to an implementation of this interface. The in-memory
 * dataset is one, an editor host holding its own data can be another one.
 */
class CommandTarget {
public:
    virtual ~CommandTarget() {}

    /**
     * Apply a command.
     *
     * \throws std::runtime_error if the command does not fit to the current state
     */
    virtual void apply(const EditCommand& command) = 0;

    /**
     * Undo a command which was the last one applied.
     */
    virtual void revert(const EditCommand& command) = 0;

    /**
     * Check if a node ID belongs to a node created by edit commands rather than to a node of the
     * original data.
     *
     * The default follows the OSM convention of negative IDs for new objects. Targets whose
     * original data contains negative IDs have to override it.
     */
    virtual bool is_new_node(const osmium::object_id_type id) const {
        return id < 0;
    }
};

#endif /* COMMAND_TARGET_HPP_ */
