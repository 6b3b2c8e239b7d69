/*
 * command_log.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef COMMAND_LOG_HPP_
#define COMMAND_LOG_HPP_

#include <cstddef>
#include <ostream>
#include <set>
#include <vector>

#include "command_target.hpp"
#include "edit_command.hpp"

/**
 * \brief Ordered, undoable history of the edit commands.
 *
 * A command may only reference a new node if the command adding this node has been appended to the
 * log before. The command target decides which node IDs are new.
 */
class CommandLog {
    std::vector<EditCommand> m_commands;

    /// new nodes whose ADD_NODE command is in the log
    std::set<osmium::object_id_type> m_added_nodes;

    /**
     * \throws CommandOrderError if the command references a new node which has not been added
     */
    void check_order(const EditCommand& command, const CommandTarget& target) const;

    void push(const EditCommand& command);

    void pop();

public:
    using const_iterator = std::vector<EditCommand>::const_iterator;

    CommandLog() = default;

    /**
     * Record a command without applying it, e.g. because the host applied it already.
     *
     * \param target host holding the data, used to distinguish new nodes from existing ones
     *
     * \throws CommandOrderError
     */
    void append(const EditCommand& command, const CommandTarget& target);

    /**
     * Apply the command to the target and record it.
     *
     * The command is not recorded if the target throws.
     *
     * \throws CommandOrderError
     */
    void execute(const EditCommand& command, CommandTarget& target);

    /**
     * Revert the last command and remove it from the log.
     *
     * \returns false if the log was empty
     */
    bool undo(CommandTarget& target);

    /**
     * Revert all commands recorded after the given mark, newest first.
     *
     * \param mark size of the log which should be restored, usually taken from size()
     */
    void rollback(CommandTarget& target, const std::size_t mark);

    std::size_t size() const noexcept {
        return m_commands.size();
    }

    bool empty() const noexcept {
        return m_commands.empty();
    }

    const EditCommand& operator[](const std::size_t index) const {
        return m_commands[index];
    }

    const_iterator begin() const noexcept {
        return m_commands.cbegin();
    }

    const_iterator end() const noexcept {
        return m_commands.cend();
    }

    /**
     * Write the text representation of all commands, one per line.
     */
    void write(std::ostream& out) const;
};

#endif /* COMMAND_LOG_HPP_ */
