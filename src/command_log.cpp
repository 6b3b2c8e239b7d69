/*
 * command_log.cpp
 *
 *  Created on:  2026-10-19
 */

#include "command_log.hpp"

#include <boost/format.hpp>

#include "bridge_errors.hpp"

void CommandLog::check_order(const EditCommand& command, const CommandTarget& target) const {
    if (command.type() == EditCommandType::ADD_NODE) {
        if (m_added_nodes.count(command.node().id)) {
            throw CommandOrderError{(boost::format("Node %1% has been added already.") % command.node().id).str()};
        }
        return;
    }
    for (const osmium::object_id_type id : command.referenced_nodes()) {
        if (m_added_nodes.count(id) == 0 && target.is_new_node(id)) {
            throw CommandOrderError{(boost::format("'%1%' references node %2% before it was added.")
                % command.to_string() % id).str()};
        }
    }
}

void CommandLog::push(const EditCommand& command) {
    if (command.type() == EditCommandType::ADD_NODE) {
        m_added_nodes.insert(command.node().id);
    }
    m_commands.push_back(command);
}

void CommandLog::pop() {
    const EditCommand& last = m_commands.back();
    if (last.type() == EditCommandType::ADD_NODE) {
        m_added_nodes.erase(last.node().id);
    }
    m_commands.pop_back();
}

void CommandLog::append(const EditCommand& command, const CommandTarget& target) {
    check_order(command, target);
    push(command);
}

void CommandLog::execute(const EditCommand& command, CommandTarget& target) {
    check_order(command, target);
    target.apply(command);
    push(command);
}

bool CommandLog::undo(CommandTarget& target) {
    if (m_commands.empty()) {
        return false;
    }
    target.revert(m_commands.back());
    pop();
    return true;
}

void CommandLog::rollback(CommandTarget& target, const std::size_t mark) {
    while (m_commands.size() > mark) {
        target.revert(m_commands.back());
        pop();
    }
}

void CommandLog::write(std::ostream& out) const {
    for (const EditCommand& command : m_commands) {
        out << command.to_string() << '\n';
    }
}
