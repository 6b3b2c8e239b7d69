/*
 * test_command_log.cpp
 *
 *  Created on:  2026-10-19
 */

#include <catch2/catch.hpp>
#include <sstream>
#include "dataset_utilities.hpp"
#include <bridge_errors.hpp>
#include <command_log.hpp>

TEST_CASE("new nodes have to be added before they are used") {
    Dataset dataset;
    test_utils::build_equator_road(dataset, 1);
    CommandLog log;

    SECTION("replacing nodes with an unknown new node") {
        CHECK_THROWS_AS(log.execute(EditCommand::replace_way_nodes(1, id_vector{1, -1, 2}, id_vector{1, 2}), dataset),
            CommandOrderError);
        REQUIRE(log.empty());
        REQUIRE(dataset.get_way(1).nodes == id_vector({1, 2}));
    }

    SECTION("appending without applying is checked, too") {
        CHECK_THROWS_AS(log.append(EditCommand::replace_way_nodes(1, id_vector{1, -1, 2}, id_vector{1, 2}), dataset),
            CommandOrderError);
    }

    SECTION("adding a node twice") {
        log.append(EditCommand::add_node(NodeRecord{-1, osmium::Location{0.0005, 0.0}}), dataset);
        CHECK_THROWS_AS(log.append(EditCommand::add_node(NodeRecord{-1, osmium::Location{0.0005, 0.0}}), dataset),
            CommandOrderError);
    }

    SECTION("correct order") {
        const osmium::object_id_type node_id = dataset.allocate_node_id();
        log.execute(EditCommand::add_node(NodeRecord{node_id, osmium::Location{0.0005, 0.0}}), dataset);
        log.execute(EditCommand::replace_way_nodes(1, id_vector{1, node_id, 2}, id_vector{1, 2}), dataset);
        REQUIRE(log.size() == 2);
        REQUIRE(dataset.get_way(1).nodes == id_vector({1, node_id, 2}));

        SECTION("the node cannot be used after its command has been undone") {
            REQUIRE(log.undo(dataset));
            REQUIRE(log.undo(dataset));
            REQUIRE_FALSE(log.undo(dataset));
            REQUIRE_FALSE(dataset.has_node(node_id));
            CHECK_THROWS_AS(log.append(EditCommand::replace_way_nodes(1, id_vector{1, node_id, 2}, id_vector{1, 2}), dataset),
                CommandOrderError);
        }
    }
}

TEST_CASE("nodes with negative IDs in the original data") {
    // new objects saved by an editor
    Dataset dataset;
    test_utils::add_node(dataset, -5, 0.0, 0.0);
    test_utils::add_node(dataset, -6, 0.001, 0.0);
    test_utils::add_way(dataset, 10, id_vector{-5, -6});
    CommandLog log;

    REQUIRE_FALSE(dataset.is_new_node(-5));
    REQUIRE_FALSE(dataset.is_new_node(-6));
    REQUIRE_FALSE(dataset.is_new_node(3));

    const osmium::object_id_type node_id = dataset.allocate_node_id();
    REQUIRE(node_id == -7);
    REQUIRE(dataset.is_new_node(node_id));

    SECTION("existing nodes can be referenced") {
        log.execute(EditCommand::add_node(NodeRecord{node_id, osmium::Location{0.0005, 0.0}}), dataset);
        log.execute(EditCommand::replace_way_nodes(10, id_vector{-5, node_id, -6}, id_vector{-5, -6}), dataset);
        REQUIRE(log.size() == 2);
        REQUIRE(dataset.get_way(10).nodes == id_vector({-5, node_id, -6}));
    }

    SECTION("new nodes still have to be added first") {
        CHECK_THROWS_AS(log.execute(EditCommand::replace_way_nodes(10, id_vector{-5, node_id, -6},
            id_vector{-5, -6}), dataset), CommandOrderError);
        REQUIRE(log.empty());
    }
}

TEST_CASE("undo and rollback") {
    Dataset dataset;
    test_utils::build_equator_road(dataset, 2);
    dataset.add_way(WayRecord{3, id_vector{1, 3}, tag_map{{"highway", "primary"}, {"bridge", "no"}}});
    CommandLog log;

    log.execute(EditCommand::set_tag(1, "bridge", "yes", boost::none), dataset);
    const size_t mark = log.size();
    log.execute(EditCommand::set_tag(2, "bridge", "yes", boost::none), dataset);
    log.execute(EditCommand::set_tag(3, "bridge", "yes", std::string{"no"}), dataset);
    REQUIRE(test_utils::has_tag(dataset, 3, "bridge", "yes"));

    SECTION("undo restores the previous value") {
        REQUIRE(log.undo(dataset));
        REQUIRE(test_utils::has_tag(dataset, 3, "bridge", "no"));
        REQUIRE(log.size() == 2);
    }

    SECTION("rollback reverts everything after the mark") {
        log.rollback(dataset, mark);
        REQUIRE(log.size() == 1);
        REQUIRE(test_utils::has_tag(dataset, 1, "bridge", "yes"));
        REQUIRE(dataset.get_way(2).get_value_by_key("bridge") == nullptr);
        REQUIRE(test_utils::has_tag(dataset, 3, "bridge", "no"));
    }

    SECTION("rollback to the current size does nothing") {
        log.rollback(dataset, log.size());
        REQUIRE(log.size() == 3);
    }
}

TEST_CASE("text representation of commands") {
    WayRecord parent {42, id_vector{1, -1, 2}, tag_map{}};
    WayRecord first {-1, id_vector{1, -1}, tag_map{}};
    WayRecord second {-2, id_vector{-1, 2}, tag_map{}};

    Dataset dataset;
    CommandLog log;
    log.append(EditCommand::add_node(NodeRecord{-1, osmium::Location{9.5, 49.25}}), dataset);
    log.append(EditCommand::replace_way_nodes(42, id_vector{1, -1, 2}, id_vector{1, 2}), dataset);
    log.append(EditCommand::split_way(parent, -1, first, second), dataset);
    log.append(EditCommand::set_tag(-1, "bridge", "yes", boost::none), dataset);

    std::ostringstream out;
    log.write(out);
    REQUIRE(out.str() == "add_node -1 9.5000000 49.2500000\n" \
            "replace_way_nodes 42 1,-1,2\n" \
            "split_way 42 at -1 into -1 -2\n" \
            "set_tag -1 bridge=yes\n");
}
