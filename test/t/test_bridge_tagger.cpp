/*
 * test_bridge_tagger.cpp
 *
 *  Created on:  2026-10-19
 */

#include <catch2/catch.hpp>
#include <algorithm>
#include "dataset_utilities.hpp"
#include <bridge_errors.hpp>
#include <bridge_tagger.hpp>

BridgeEndpoint endpoint_at(double lon, boost::optional<osmium::object_id_type> way_hint = boost::none) {
    BridgeEndpoint endpoint;
    endpoint.location = osmium::Location{lon, 0.0};
    endpoint.way_hint = way_hint;
    return endpoint;
}

BridgeEndpoint missing_endpoint(boost::optional<osmium::object_id_type> way_hint = boost::none) {
    BridgeEndpoint endpoint;
    endpoint.way_hint = way_hint;
    return endpoint;
}

BridgeCandidate make_candidate(const std::string& id, std::vector<BridgeEndpoint> endpoints,
        id_vector chain = id_vector{}) {
    BridgeCandidate candidate;
    candidate.bridge_id = id;
    candidate.endpoints = std::move(endpoints);
    candidate.chain = std::move(chain);
    return candidate;
}

struct TaggerFixture {
    Dataset dataset;
    CommandLog log;
    MercatorCoordinateService coordinates;
    BridgeSplitConfig config;

    /// all live ways with bridge=yes
    id_vector bridge_ways() const {
        id_vector result;
        for (const auto& way : dataset.ways()) {
            if (test_utils::has_tag(dataset, way.first, "bridge", "yes")) {
                result.push_back(way.first);
            }
        }
        return result;
    }

    /// ID of the live way with exactly these nodes, 0 if there is none
    osmium::object_id_type way_with_nodes(const id_vector& nodes) const {
        for (const auto& way : dataset.ways()) {
            if (way.second.nodes == nodes) {
                return way.first;
            }
        }
        return 0;
    }
};

TEST_CASE_METHOD(TaggerFixture, "two endpoint ways sharing a pivot node") {
    // 1 --- way 1 --- 2 --- way 2 --- 3
    test_utils::build_equator_road(dataset, 2);
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({make_candidate("b1", {endpoint_at(0.0007, 1), endpoint_at(0.0013, 2)})});
    REQUIRE(statistics.processed == 1);
    REQUIRE(statistics.tagged == 1);
    REQUIRE(statistics.failed == 0);
    REQUIRE(statistics.splits == 2);
    REQUIRE(tagger.state() == CandidateState::TAGGED);

    // four ways created by two splits, only the way between the pivot and the second new node is tagged
    REQUIRE(dataset.way_count() == 4);
    const osmium::object_id_type bridge = way_with_nodes(id_vector{2, -2});
    REQUIRE(bridge != 0);
    REQUIRE(bridge_ways() == id_vector({bridge}));
    REQUIRE(test_utils::has_tag(dataset, bridge, "bridge:id", "b1"));
    REQUIRE(way_with_nodes(id_vector{1, -1}) != 0);
    REQUIRE(way_with_nodes(id_vector{-1, 2}) != 0);
    REQUIRE(way_with_nodes(id_vector{-2, 3}) != 0);
    REQUIRE(log.size() == 8);
}

TEST_CASE_METHOD(TaggerFixture, "bridge across a chain of ways") {
    // 1 -- way 1 -- 2 -- way 2 -- 3 -- way 3 -- 4 -- way 4 -- 5 -- way 5 -- 6
    test_utils::build_equator_road(dataset, 5);
    BridgeTagger tagger {dataset, log, coordinates, config};

    SECTION("explicit chain") {
        CandidateResult result = tagger.process(make_candidate("b2", {endpoint_at(0.0005, 1), endpoint_at(0.0045, 5)},
            id_vector{2, 3, 4}));
        REQUIRE(result.state == CandidateState::TAGGED);
        REQUIRE(result.splits == 2);
        REQUIRE_FALSE(result.fallback);
        const osmium::object_id_type start = way_with_nodes(id_vector{-1, 2});
        const osmium::object_id_type end = way_with_nodes(id_vector{5, -2});
        REQUIRE(start != 0);
        REQUIRE(end != 0);
        id_vector expected {start, end, 2, 3, 4};
        std::sort(expected.begin(), expected.end());
        REQUIRE(bridge_ways() == expected);
    }

    SECTION("chain found in the way graph") {
        CandidateResult result = tagger.process(make_candidate("b2", {endpoint_at(0.0005, 1), endpoint_at(0.0045, 5)}));
        REQUIRE(result.splits == 2);
        const osmium::object_id_type start = way_with_nodes(id_vector{-1, 2});
        const osmium::object_id_type end = way_with_nodes(id_vector{5, -2});
        id_vector expected {start, end, 2, 3, 4};
        std::sort(expected.begin(), expected.end());
        REQUIRE(bridge_ways() == expected);
    }

    SECTION("chain is tagged even if the endpoint ways cannot be split") {
        // endpoints located exactly at the outer nodes
        CandidateResult result = tagger.process(make_candidate("b2", {endpoint_at(0.0, 1), endpoint_at(0.005, 5)},
            id_vector{2, 3, 4}));
        REQUIRE(result.splits == 0);
        REQUIRE(bridge_ways() == id_vector({2, 3, 4}));
        REQUIRE(dataset.has_way(1));
        REQUIRE(dataset.has_way(5));
        for (const EditCommand& command : log) {
            REQUIRE(command.type() == EditCommandType::SET_TAG);
        }
    }

    SECTION("unconnected ways") {
        test_utils::add_node(dataset, 20, 0.0, 0.001);
        test_utils::add_node(dataset, 21, 0.001, 0.001);
        test_utils::add_way(dataset, 20, id_vector{20, 21});
        TaggerStatistics statistics = tagger.process_all({make_candidate("b3",
            {endpoint_at(0.0005, 1), BridgeEndpoint{osmium::Location{0.0005, 0.001}, osmium::object_id_type{20}}})});
        REQUIRE(statistics.failed == 1);
        REQUIRE(log.empty());
    }
}

TEST_CASE_METHOD(TaggerFixture, "one endpoint is missing") {
    test_utils::build_equator_road(dataset, 2);
    BridgeTagger tagger {dataset, log, coordinates, config};

    SECTION("second endpoint missing, the bridge starts at the new node") {
        CandidateResult result = tagger.process(make_candidate("b4", {endpoint_at(0.0005, 1), missing_endpoint(2)}));
        REQUIRE(result.splits == 1);
        REQUIRE(bridge_ways() == id_vector({way_with_nodes(id_vector{-1, 2})}));
        REQUIRE(way_with_nodes(id_vector{1, -1}) != 0);
    }

    SECTION("first endpoint missing, the bridge ends at the new node") {
        CandidateResult result = tagger.process(make_candidate("b5", {missing_endpoint(1), endpoint_at(0.0005, 1)}));
        REQUIRE(result.splits == 1);
        REQUIRE(bridge_ways() == id_vector({way_with_nodes(id_vector{1, -1})}));
    }

    SECTION("single endpoint without hint") {
        CandidateResult result = tagger.process(make_candidate("b6", {endpoint_at(0.0015)}));
        REQUIRE(result.splits == 1);
        REQUIRE(bridge_ways() == id_vector({way_with_nodes(id_vector{-1, 3})}));
    }
}

TEST_CASE_METHOD(TaggerFixture, "both endpoints on the same way") {
    test_utils::build_equator_road(dataset, 5);
    BridgeTagger tagger {dataset, log, coordinates, config};

    CandidateResult result = tagger.process(make_candidate("b7", {endpoint_at(0.0022, 3), endpoint_at(0.0028, 3)}));
    REQUIRE(result.splits == 2);
    const osmium::object_id_type bridge = way_with_nodes(id_vector{-1, -2});
    REQUIRE(bridge != 0);
    REQUIRE(bridge_ways() == id_vector({bridge}));
    REQUIRE(way_with_nodes(id_vector{3, -1}) != 0);
    REQUIRE(way_with_nodes(id_vector{-2, 4}) != 0);
}

TEST_CASE_METHOD(TaggerFixture, "way tagged as part of another bridge is not split") {
    test_utils::build_equator_road(dataset, 0);
    test_utils::add_node(dataset, 2, 0.001, 0.0);
    test_utils::add_node(dataset, 3, 0.002, 0.0);
    test_utils::add_way(dataset, 1, id_vector{1, 2}, tag_map{{"highway", "primary"}, {"bridge", "yes"},
        {"bridge:id", "old"}});
    test_utils::add_way(dataset, 2, id_vector{2, 3});
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({make_candidate("b8", {endpoint_at(0.0005, 2), missing_endpoint()})});
    REQUIRE(statistics.tagged == 1);
    REQUIRE(statistics.fallback == 1);
    REQUIRE(statistics.splits == 0);
    REQUIRE(dataset.get_way(1).nodes == id_vector({1, 2}));
    REQUIRE(test_utils::has_tag(dataset, 1, "bridge:id", "old"));
    REQUIRE(test_utils::has_tag(dataset, 2, "bridge", "yes"));
    REQUIRE(test_utils::has_tag(dataset, 2, "bridge:id", "b8"));
}

TEST_CASE_METHOD(TaggerFixture, "hinted way is tagged if no node can be inserted") {
    test_utils::build_equator_road(dataset, 2);
    BridgeTagger tagger {dataset, log, coordinates, config};

    // located at node 2
    CandidateResult result = tagger.process(make_candidate("b9", {endpoint_at(0.001, 2), missing_endpoint()}));
    REQUIRE(result.fallback);
    REQUIRE(result.splits == 0);
    REQUIRE(result.tagged_ways == id_vector({2}));
    REQUIRE(bridge_ways() == id_vector({2}));
    REQUIRE(log.size() == 2);
}

TEST_CASE_METHOD(TaggerFixture, "tagging is idempotent") {
    test_utils::build_equator_road(dataset, 1);
    test_utils::add_node(dataset, 3, 0.002, 0.0);
    test_utils::add_way(dataset, 2, id_vector{2, 3}, tag_map{{"highway", "primary"}, {"bridge", "yes"},
        {"bridge:id", "b10"}});
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({make_candidate("b10", {endpoint_at(0.001, 2)})});
    REQUIRE(statistics.tagged == 1);
    REQUIRE(log.empty());
    REQUIRE(dataset.get_way(2).tags.size() == 3);
}

TEST_CASE_METHOD(TaggerFixture, "failing candidates leave no commands") {
    test_utils::build_equator_road(dataset, 3);
    BridgeTagger tagger {dataset, log, coordinates, config};

    SECTION("unknown way") {
        TaggerStatistics statistics = tagger.process_all({
            make_candidate("b12", {endpoint_at(0.0005, 99), endpoint_at(0.0015, 2)}),
            make_candidate("b13", {endpoint_at(0.0007, 1), endpoint_at(0.0013, 2)})
        });
        REQUIRE(statistics.processed == 2);
        REQUIRE(statistics.failed == 1);
        REQUIRE(statistics.tagged == 1);
        REQUIRE(log.size() == 8);
        REQUIRE(log[0].type() == EditCommandType::ADD_NODE);
    }

    SECTION("unknown way in the chain") {
        TaggerStatistics statistics = tagger.process_all({make_candidate("b14",
            {endpoint_at(0.0005, 1), endpoint_at(0.0025, 3)}, id_vector{2, 77})});
        REQUIRE(statistics.failed == 1);
        REQUIRE(log.empty());
    }

    SECTION("no way connects the new nodes") {
        const size_t nodes = dataset.node_count();
        TaggerStatistics statistics = tagger.process_all({make_candidate("b15", {endpoint_at(0.0005), endpoint_at(0.0025)})});
        REQUIRE(statistics.failed == 1);
        REQUIRE(tagger.state() == CandidateState::PATH_KNOWN);
        REQUIRE(log.empty());
        REQUIRE(dataset.way_ids() == id_vector({1, 2, 3}));
        REQUIRE(dataset.node_count() == nodes);
    }

    SECTION("no way near the endpoint") {
        TaggerStatistics statistics = tagger.process_all({make_candidate("b16", {endpoint_at(0.5)})});
        REQUIRE(statistics.failed == 1);
        REQUIRE(log.empty());
    }

    SECTION("direct call reports the error") {
        CHECK_THROWS_AS(tagger.process(make_candidate("b17", {endpoint_at(0.0005), endpoint_at(0.0025)})),
            AmbiguousBridgeWay);
        REQUIRE(tagger.state() == CandidateState::PATH_KNOWN);
    }
}

TEST_CASE_METHOD(TaggerFixture, "later candidates work on the result of earlier ones") {
    test_utils::build_equator_road(dataset, 2);
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({
        make_candidate("b18", {endpoint_at(0.0007, 1), endpoint_at(0.0013, 2)}),
        make_candidate("b19", {endpoint_at(0.0003, 1), missing_endpoint()})
    });
    REQUIRE(statistics.tagged == 2);
    REQUIRE(statistics.splits == 3);
    const osmium::object_id_type second_bridge = way_with_nodes(id_vector{-3, -1});
    REQUIRE(second_bridge != 0);
    REQUIRE(test_utils::has_tag(dataset, second_bridge, "bridge:id", "b19"));
    REQUIRE(test_utils::has_tag(dataset, way_with_nodes(id_vector{2, -2}), "bridge:id", "b18"));
}

TEST_CASE_METHOD(TaggerFixture, "bridge:id can be disabled") {
    test_utils::build_equator_road(dataset, 2);
    config.m_tag_bridge_id = false;
    BridgeTagger tagger {dataset, log, coordinates, config};

    tagger.process(make_candidate("b20", {endpoint_at(0.0007, 1), endpoint_at(0.0013, 2)}));
    const osmium::object_id_type bridge = way_with_nodes(id_vector{2, -2});
    REQUIRE(test_utils::has_tag(dataset, bridge, "bridge", "yes"));
    REQUIRE(dataset.get_way(bridge).get_value_by_key("bridge:id") == nullptr);
    REQUIRE(log.size() == 7);
}

TEST_CASE_METHOD(TaggerFixture, "batch without dataset") {
    BridgeTagger tagger {dataset, log, coordinates, config};
    CHECK_THROWS_AS(tagger.process_all({make_candidate("b21", {endpoint_at(0.0005, 1)})}), NoActiveDataset);
}

TEST_CASE_METHOD(TaggerFixture, "fallback after an earlier split of the hinted way") {
    // 1 ---------- way 1 ---------- 2
    test_utils::add_node(dataset, 1, 0.0, 0.0);
    test_utils::add_node(dataset, 2, 0.003, 0.0);
    test_utils::add_way(dataset, 1, id_vector{1, 2});
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({make_candidate("A", {endpoint_at(0.001, 1), endpoint_at(0.002, 1)})});
    REQUIRE(statistics.tagged == 1);
    const osmium::object_id_type bridge_a = way_with_nodes(id_vector{-1, -2});
    REQUIRE(bridge_a != 0);
    REQUIRE(test_utils::has_tag(dataset, bridge_a, "bridge:id", "A"));

    SECTION("only the part next to the endpoint is tagged") {
        // located at node 1, no node can be inserted
        statistics = tagger.process_all({make_candidate("B", {endpoint_at(0.0, 1), missing_endpoint()})});
        REQUIRE(statistics.tagged == 1);
        REQUIRE(statistics.fallback == 1);
        const osmium::object_id_type start = way_with_nodes(id_vector{1, -1});
        REQUIRE(test_utils::has_tag(dataset, start, "bridge:id", "B"));
        REQUIRE(test_utils::has_tag(dataset, bridge_a, "bridge:id", "A"));
        id_vector expected {start, bridge_a};
        std::sort(expected.begin(), expected.end());
        REQUIRE(bridge_ways() == expected);
    }

    SECTION("the part belonging to another bridge is left alone") {
        // located at node -1, the nearest part is the bridge of A
        statistics = tagger.process_all({make_candidate("C", {endpoint_at(0.0015, 1), missing_endpoint()})});
        REQUIRE(statistics.failed == 1);
        REQUIRE(log.size() == 8);
        REQUIRE(dataset.has_way(bridge_a));
        REQUIRE(test_utils::has_tag(dataset, bridge_a, "bridge:id", "A"));
        REQUIRE(bridge_ways() == id_vector({bridge_a}));
    }
}

TEST_CASE_METHOD(TaggerFixture, "chain way split by an earlier bridge") {
    // 1 -- way 1 -- 2 -- way 2 -- 3 -- way 3 -- 4
    test_utils::build_equator_road(dataset, 3);
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({
        make_candidate("A", {endpoint_at(0.0012, 2), endpoint_at(0.0018, 2)}),
        make_candidate("B", {endpoint_at(0.0005, 1), endpoint_at(0.0025, 3)}, id_vector{2})
    });
    REQUIRE(statistics.tagged == 2);
    const osmium::object_id_type bridge_a = way_with_nodes(id_vector{-1, -2});
    REQUIRE(test_utils::has_tag(dataset, bridge_a, "bridge:id", "A"));
    for (const osmium::object_id_type id : {way_with_nodes(id_vector{-3, 2}), way_with_nodes(id_vector{2, -1}),
            way_with_nodes(id_vector{-2, 3}), way_with_nodes(id_vector{3, -4})}) {
        REQUIRE(id != 0);
        REQUIRE(test_utils::has_tag(dataset, id, "bridge:id", "B"));
    }
    REQUIRE(bridge_ways().size() == 5);
}

TEST_CASE_METHOD(TaggerFixture, "bridges tagged without bridge:id are not split") {
    config.m_tag_bridge_id = false;
    test_utils::add_node(dataset, 1, 0.0, 0.0);
    test_utils::add_node(dataset, 2, 0.001, 0.0);
    test_utils::add_node(dataset, 3, 0.002, 0.0);
    test_utils::add_way(dataset, 1, id_vector{1, 2}, tag_map{{"highway", "primary"}, {"bridge", "yes"}});
    test_utils::add_way(dataset, 2, id_vector{2, 3});
    BridgeTagger tagger {dataset, log, coordinates, config};

    TaggerStatistics statistics = tagger.process_all({make_candidate("b22", {endpoint_at(0.0005, 2), missing_endpoint()})});
    REQUIRE(statistics.tagged == 1);
    REQUIRE(statistics.fallback == 1);
    REQUIRE(dataset.get_way(1).nodes == id_vector({1, 2}));
    REQUIRE(bridge_ways() == id_vector({1, 2}));
    REQUIRE(log.size() == 1);
}
