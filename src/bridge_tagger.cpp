/*
 * bridge_tagger.cpp
 *
 *  Created on:  2026-10-19
 */

#include "bridge_tagger.hpp"

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <sstream>

#include <boost/format.hpp>

#include "bridge_errors.hpp"
#include "way_graph.hpp"

namespace {

    const std::string BRIDGE_KEY = "bridge";
    const std::string BRIDGE_ID_KEY = "bridge:id";

    std::string describe_endpoints(const BridgeCandidate& candidate) {
        std::ostringstream out;
        for (const BridgeEndpoint& endpoint : candidate.endpoints) {
            out << ' ';
            if (endpoint.missing()) {
                out << "(missing)";
            } else {
                out << boost::format("(%1$.7f, %2$.7f)") % endpoint.location->lon() % endpoint.location->lat();
            }
            if (endpoint.way_hint) {
                out << " way " << endpoint.way_hint.get();
            }
        }
        return out.str();
    }

} // anonymous namespace

const char* candidate_state_name(const CandidateState state) noexcept {
    switch (state) {
    case CandidateState::SINGLE_POINT:
        return "single point";
    case CandidateState::AWAITING_SECOND_ENDPOINT:
        return "awaiting second endpoint";
    case CandidateState::PATH_KNOWN:
        return "path known";
    case CandidateState::TAGGED:
        return "tagged";
    }
    return "unknown";
}

BridgeTagger::BridgeTagger(Dataset& dataset, CommandLog& log, const CoordinateService& coordinates,
        const BridgeSplitConfig& config) :
    m_dataset(dataset),
    m_log(log),
    m_config(config),
    m_projector(coordinates),
    m_split_engine(dataset, log, m_projector, config),
    m_locator(dataset, m_projector, config.m_search_radius) {
}

void BridgeTagger::validate_hints(const BridgeCandidate& candidate) const {
    for (const BridgeEndpoint& endpoint : candidate.endpoints) {
        if (endpoint.way_hint && !m_dataset.knows_way(endpoint.way_hint.get())) {
            throw WayNotFound{(boost::format("Way %1% of an endpoint is not in the dataset.")
                % endpoint.way_hint.get()).str()};
        }
    }
    for (const osmium::object_id_type id : candidate.chain) {
        if (!m_dataset.knows_way(id)) {
            throw WayNotFound{(boost::format("Way %1% of the chain is not in the dataset.") % id).str()};
        }
    }
}

osmium::object_id_type BridgeTagger::resolve_endpoint_way(const BridgeEndpoint& endpoint) const {
    if (endpoint.way_hint) {
        return m_locator.resolve_hint(endpoint.way_hint.get(), endpoint.location.get());
    }
    return m_locator.nearest_way(endpoint.location.get()).way_id;
}

bool BridgeTagger::tagged_elsewhere(const BridgeEndpoint& endpoint, const osmium::object_id_type way_id) const {
    if (endpoint.way_hint && m_dataset.descends_from(way_id, endpoint.way_hint.get())) {
        return false;
    }
    const WayRecord& way = m_dataset.get_way(way_id);
    if (way.get_value_by_key(BRIDGE_ID_KEY)) {
        return true;
    }
    // Without bridge:id tags, bridge=yes is the only trace of earlier candidates.
    const char* bridge = way.get_value_by_key(BRIDGE_KEY);
    return !m_config.m_tag_bridge_id && bridge && !std::strcmp(bridge, "yes");
}

boost::optional<SplitResult> BridgeTagger::try_insert(const osmium::object_id_type way_id,
        const osmium::Location& location, CandidateResult& result) {
    try {
        SplitResult split = m_split_engine.insert(way_id, location);
        ++result.splits;
        return split;
    } catch (NoSegmentFound& e) {
        std::cerr << boost::format("Warning: bridge %1%: %2%: %3%\n") % m_bridge_id % e.kind() % e.what();
    }
    return boost::none;
}

bool BridgeTagger::set_tag(const osmium::object_id_type way_id, const std::string& key, const std::string& value) {
    const char* previous = m_dataset.get_way(way_id).get_value_by_key(key);
    if (previous && value == previous) {
        return false;
    }
    boost::optional<std::string> previous_value;
    if (previous) {
        previous_value = std::string{previous};
    }
    m_log.execute(EditCommand::set_tag(way_id, key, value, previous_value), m_dataset);
    return true;
}

void BridgeTagger::tag_way(const osmium::object_id_type way_id, CandidateResult& result) {
    const char* other_bridge = m_dataset.get_way(way_id).get_value_by_key(BRIDGE_ID_KEY);
    if (other_bridge && m_bridge_id != other_bridge) {
        std::cerr << boost::format("Warning: bridge %1%: way %2% belongs to bridge %3% already, not tagged\n")
            % m_bridge_id % way_id % other_bridge;
        return;
    }
    bool changed = set_tag(way_id, BRIDGE_KEY, "yes");
    if (m_config.m_tag_bridge_id) {
        changed = set_tag(way_id, BRIDGE_ID_KEY, m_bridge_id) || changed;
    }
    if (std::find(result.tagged_ways.begin(), result.tagged_ways.end(), way_id) == result.tagged_ways.end()) {
        result.tagged_ways.push_back(way_id);
    }
    if (m_config.m_verbose) {
        std::cerr << boost::format("Bridge %1%: way %2% %3%\n") % m_bridge_id % way_id
            % (changed ? "tagged" : "was tagged already");
    }
}

void BridgeTagger::tag_descendants(const osmium::object_id_type way_id, CandidateResult& result) {
    for (const osmium::object_id_type id : m_dataset.live_descendants(way_id)) {
        tag_way(id, result);
    }
}

/*static*/ osmium::object_id_type BridgeTagger::find_pivot(const WayRecord& way1, const WayRecord& way2) {
    if (way1.front() == way2.front() || way1.front() == way2.back()) {
        return way1.front();
    }
    if (way1.back() == way2.front() || way1.back() == way2.back()) {
        return way1.back();
    }
    throw PivotNotFound{(boost::format("Ways %1% and %2% do not share an end node.") % way1.id % way2.id).str()};
}

boost::optional<osmium::object_id_type> BridgeTagger::find_pivot_in(const osmium::object_id_type way_id,
        const osmium::object_id_type other) const {
    const WayRecord& way = m_dataset.get_way(way_id);
    for (const osmium::object_id_type id : m_dataset.live_descendants(other)) {
        try {
            return find_pivot(way, m_dataset.get_way(id));
        } catch (PivotNotFound&) {
            // try the next part
        }
    }
    std::cerr << boost::format("Warning: bridge %1%: way %2% does not share an end node with way %3%\n")
        % m_bridge_id % way_id % other;
    return boost::none;
}

boost::optional<osmium::object_id_type> BridgeTagger::child_with_ends(const SplitResult& split,
        const osmium::object_id_type a, const osmium::object_id_type b) const {
    for (const osmium::object_id_type child : {split.first_child, split.second_child}) {
        if (m_dataset.has_way(child) && m_dataset.get_way(child).has_ends(a, b)) {
            return child;
        }
    }
    return boost::none;
}

void BridgeTagger::process_pivot(const BridgeCandidate& candidate, const osmium::object_id_type way1,
        const osmium::object_id_type way2, CandidateResult& result) {
    const BridgeEndpoint& first = candidate.endpoints[0];
    const BridgeEndpoint& second = candidate.endpoints[1];
    osmium::object_id_type pivot;
    try {
        pivot = find_pivot(m_dataset.get_way(way1), m_dataset.get_way(way2));
    } catch (PivotNotFound&) {
        // The ways are not adjacent. The ways between them belong to the bridge.
        WayGraph graph {m_dataset};
        const id_vector path = graph.shortest_path(way1, way2);
        const id_vector chain (path.begin() + 1, path.end() - 1);
        if (m_config.m_verbose) {
            std::cerr << boost::format("Bridge %1%: %2% ways between way %3% and way %4%\n")
                % m_bridge_id % chain.size() % way1 % way2;
        }
        process_chain(candidate, chain, way1, way2, result);
        return;
    }

    boost::optional<SplitResult> first_split = try_insert(way1, first.location.get(), result);
    if (first_split) {
        m_state = CandidateState::AWAITING_SECOND_ENDPOINT;
    }
    boost::optional<SplitResult> second_split = try_insert(m_locator.resolve_hint(way2, second.location.get()),
        second.location.get(), result);
    const boost::optional<SplitResult>& last_split = second_split ? second_split : first_split;
    if (!last_split) {
        fallback(candidate, result);
        return;
    }
    m_state = CandidateState::PATH_KNOWN;
    boost::optional<osmium::object_id_type> bridge_way = child_with_ends(last_split.get(), pivot,
        last_split->node.id);
    if (!bridge_way) {
        throw AmbiguousBridgeWay{(boost::format("None of the ways created by splitting way %1% connects node %2% and node %3%.")
            % last_split->parent % pivot % last_split->node.id).str()};
    }
    tag_way(bridge_way.get(), result);
}

void BridgeTagger::process_chain(const BridgeCandidate& candidate, const id_vector& chain,
        const osmium::object_id_type way1, const osmium::object_id_type way2, CandidateResult& result) {
    if (chain.empty()) {
        throw PivotNotFound{(boost::format("No ways between way %1% and way %2%.") % way1 % way2).str()};
    }
    const BridgeEndpoint& first = candidate.endpoints[0];
    const BridgeEndpoint& second = candidate.endpoints[1];

    boost::optional<osmium::object_id_type> pivot = find_pivot_in(way1, chain.front());
    if (pivot) {
        boost::optional<SplitResult> split = try_insert(way1, first.location.get(), result);
        if (split) {
            m_state = CandidateState::AWAITING_SECOND_ENDPOINT;
            boost::optional<osmium::object_id_type> bridge_way = child_with_ends(split.get(), pivot.get(),
                split->node.id);
            if (bridge_way) {
                tag_way(bridge_way.get(), result);
            }
        }
    }

    const osmium::object_id_type way2_now = m_locator.resolve_hint(way2, second.location.get());
    pivot = find_pivot_in(way2_now, chain.back());
    if (pivot) {
        boost::optional<SplitResult> split = try_insert(way2_now, second.location.get(), result);
        if (split) {
            boost::optional<osmium::object_id_type> bridge_way = child_with_ends(split.get(), pivot.get(),
                split->node.id);
            if (bridge_way) {
                tag_way(bridge_way.get(), result);
            }
        }
    }

    m_state = CandidateState::PATH_KNOWN;
    tag_chain(chain, result);
}

void BridgeTagger::process_spatial(const BridgeCandidate& candidate, CandidateResult& result) {
    const bool two_endpoints = candidate.endpoints.size() == 2 && !candidate.endpoints[1].missing();
    // inserted nodes and the index of their endpoint
    std::vector<std::pair<std::size_t, SplitResult>> splits;
    for (std::size_t i = 0; i < candidate.endpoints.size(); ++i) {
        const BridgeEndpoint& endpoint = candidate.endpoints[i];
        if (endpoint.missing()) {
            continue;
        }
        const osmium::object_id_type way_id = m_locator.nearest_way(endpoint.location.get()).way_id;
        if (tagged_elsewhere(endpoint, way_id)) {
            std::cerr << boost::format("Warning: bridge %1%: way %2% near (%3$.7f, %4$.7f) belongs to bridge %5% already, endpoint skipped\n")
                % m_bridge_id % way_id % endpoint.location->lon() % endpoint.location->lat()
                % m_dataset.get_way(way_id).get_value_by_key(BRIDGE_ID_KEY);
            continue;
        }
        boost::optional<SplitResult> split = try_insert(way_id, endpoint.location.get(), result);
        if (split) {
            splits.emplace_back(i, split.get());
            if (i == 0 && two_endpoints) {
                m_state = CandidateState::AWAITING_SECOND_ENDPOINT;
            }
        }
    }

    if (splits.empty()) {
        fallback(candidate, result);
        return;
    }
    m_state = CandidateState::PATH_KNOWN;
    const SplitResult& last = splits.back().second;
    if (splits.size() == 2) {
        const osmium::object_id_type a = splits.front().second.node.id;
        const osmium::object_id_type b = last.node.id;
        boost::optional<osmium::object_id_type> bridge_way = child_with_ends(last, a, b);
        if (!bridge_way) {
            throw AmbiguousBridgeWay{(boost::format("No way connects the new nodes %1% and %2%.") % a % b).str()};
        }
        tag_way(bridge_way.get(), result);
        return;
    }
    // The bridge starts at the node of the first endpoint and ends at the node of the second one.
    const bool is_start = splits.front().first == 0;
    for (const osmium::object_id_type child : {last.first_child, last.second_child}) {
        const WayRecord& way = m_dataset.get_way(child);
        if ((is_start && way.front() == last.node.id) || (!is_start && way.back() == last.node.id)) {
            tag_way(child, result);
            return;
        }
    }
    throw AmbiguousBridgeWay{(boost::format("No way created by splitting way %1% %2% at node %3%.")
        % last.parent % (is_start ? "starts" : "ends") % last.node.id).str()};
}

void BridgeTagger::fallback(const BridgeCandidate& candidate, CandidateResult& result) {
    // location used to pick the part of a hinted way which has been split by an earlier bridge
    osmium::Location location;
    for (const BridgeEndpoint& endpoint : candidate.endpoints) {
        if (!endpoint.missing()) {
            location = endpoint.location.get();
            break;
        }
    }
    for (const BridgeEndpoint& endpoint : candidate.endpoints) {
        if (endpoint.way_hint) {
            const osmium::object_id_type way_id = m_locator.resolve_hint(endpoint.way_hint.get(),
                endpoint.missing() ? location : endpoint.location.get());
            std::cerr << boost::format("Warning: bridge %1%: no node inserted, tagging way %2% as a whole\n")
                % m_bridge_id % way_id;
            m_state = CandidateState::PATH_KNOWN;
            tag_way(way_id, result);
            result.fallback = true;
            return;
        }
    }
    if (candidate.chain.empty()) {
        throw AmbiguousBridgeWay{"No node inserted and no way given to tag instead."};
    }
}

void BridgeTagger::tag_chain(const id_vector& chain, CandidateResult& result) {
    for (const osmium::object_id_type id : chain) {
        tag_descendants(id, result);
    }
}

CandidateResult BridgeTagger::process(const BridgeCandidate& candidate) {
    m_state = CandidateState::SINGLE_POINT;
    m_bridge_id = candidate.bridge_id;
    CandidateResult result;
    if (candidate.endpoints.empty() || candidate.endpoints.size() > 2) {
        throw AmbiguousBridgeWay{(boost::format("Bridge has %1% endpoints, one or two are required.")
            % candidate.endpoints.size()).str()};
    }
    validate_hints(candidate);

    const bool both_present = candidate.endpoints.size() == 2 && !candidate.endpoints[0].missing()
        && !candidate.endpoints[1].missing();
    const bool different_hints = both_present && candidate.endpoints[0].way_hint && candidate.endpoints[1].way_hint
        && candidate.endpoints[0].way_hint.get() != candidate.endpoints[1].way_hint.get();
    bool chain_done = false;
    if (both_present && (different_hints || !candidate.chain.empty())) {
        const osmium::object_id_type way1 = resolve_endpoint_way(candidate.endpoints[0]);
        const osmium::object_id_type way2 = resolve_endpoint_way(candidate.endpoints[1]);
        if (!candidate.chain.empty()) {
            process_chain(candidate, candidate.chain, way1, way2, result);
            chain_done = true;
        } else if (way1 != way2) {
            process_pivot(candidate, way1, way2, result);
        } else {
            process_spatial(candidate, result);
        }
    } else {
        process_spatial(candidate, result);
    }
    if (!chain_done && !candidate.chain.empty()) {
        tag_chain(candidate.chain, result);
    }
    if (result.tagged_ways.empty()) {
        throw AmbiguousBridgeWay{"No way has been tagged."};
    }
    m_state = CandidateState::TAGGED;
    result.state = m_state;
    return result;
}

TaggerStatistics BridgeTagger::process_all(const std::vector<BridgeCandidate>& candidates) {
    if (m_dataset.way_count() == 0) {
        throw NoActiveDataset{"The dataset does not contain any way."};
    }
    TaggerStatistics statistics;
    for (const BridgeCandidate& candidate : candidates) {
        ++statistics.processed;
        const std::size_t mark = m_log.size();
        try {
            const CandidateResult result = process(candidate);
            ++statistics.tagged;
            statistics.splits += result.splits;
            if (result.fallback) {
                ++statistics.fallback;
            }
        } catch (BridgeError& e) {
            m_log.rollback(m_dataset, mark);
            ++statistics.failed;
            std::cerr << boost::format("Bridge %1%%2%: %3% (%4%): %5%\n") % candidate.bridge_id
                % describe_endpoints(candidate) % e.kind() % candidate_state_name(m_state) % e.what();
        } catch (std::exception& e) {
            m_log.rollback(m_dataset, mark);
            ++statistics.failed;
            std::cerr << boost::format("Bridge %1%%2%: unexpected error (%3%): %4%\n") % candidate.bridge_id
                % describe_endpoints(candidate) % candidate_state_name(m_state) % e.what();
        }
    }
    return statistics;
}
