/*
 * bridge_tagger.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef BRIDGE_TAGGER_HPP_
#define BRIDGE_TAGGER_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "bridge_candidate.hpp"
#include "bridgesplit_config.hpp"
#include "command_log.hpp"
#include "coordinate_service.hpp"
#include "dataset.hpp"
#include "geometry_projector.hpp"
#include "way_locator.hpp"
#include "way_split_engine.hpp"

/**
 * Progress of the processing of a bridge candidate.
 */
enum class CandidateState : char {
    /// nothing inserted yet
    SINGLE_POINT = 1,
    /// first endpoint inserted, the second one is pending
    AWAITING_SECOND_ENDPOINT = 2,
    /// all endpoints processed, the ways to tag are known
    PATH_KNOWN = 3,
    TAGGED = 4
};

const char* candidate_state_name(const CandidateState state) noexcept;

/**
 * Outcome of a successfully processed candidate.
 */
struct CandidateResult {
    CandidateState state = CandidateState::SINGLE_POINT;

    /// ways carrying the bridge tags now
    id_vector tagged_ways;

    /// number of inserted nodes
    std::size_t splits = 0;

    /// no node could be inserted, the hinted way was tagged as a whole
    bool fallback = false;
};

struct TaggerStatistics {
    std::size_t processed = 0;
    std::size_t tagged = 0;
    std::size_t failed = 0;
    std::size_t fallback = 0;
    std::size_t splits = 0;
};

/**
 * \brief Splits ways at the ends of bridges and tags the ways between them.
 *
 * Candidates are processed one after another. Each candidate either succeeds completely or leaves
 * neither commands in the log nor changes in the dataset.
 */
class BridgeTagger {
    Dataset& m_dataset;
    CommandLog& m_log;
    const BridgeSplitConfig& m_config;
    GeometryProjector m_projector;
    WaySplitEngine m_split_engine;
    WayLocator m_locator;

    /// state of the candidate processed at the moment
    CandidateState m_state = CandidateState::SINGLE_POINT;

    /// ID of the candidate processed at the moment
    std::string m_bridge_id;

    /**
     * \throws WayNotFound if a way ID given by the candidate has never been part of the dataset
     */
    void validate_hints(const BridgeCandidate& candidate) const;

    /**
     * Get the live way an endpoint is located on. Uses the hint if the endpoint has one.
     */
    osmium::object_id_type resolve_endpoint_way(const BridgeEndpoint& endpoint) const;

    /**
     * Check if a way found by a spatial search is tagged as part of another bridge already.
     */
    bool tagged_elsewhere(const BridgeEndpoint& endpoint, const osmium::object_id_type way_id) const;

    /**
     * Insert a node into a way. Failures of the projection are reported as warning.
     */
    boost::optional<SplitResult> try_insert(const osmium::object_id_type way_id, const osmium::Location& location,
            CandidateResult& result);

    /**
     * Set a tag unless the way has this tag with this value already.
     *
     * \returns true if a command was executed
     */
    bool set_tag(const osmium::object_id_type way_id, const std::string& key, const std::string& value);

    /**
     * Tag a way as part of the current bridge. Ways whose bridge:id names another bridge are
     * skipped with a warning.
     */
    void tag_way(const osmium::object_id_type way_id, CandidateResult& result);

    /// Tag all live ways descending from a way except those belonging to other bridges.
    void tag_descendants(const osmium::object_id_type way_id, CandidateResult& result);

    /**
     * Get the node two ways share at their ends.
     *
     * \throws PivotNotFound
     */
    static osmium::object_id_type find_pivot(const WayRecord& way1, const WayRecord& way2);

    /**
     * Get the node a way shares with one of the live descendants of another way.
     */
    boost::optional<osmium::object_id_type> find_pivot_in(const osmium::object_id_type way_id,
            const osmium::object_id_type other) const;

    /**
     * Get the way created by a split whose ends are the given nodes.
     */
    boost::optional<osmium::object_id_type> child_with_ends(const SplitResult& split, const osmium::object_id_type a,
            const osmium::object_id_type b) const;

    void process_pivot(const BridgeCandidate& candidate, const osmium::object_id_type way1,
            const osmium::object_id_type way2, CandidateResult& result);

    void process_chain(const BridgeCandidate& candidate, const id_vector& chain, const osmium::object_id_type way1,
            const osmium::object_id_type way2, CandidateResult& result);

    void process_spatial(const BridgeCandidate& candidate, CandidateResult& result);

    void fallback(const BridgeCandidate& candidate, CandidateResult& result);

    void tag_chain(const id_vector& chain, CandidateResult& result);

public:
    BridgeTagger(Dataset& dataset, CommandLog& log, const CoordinateService& coordinates,
            const BridgeSplitConfig& config);

    /**
     * Process a single candidate.
     *
     * Commands executed before a failure stay in the log, use process_all() to roll them back
     * automatically.
     *
     * \throws BridgeError if the candidate cannot be processed
     */
    CandidateResult process(const BridgeCandidate& candidate);

    /**
     * Process all candidates. Failing candidates are reported, their commands are rolled back and
     * the processing continues with the next candidate.
     *
     * \throws NoActiveDataset if the dataset does not contain any way
     */
    TaggerStatistics process_all(const std::vector<BridgeCandidate>& candidates);

    CandidateState state() const noexcept {
        return m_state;
    }
};

#endif /* BRIDGE_TAGGER_HPP_ */
