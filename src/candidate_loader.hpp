/*
 * candidate_loader.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef CANDIDATE_LOADER_HPP_
#define CANDIDATE_LOADER_HPP_

#include <vector>

#include "bridge_candidate.hpp"

/**
 * \brief Abstract source of bridge candidates.
 */
class CandidateLoader {
public:
    virtual ~CandidateLoader() {
    }

    /**
     * Read all candidates.
     *
     * \throws std::runtime_error if the source cannot be read at all
     */
    virtual std::vector<BridgeCandidate> load() = 0;
};

#endif /* CANDIDATE_LOADER_HPP_ */
