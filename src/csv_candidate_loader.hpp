/*
 * csv_candidate_loader.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef CSV_CANDIDATE_LOADER_HPP_
#define CSV_CANDIDATE_LOADER_HPP_

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "candidate_loader.hpp"

/**
 * \brief Reads bridge candidates from a CSV file.
 *
 * The file starts with a header line, each other line describes one bridge with the columns
 * `bridge_id,lat1,lon1,way1,lat2,lon2,way2,chain`. The chain is a list of way IDs separated by
 * semicolons. Empty coordinates or the coordinates -1,-1 mark a missing endpoint. If all three
 * columns of the second endpoint are empty, the bridge has only one endpoint.
 *
 * Lines which cannot be parsed are reported and skipped.
 */
class CsvCandidateLoader : public CandidateLoader {
    std::string m_filename;

    /// number of skipped lines
    std::size_t m_errors = 0;

    static std::vector<std::string> split(const std::string& line, const char separator);

    static double parse_coordinate(const std::string& field);

    static osmium::object_id_type parse_id(const std::string& field);

    static BridgeEndpoint parse_endpoint(const std::string& lat, const std::string& lon, const std::string& way);

public:
    explicit CsvCandidateLoader(const std::string& filename);

    /**
     * \throws std::runtime_error if the file cannot be opened
     */
    std::vector<BridgeCandidate> load() override;

    /**
     * Read candidates from a stream.
     */
    std::vector<BridgeCandidate> read(std::istream& input);

    /**
     * Parse a single line.
     *
     * \throws std::runtime_error if the line is malformed
     */
    static BridgeCandidate parse_line(const std::string& line);

    std::size_t errors() const noexcept {
        return m_errors;
    }
};

#endif /* CSV_CANDIDATE_LOADER_HPP_ */
