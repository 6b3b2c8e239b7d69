/*
 * csv_candidate_loader.cpp
 *
 *  Created on:  2026-10-19
 */

#include "csv_candidate_loader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <boost/format.hpp>

CsvCandidateLoader::CsvCandidateLoader(const std::string& filename) :
    m_filename(filename) {
}

/*static*/ std::vector<std::string> CsvCandidateLoader::split(const std::string& line, const char separator) {
    std::vector<std::string> fields;
    size_t pos = 0;
    size_t next = line.find_first_of(separator, pos);
    while (true) {
        fields.push_back(line.substr(pos, next - pos));
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
        next = line.find_first_of(separator, pos);
    }
    for (std::string& field : fields) {
        const size_t first = field.find_first_not_of(" \t");
        if (first == std::string::npos) {
            field.clear();
        } else {
            field = field.substr(first, field.find_last_not_of(" \t") - first + 1);
        }
    }
    return fields;
}

/*static*/ double CsvCandidateLoader::parse_coordinate(const std::string& field) {
    char* end;
    errno = 0;
    const double value = std::strtod(field.c_str(), &end);
    if (errno != 0 || end == field.c_str() || *end != '\0') {
        throw std::runtime_error{(boost::format("'%1%' is not a coordinate") % field).str()};
    }
    return value;
}

/*static*/ osmium::object_id_type CsvCandidateLoader::parse_id(const std::string& field) {
    char* end;
    errno = 0;
    const long long value = std::strtoll(field.c_str(), &end, 10);
    if (errno != 0 || end == field.c_str() || *end != '\0') {
        throw std::runtime_error{(boost::format("'%1%' is not a way ID") % field).str()};
    }
    return static_cast<osmium::object_id_type>(value);
}

/*static*/ BridgeEndpoint CsvCandidateLoader::parse_endpoint(const std::string& lat, const std::string& lon,
        const std::string& way) {
    BridgeEndpoint endpoint;
    if (!way.empty()) {
        endpoint.way_hint = parse_id(way);
    }
    if (lat.empty() || lon.empty()) {
        if (!lat.empty() || !lon.empty()) {
            throw std::runtime_error{"only one of latitude and longitude is given"};
        }
        return endpoint;
    }
    const double y = parse_coordinate(lat);
    const double x = parse_coordinate(lon);
    // legacy marker of a missing endpoint
    if (x == -1.0 && y == -1.0) {
        return endpoint;
    }
    const osmium::Location location {x, y};
    if (!location.valid()) {
        throw std::runtime_error{(boost::format("(%1%, %2%) is outside the valid range") % lat % lon).str()};
    }
    endpoint.location = location;
    return endpoint;
}

/*static*/ BridgeCandidate CsvCandidateLoader::parse_line(const std::string& line) {
    const std::vector<std::string> fields = split(line, ',');
    if (fields.size() < 7 || fields.size() > 8) {
        throw std::runtime_error{(boost::format("expected 7 or 8 columns, got %1%") % fields.size()).str()};
    }
    BridgeCandidate candidate;
    candidate.bridge_id = fields[0];
    if (candidate.bridge_id.empty()) {
        throw std::runtime_error{"bridge ID is empty"};
    }
    candidate.endpoints.push_back(parse_endpoint(fields[1], fields[2], fields[3]));
    if (!fields[4].empty() || !fields[5].empty() || !fields[6].empty()) {
        candidate.endpoints.push_back(parse_endpoint(fields[4], fields[5], fields[6]));
    }
    if (fields.size() == 8 && !fields[7].empty()) {
        for (const std::string& id : split(fields[7], ';')) {
            if (!id.empty()) {
                candidate.chain.push_back(parse_id(id));
            }
        }
    }
    return candidate;
}

std::vector<BridgeCandidate> CsvCandidateLoader::read(std::istream& input) {
    std::vector<BridgeCandidate> candidates;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line_number == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        if (line_number == 1 && line.compare(0, 9, "bridge_id") == 0) {
            continue;
        }
        try {
            candidates.push_back(parse_line(line));
        } catch (std::runtime_error& e) {
            ++m_errors;
            std::cerr << boost::format("%1%, line %2%: %3%, line skipped\n") % m_filename % line_number % e.what();
        }
    }
    return candidates;
}

std::vector<BridgeCandidate> CsvCandidateLoader::load() {
    std::ifstream csv_read;
    csv_read.open(m_filename, std::ios::in);
    if (!csv_read.good()) {
        throw std::runtime_error{"Open file " + m_filename + " failed."};
    }
    return read(csv_read);
}
