/*
 * bridgesplit_config.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef BRIDGESPLIT_CONFIG_HPP_
#define BRIDGESPLIT_CONFIG_HPP_

#include <string>
#include <vector>

/**
 * \brief program configuration
 *
 * This class holds the configuration of the program on runtime.
 * The configuration has been provided by the user using the command line
 * arguments.
 */
class BridgeSplitConfig {
public:
    /// OSM file to read (Osmium will detect the file format based on the file name extension)
    std::string m_osm_file = "";

    /// CSV file with the bridge candidates
    std::string m_candidates_file = "";

    /// Write the edited dataset to this file. Nothing is written if empty.
    std::string m_output_file = "";

    /// Write the command log to this file, one command per line. Nothing is written if empty.
    std::string m_command_file = "";

    /**
     * Radius (meters) around a coordinate in which a way has to be found when a coordinate is
     * resolved to a way.
     */
    double m_search_radius = 5.0;

    /// add bridge:id=<candidate id> next to bridge=yes
    bool m_tag_bridge_id = true;

    /// Load all ways, not only the road classes bridges are usually tagged on.
    bool m_all_ways = false;

    /**
     * Selected location handler (by Osmium). See the [Osmium Concepts Manual](http://docs.osmcode.org/osmium-concepts-manual/#indexes)
     * for the list of available indexes.
     */
    std::string m_location_handler = "sparse_mem_array";

    /**
     * Keys of tags describing the identity of a way in the source data. They are not copied to
     * the two ways created by a split.
     */
    std::vector<std::string> m_identity_tag_keys {"osm_id", "@id"};

    /// print each inserted node and tagged way
    bool m_verbose = false;

    /// values of the highway key loaded unless m_all_ways is set
    static const std::vector<std::string>& road_classes() {
        static const std::vector<std::string> classes {
            "motorway", "motorway_link", "trunk", "trunk_link", "primary", "primary_link",
            "secondary", "secondary_link", "tertiary", "tertiary_link", "unclassified",
            "residential", "service", "services", "track", "road"
        };
        return classes;
    }
};

#endif /* BRIDGESPLIT_CONFIG_HPP_ */
