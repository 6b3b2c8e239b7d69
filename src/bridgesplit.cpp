/*
 * bridgesplit.cpp
 *
 *  Created on:  2026-10-19
 */

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include "bridge_errors.hpp"
#include "bridge_tagger.hpp"
#include "bridgesplit_config.hpp"
#include "command_log.hpp"
#include "coordinate_service.hpp"
#include "csv_candidate_loader.hpp"
#include "dataset.hpp"
#include "dataset_reader_handler.hpp"
#include "dataset_writer.hpp"

/**
 * \mainpage
 * bridgesplit tags bridges on a road network read from an OSM file. Each bridge is given by the
 * approximate locations of its ends. The ways are split at the ends of the bridge and the ways
 * between the ends get the tag bridge=yes.
 *
 * All changes are recorded as a list of edit commands which can be written to a file and applied
 * by other tools. The edited road network can be written as OSM file, too.
 */


/**
 * \brief print program usage instructions and terminate the program
 *
 * \param argv command line argument array (from main method)
 * \param message error message to output (optional)
 */
void print_help(char* argv[], std::string message = "", const int return_code = 1) {
    if (message != "") {
        std::cerr << message << "\n";
    }
    std::cerr << "Usage: " << argv[0] << " [OPTIONS] OSMFILE CANDIDATES.csv\n" \
    "  -A, --all-ways                   load all ways, not only roads\n" \
    "  -c FILE, --commands=FILE         write the edit commands to FILE\n" \
    "  -h, --help                       print this help\n" \
    "  -l, --location-handler=HANDLER   use HANDLER as location handler\n" \
    "  --no-bridge-id                   don't add bridge:id tags\n" \
    "  -o FILE, --output=FILE           write the edited ways and their nodes to FILE\n" \
    "  -r METERS, --radius=METERS       maximum distance of a bridge end to the road (default: 5)\n" \
    "  -v, --verbose                    report every inserted node and tagged way\n\n" \
    "CANDIDATES.csv has a header line and the columns\n" \
    "  bridge_id,lat1,lon1,way1,lat2,lon2,way2,chain\n" \
    "where chain is a list of way IDs separated by semicolons.\n";
    exit(return_code);
}

int main(int argc, char* argv[]) {
    // parsing command line arguments
    static struct option long_options[] = {
            {"help",   no_argument, 0, 'h'},
            {"all-ways", no_argument, 0, 'A'},
            {"commands", required_argument, 0, 'c'},
            {"location-handler", required_argument, 0, 'l'},
            {"no-bridge-id", no_argument, 0, 200},
            {"output", required_argument, 0, 'o'},
            {"radius", required_argument, 0, 'r'},
            {"verbose", no_argument, 0, 'v'},
            {0, 0, 0, 0}
        };
    BridgeSplitConfig config;
    while (true) {
        int c = getopt_long(argc, argv, "hAc:l:o:r:v", long_options, 0);
        if (c == -1) {
            break;
        }

        switch (c) {
            case 'h':
                print_help(argv, "", 0);
                break;
            case 'A':
                config.m_all_ways = true;
                break;
            case 'c':
                config.m_command_file = optarg;
                break;
            case 'l':
                config.m_location_handler = optarg;
                break;
            case 200:
                config.m_tag_bridge_id = false;
                break;
            case 'o':
                config.m_output_file = optarg;
                break;
            case 'r':
                config.m_search_radius = atof(optarg);
                if (config.m_search_radius <= 0) {
                    print_help(argv, "ERROR option --radius: The radius must be a positive number.");
                }
                break;
            case 'v':
                config.m_verbose = true;
                break;
            default:
                exit(1);
        }
    }

    int remaining_args = argc - optind;
    if (remaining_args != 2) {
        print_help(argv, "ERROR: wrong arguments.");
    } else {
        config.m_osm_file = argv[optind];
        config.m_candidates_file = argv[optind + 1];
    }

    Dataset dataset;
    std::vector<BridgeCandidate> candidates;
    try {
        read_dataset(config, dataset);
        CsvCandidateLoader loader {config.m_candidates_file};
        candidates = loader.load();
        std::cerr << boost::format("%1% bridges read from %2%, %3% lines skipped\n") % candidates.size()
            % config.m_candidates_file % loader.errors();
    } catch (std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    time_t ts = time(NULL);
    std::cerr << "Tagging bridges" << std::endl;
    CommandLog log;
    MercatorCoordinateService coordinates;
    BridgeTagger tagger {dataset, log, coordinates, config};
    TaggerStatistics statistics;
    try {
        statistics = tagger.process_all(candidates);
    } catch (NoActiveDataset& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "… needed " << static_cast<int>(time(NULL) - ts) << " seconds" << std::endl;
    std::cerr << boost::format("%1% bridges processed: %2% tagged (%3% without split), %4% failed, %5% nodes inserted, %6% commands\n")
        % statistics.processed % statistics.tagged % statistics.fallback % statistics.failed % statistics.splits
        % log.size();

    try {
        if (!config.m_command_file.empty()) {
            std::ofstream command_file {config.m_command_file};
            if (!command_file.good()) {
                throw std::runtime_error{"Open file " + config.m_command_file + " failed."};
            }
            log.write(command_file);
        }
        if (!config.m_output_file.empty()) {
            ts = time(NULL);
            std::cerr << "Writing " << config.m_output_file << " ";
            DatasetWriter writer {dataset};
            writer.write(config.m_output_file);
            std::cerr << "… needed " << static_cast<int>(time(NULL) - ts) << " seconds" << std::endl;
        }
    } catch (std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
