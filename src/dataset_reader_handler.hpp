/*
 * dataset_reader_handler.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef DATASET_READER_HANDLER_HPP_
#define DATASET_READER_HANDLER_HPP_

#include <cstddef>

#include <osmium/handler.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/tags/filter.hpp>

#include "bridgesplit_config.hpp"
#include "dataset.hpp"

/**
 * \brief Osmium handler filling the dataset with the ways of the road network.
 *
 * The handler has to run after a location handler because it needs the locations of the nodes of
 * the ways.
 */
class DatasetReaderHandler : public osmium::handler::Handler {
    Dataset& m_dataset;

    /// ways matching this filter are loaded
    osmium::TagsFilter m_filter;

    bool m_all_ways;

    std::size_t m_skipped = 0;

public:
    DatasetReaderHandler() = delete;

    DatasetReaderHandler(Dataset& dataset, const BridgeSplitConfig& config);

    void way(const osmium::Way& way);

    /// number of ways which were not loaded because their geometry is broken
    std::size_t skipped_ways() const noexcept {
        return m_skipped;
    }
};

/**
 * Read the OSM file given by the configuration into the dataset.
 *
 * \throws NoActiveDataset if the file cannot be read or does not contain any way to work on
 */
void read_dataset(const BridgeSplitConfig& config, Dataset& dataset);

#endif /* DATASET_READER_HANDLER_HPP_ */
