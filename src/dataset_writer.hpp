/*
 * dataset_writer.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef DATASET_WRITER_HPP_
#define DATASET_WRITER_HPP_

#include <string>

#include <osmium/memory/buffer.hpp>

#include "dataset.hpp"

/**
 * \brief Writes the live nodes and ways of the dataset to an OSM file.
 */
class DatasetWriter {
    const Dataset& m_dataset;

    void add_node(osmium::memory::Buffer& buffer, const NodeRecord& node) const;

    void add_way(osmium::memory::Buffer& buffer, const WayRecord& way) const;

public:
    explicit DatasetWriter(const Dataset& dataset);

    /**
     * Build OSM objects for all live ways and the nodes they reference. Nodes come first, objects
     * of each type are ordered by ID.
     */
    osmium::memory::Buffer to_buffer() const;

    /**
     * Write the dataset to a file. The file format is derived from the file name, an existing
     * file is overwritten.
     */
    void write(const std::string& filename) const;
};

#endif /* DATASET_WRITER_HPP_ */
