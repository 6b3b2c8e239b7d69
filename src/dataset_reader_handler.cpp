/*
 * dataset_reader_handler.cpp
 *
 *  Created on:  2026-10-19
 */

#include "dataset_reader_handler.hpp"

#include <ctime>
#include <iostream>

#include <boost/format.hpp>
#include <osmium/index/map/all.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/tags/taglist.hpp>
#include <osmium/visitor.hpp>

#include "bridge_errors.hpp"
#include "definitions.hpp"

DatasetReaderHandler::DatasetReaderHandler(Dataset& dataset, const BridgeSplitConfig& config) :
    m_dataset(dataset),
    m_filter(false),
    m_all_ways(config.m_all_ways) {
    for (const std::string& value : BridgeSplitConfig::road_classes()) {
        m_filter.add_rule(true, "highway", value);
    }
}

void DatasetReaderHandler::way(const osmium::Way& way) {
    if (!m_all_ways && !osmium::tags::match_any_of(way.tags(), m_filter)) {
        return;
    }
    if (way.nodes().size() < 2) {
        ++m_skipped;
        return;
    }
    for (const osmium::NodeRef& node_ref : way.nodes()) {
        if (!node_ref.location().valid()) {
            ++m_skipped;
            return;
        }
    }
    id_vector nodes;
    nodes.reserve(way.nodes().size());
    for (const osmium::NodeRef& node_ref : way.nodes()) {
        m_dataset.add_node(NodeRecord{node_ref.ref(), node_ref.location()});
        nodes.push_back(node_ref.ref());
    }
    tag_map tags;
    for (const osmium::Tag& tag : way.tags()) {
        tags.emplace(tag.key(), tag.value());
    }
    m_dataset.add_way(WayRecord{way.id(), std::move(nodes), std::move(tags)});
}

void read_dataset(const BridgeSplitConfig& config, Dataset& dataset) {
    time_t ts = time(NULL);
    std::cerr << "Loading " << config.m_osm_file << " ";
    DatasetReaderHandler handler {dataset, config};
    try {
        const auto& map_factory = osmium::index::MapFactory<osmium::unsigned_object_id_type, osmium::Location>::instance();
        auto location_index = map_factory.create_map(config.m_location_handler);
        auto negative_location_index = map_factory.create_map(config.m_location_handler);
        location_handler_type location_handler(*location_index, *negative_location_index);
        location_handler.ignore_errors();
        osmium::io::Reader reader{config.m_osm_file, osmium::osm_entity_bits::node | osmium::osm_entity_bits::way};
        osmium::apply(reader, location_handler, handler);
        reader.close();
    } catch (std::exception& e) {
        std::cerr << std::endl;
        throw NoActiveDataset{(boost::format("Reading %1% failed: %2%") % config.m_osm_file % e.what()).str()};
    }
    std::cerr << "… needed " << static_cast<int>(time(NULL) - ts) << " seconds" << std::endl;
    std::cerr << boost::format("%1% ways and %2% nodes loaded, %3% ways with broken geometry skipped\n")
        % dataset.way_count() % dataset.node_count() % handler.skipped_ways();
    if (dataset.way_count() == 0) {
        throw NoActiveDataset{(boost::format("%1% does not contain any way to work on.") % config.m_osm_file).str()};
    }
}
