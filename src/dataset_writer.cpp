/*
 * dataset_writer.cpp
 *
 *  Created on:  2026-10-19
 */

#include "dataset_writer.hpp"

#include <set>

#include <osmium/builder/osm_object_builder.hpp>
#include <osmium/io/any_output.hpp>
#include <osmium/io/header.hpp>
#include <osmium/io/writer.hpp>
#include <osmium/osm/node_ref.hpp>

DatasetWriter::DatasetWriter(const Dataset& dataset) :
    m_dataset(dataset) {
}

void DatasetWriter::add_node(osmium::memory::Buffer& buffer, const NodeRecord& node) const {
    {
        osmium::builder::NodeBuilder builder{buffer};
        builder.set_id(node.id);
        builder.set_location(node.location);
        builder.set_user("");
    }
    buffer.commit();
}

void DatasetWriter::add_way(osmium::memory::Buffer& buffer, const WayRecord& way) const {
    {
        osmium::builder::WayBuilder builder{buffer};
        builder.set_id(way.id);
        builder.set_user("");
        {
            osmium::builder::WayNodeListBuilder wnl_builder{builder};
            for (const osmium::object_id_type id : way.nodes) {
                wnl_builder.add_node_ref(osmium::NodeRef{id, m_dataset.get_node(id).location});
            }
        }
        {
            osmium::builder::TagListBuilder tl_builder{builder};
            for (const auto& tag : way.tags) {
                tl_builder.add_tag(tag.first, tag.second);
            }
        }
    }
    buffer.commit();
}

osmium::memory::Buffer DatasetWriter::to_buffer() const {
    constexpr const std::size_t initial_buffer_size = 1024 * 1024;
    osmium::memory::Buffer buffer{initial_buffer_size, osmium::memory::Buffer::auto_grow::yes};
    std::set<osmium::object_id_type> referenced;
    for (const auto& way : m_dataset.ways()) {
        referenced.insert(way.second.nodes.begin(), way.second.nodes.end());
    }
    for (const osmium::object_id_type id : referenced) {
        add_node(buffer, m_dataset.get_node(id));
    }
    for (const auto& way : m_dataset.ways()) {
        add_way(buffer, way.second);
    }
    return buffer;
}

void DatasetWriter::write(const std::string& filename) const {
    osmium::io::Header header;
    header.set("generator", "bridgesplit");
    osmium::io::Writer writer{filename, header, osmium::io::overwrite::allow};
    writer(to_buffer());
    writer.close();
}
