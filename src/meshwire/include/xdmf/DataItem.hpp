#pragma once
#include "mesh/DataArray.hpp"
#include "xdmf/WriterConfig.hpp"
#include "xdmf/XmlTree.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <hdf5.h>

/**
 * @file DataItem.hpp
 * @brief ``DataItem`` descriptors and the heavy-data resolvers behind them.
 *
 * @details
 * A ``DataItem`` element is parsed eagerly into a :cpp:struct:`DataItemRef`; every attribute
 * combination the format forbids fails there with :cpp:class:`meshwire::FormatError` or
 * :cpp:class:`meshwire::UnsupportedTypeError`, before any payload is touched.
 *
 * :cpp:class:`DataItemReader` materializes a reference into a :cpp:class:`mesh::DataArray`.
 * HDF5 stores are opened read-only on first use, cached by resolved path and closed exactly once
 * by :cpp:func:`DataItemReader::close` (also called by the destructor).
 *
 * :cpp:class:`DataItemWriter` goes the other way: it appends a ``DataItem`` element for an array
 * and places the payload inline, in a sidecar ``.bin`` file, or in the session's HDF5 file.
 * Out-of-line names come from a counter that is never reset within a session.
 *
 * @rst
 * .. code-block:: xml
 *
 *    <DataItem DataType="Float" Dimensions="4 3" Format="HDF" Precision="8">series.h5:/data0</DataItem>
 * @endrst
 */

namespace meshwire::xdmf
{

struct DataItemRef
{
    WriterConfig::DataFormat format = WriterConfig::DataFormat::XML;
    std::vector<std::size_t> dimensions;
    mesh::DType dtype = mesh::DType::Float32;
    std::string location; // inline text, sidecar file name, or "file:/path"
};

std::vector<std::size_t> parse_dimensions(const std::string& s);
std::string format_dimensions(const std::vector<std::size_t>& dims);

DataItemRef parse_data_item(const xmlNode* node);

class DataItemReader
{
  public:
    // Relative sidecar and store names resolve against `base_dir`.
    explicit DataItemReader(std::filesystem::path base_dir);
    ~DataItemReader();

    DataItemReader(const DataItemReader&) = delete;
    DataItemReader& operator=(const DataItemReader&) = delete;

    mesh::DataArray read(const DataItemRef& ref);
    mesh::DataArray read(const xmlNode* node) { return read(parse_data_item(node)); }

    void close();

    // internal API only visible in tests
    std::size_t debug_open_stores() const noexcept { return stores_.size(); }

  private:
    mesh::DataArray read_inline(const DataItemRef& ref) const;
    mesh::DataArray read_sidecar(const DataItemRef& ref) const;
    mesh::DataArray read_store(const DataItemRef& ref);
    hid_t store(const std::filesystem::path& path);

    std::filesystem::path base_;
    std::map<std::string, hid_t> stores_;
};

class DataItemWriter
{
  public:
    // Sidecars are named after `xdmf_path`'s stem; HDF creates `<stem>.h5` here.
    DataItemWriter(const std::filesystem::path& xdmf_path, WriterConfig::DataFormat format);
    ~DataItemWriter();

    DataItemWriter(const DataItemWriter&) = delete;
    DataItemWriter& operator=(const DataItemWriter&) = delete;

    // Appends <DataItem> under `parent` holding `data`; Dimensions is the array's shape.
    xmlNodePtr write(xmlNodePtr parent, const mesh::DataArray& data);

    void close();

    std::size_t data_counter() const noexcept { return counter_; }
    const std::filesystem::path& store_path() const noexcept { return h5_path_; }

  private:
    std::string write_sidecar(const mesh::DataArray& data);
    std::string write_store(const mesh::DataArray& data);

    WriterConfig::DataFormat format_;
    std::filesystem::path dir_;
    std::string stem_;
    std::filesystem::path h5_path_;
    hid_t file_ = -1;
    std::size_t counter_ = 0;
};

} // namespace meshwire::xdmf
