#pragma once
#include "mesh/Mesh.hpp"
#include "xdmf/WriterConfig.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

/**
 * @file TimeSeries.hpp
 * @brief XDMF3 temporal collections: one static mesh, many data frames.
 *
 * @details
 * Layout read and written:
 *
 * @rst
 * .. code-block:: xml
 *
 *    <Xdmf Version="3.0">
 *      <Domain>
 *        <Grid Name="mesh" GridType="Uniform">
 *          <Geometry GeometryType="XYZ"> <DataItem .../> </Geometry>
 *          <Topology TopologyType="Triangle" NumberOfElements="2"> <DataItem .../> </Topology>
 *        </Grid>
 *        <Grid Name="TimeSeries_meshwire" GridType="Collection" CollectionType="Temporal">
 *          <Grid>
 *            <xi:include xpointer="xpointer(//Grid[@Name=&quot;mesh&quot;]/*[self::Topology or self::Geometry])"/>
 *            <Time Value="0.5"/>
 *            <Attribute Name="p" AttributeType="Scalar" Center="Node"> <DataItem .../> </Attribute>
 *          </Grid>
 *        </Grid>
 *      </Domain>
 *    </Xdmf>
 * @endrst
 *
 * The reader also accepts the mesh grid nested as the first ``Uniform`` grid of the collection;
 * a sibling mesh grid takes precedence. :cpp:func:`TimeSeriesReader::read_points_cells` must be
 * called before :cpp:func:`TimeSeriesReader::read_data`, and
 * :cpp:func:`TimeSeriesWriter::write_points_cells` before :cpp:func:`TimeSeriesWriter::write_data`.
 */

namespace meshwire::xdmf
{

struct Frame
{
    double time = 0.0;
    mesh::PointData point_data;
    mesh::CellData cell_data;
};

class TimeSeriesReader
{
  public:
    explicit TimeSeriesReader(const std::string& path);
    ~TimeSeriesReader();

    TimeSeriesReader(const TimeSeriesReader&) = delete;
    TimeSeriesReader& operator=(const TimeSeriesReader&) = delete;

    std::size_t num_steps() const;

    // Points and cells of the static mesh grid; data members of the result are empty.
    mesh::Mesh read_points_cells();
    Frame read_data(std::size_t k);

    // Releases every HDF5 store opened so far. Idempotent.
    void close();

    // internal API only visible in tests
    std::size_t debug_open_stores() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class TimeSeriesWriter
{
  public:
    explicit TimeSeriesWriter(const std::string& path, WriterConfig cfg = {});
    ~TimeSeriesWriter();

    TimeSeriesWriter(const TimeSeriesWriter&) = delete;
    TimeSeriesWriter& operator=(const TimeSeriesWriter&) = delete;

    void write_points_cells(const mesh::DataArray& points,
                            const std::vector<mesh::CellBlock>& cells);
    void write_data(double t, const mesh::PointData& point_data = {},
                    const mesh::CellData& cell_data = {});

    // Closes the HDF5 store. Idempotent.
    void close();

    std::size_t data_counter() const;

  private:
    WriterConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meshwire::xdmf
