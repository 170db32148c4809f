#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "xdmf/DataItem.hpp"
#include "xdmf/MixedCells.hpp"
#include "xdmf/TimeSeries.hpp"
#include "xdmf/XdmfTypes.hpp"
#include "xdmf/XmlTree.hpp"

#include <array>
#include <charconv>

namespace meshwire::xdmf
{

/// \cond DOXYGEN_EXCLUDE

struct TimeSeriesWriter::Impl
{
    Impl(const std::string& p, WriterConfig::DataFormat format) : path(p), items(p, format) {}

    std::string path;
    XmlDoc doc;
    xmlNodePtr domain = nullptr;
    xmlNodePtr collection = nullptr;
    xmlNsPtr xi = nullptr;
    DataItemWriter items;

    bool has_mesh = false;
    std::string mesh_name = "mesh";
    std::vector<mesh::CellBlock> cells;
};

static std::string shortest(double v)
{
    std::array<char, 32> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    return std::string(buf.data(), res.ptr);
}

static const char* const kXIncludeNs = "http://www.w3.org/2003/XInclude";

/// \endcond

TimeSeriesWriter::TimeSeriesWriter(const std::string& path, WriterConfig cfg)
    : cfg_(cfg), impl_(new Impl(path, cfg.data_format))
{
    xmlDoc* doc = xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0"));
    impl_->doc.reset(doc);
    xmlNodePtr root = xmlNewDocNode(doc, nullptr, reinterpret_cast<const xmlChar*>("Xdmf"), nullptr);
    xmlDocSetRootElement(doc, root);
    set_attr(root, "Version", "3.0");
    impl_->xi = xmlNewNs(root, reinterpret_cast<const xmlChar*>(kXIncludeNs),
                         reinterpret_cast<const xmlChar*>("xi"));

    impl_->domain = add_child(root, "Domain");
    impl_->collection = add_child(impl_->domain, "Grid");
    set_attr(impl_->collection, "Name", "TimeSeries_meshwire");
    set_attr(impl_->collection, "GridType", "Collection");
    set_attr(impl_->collection, "CollectionType", "Temporal");

    LOGD("xdmf: writing %s (%s data)\n", path.c_str(), data_format_name(cfg_.data_format));
}

TimeSeriesWriter::~TimeSeriesWriter()
{
    close();
}

void TimeSeriesWriter::close()
{
    if (impl_)
        impl_->items.close();
}

std::size_t TimeSeriesWriter::data_counter() const
{
    return impl_->items.data_counter();
}

void TimeSeriesWriter::write_points_cells(const mesh::DataArray& points,
                                          const std::vector<mesh::CellBlock>& cells)
{
    if (impl_->has_mesh)
        throw WriteError("Mesh already written to '" + impl_->path + "'");
    if (points.ndim() != 2 || (points.cols() != 2 && points.cols() != 3))
        throw WriteError("XDMF needs 2D or 3D points, got shape " + points.shape_string());
    if (cells.size() == 1)
        cell_type_to_topology(cells.front().type);
    else
        for (const auto& block : cells)
            mixed_index_of(block.type);

    xmlNodePtr grid =
        xmlNewDocNode(impl_->doc.get(), nullptr, reinterpret_cast<const xmlChar*>("Grid"), nullptr);
    xmlAddPrevSibling(impl_->collection, grid);
    set_attr(grid, "Name", impl_->mesh_name);
    set_attr(grid, "GridType", "Uniform");

    xmlNodePtr geo = add_child(grid, "Geometry");
    set_attr(geo, "GeometryType", points.cols() == 2 ? "XY" : "XYZ");
    impl_->items.write(geo, points);

    if (cells.size() == 1)
    {
        const auto& block = cells.front();
        xmlNodePtr topo = add_child(grid, "Topology");
        set_attr(topo, "TopologyType", cell_type_to_topology(block.type));
        set_attr(topo, "NumberOfElements", std::to_string(block.size()));
        impl_->items.write(topo, block.data);
    }
    else if (cells.size() > 1)
    {
        std::size_t total = 0;
        for (const auto& block : cells)
            total += block.size();
        xmlNodePtr topo = add_child(grid, "Topology");
        set_attr(topo, "TopologyType", "Mixed");
        set_attr(topo, "NumberOfElements", std::to_string(total));
        impl_->items.write(topo, flatten_mixed_cells(cells));
    }

    impl_->cells = cells;
    impl_->has_mesh = true;
    save_xml(impl_->doc.get(), impl_->path, cfg_.pretty);
}

void TimeSeriesWriter::write_data(double t, const mesh::PointData& point_data,
                                  const mesh::CellData& cell_data)
{
    if (!impl_->has_mesh)
        throw WriteError("write_points_cells() must be called before write_data()");

    const mesh::RawCellData raw = mesh::raw_from_cell_data(impl_->cells, cell_data);
    for (const auto& [name, data] : point_data)
        attribute_type(data);
    for (const auto& [name, data] : raw)
        attribute_type(data);

    xmlNodePtr grid = add_child(impl_->collection, "Grid");
    xmlNodePtr inc = add_child(grid, "include", impl_->xi);
    set_attr(inc, "xpointer",
             "xpointer(//Grid[@Name=\"" + impl_->mesh_name +
                 "\"]/*[self::Topology or self::Geometry])");
    xmlNodePtr time = add_child(grid, "Time");
    set_attr(time, "Value", shortest(t));

    auto add_attribute = [&](const std::string& name, const mesh::DataArray& data,
                             const char* center) {
        xmlNodePtr a = add_child(grid, "Attribute");
        set_attr(a, "Name", name);
        set_attr(a, "AttributeType", attribute_type(data));
        set_attr(a, "Center", center);
        impl_->items.write(a, data);
    };
    for (const auto& [name, data] : point_data)
        add_attribute(name, data, "Node");
    for (const auto& [name, data] : raw)
        add_attribute(name, data, "Cell");

    save_xml(impl_->doc.get(), impl_->path, cfg_.pretty);
}

} // namespace meshwire::xdmf
