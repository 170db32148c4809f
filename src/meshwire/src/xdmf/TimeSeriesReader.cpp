#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "mesh/CellTypes.hpp"
#include "xdmf/DataItem.hpp"
#include "xdmf/MixedCells.hpp"
#include "xdmf/TimeSeries.hpp"
#include "xdmf/XdmfTypes.hpp"
#include "xdmf/XmlTree.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>

namespace meshwire::xdmf
{

namespace fs = std::filesystem;

struct TimeSeriesReader::Impl
{
    explicit Impl(const std::string& p)
        : path(p), items(fs::path(p).parent_path())
    {
    }

    std::string path;
    XmlDoc doc;
    xmlNodePtr collection = nullptr;
    xmlNodePtr mesh_grid = nullptr;
    std::vector<xmlNodePtr> frames;
    DataItemReader items;
    std::optional<std::vector<mesh::CellBlock>> cells;
};

static bool grid_type_is(const xmlNode* g, const char* type)
{
    const auto t = attr(g, "GridType");
    return t && *t == type;
}

static xmlNodePtr single_data_item(xmlNodePtr parent, const char* what)
{
    auto items = element_children(parent);
    if (items.size() != 1)
        throw FormatError(std::string(what) + " must hold exactly one DataItem, found " +
                          std::to_string(items.size()));
    return items.front();
}

TimeSeriesReader::TimeSeriesReader(const std::string& path) : impl_(new Impl(path))
{
    impl_->doc = parse_xml_file(path);
    xmlNodePtr root = xmlDocGetRootElement(impl_->doc.get());
    if (!has_name(root, "Xdmf"))
        throw FormatError("'" + path + "' has no Xdmf root element");

    const auto version = attr(root, "Version");
    if (!version)
        throw FormatError("Xdmf root element without Version");
    if (version->substr(0, version->find('.')) != "3")
        throw FormatError("Unknown XDMF version " + *version + " (need 3.x)");

    const auto domains = element_children(root);
    if (domains.size() != 1 || !has_name(domains.front(), "Domain"))
        throw FormatError("Xdmf root must hold exactly one Domain");
    const auto grids = element_children(domains.front(), "Grid");

    for (xmlNodePtr g : grids)
    {
        if (!grid_type_is(g, "Collection"))
            continue;
        if (impl_->collection)
            throw FormatError("Domain holds more than one Collection grid");
        impl_->collection = g;
    }
    if (!impl_->collection)
        throw FormatError("Couldn't find the temporal collection grid");
    if (attr(impl_->collection, "CollectionType").value_or("") != "Temporal")
        throw FormatError("Collection grid is not Temporal");

    // Last Uniform sibling of the collection, else the first Uniform grid inside it
    for (xmlNodePtr g : grids)
    {
        if (grid_type_is(g, "Uniform"))
            impl_->mesh_grid = g;
    }
    impl_->frames = element_children(impl_->collection, "Grid");
    if (!impl_->mesh_grid)
    {
        for (xmlNodePtr g : impl_->frames)
        {
            if (grid_type_is(g, "Uniform"))
            {
                impl_->mesh_grid = g;
                break;
            }
        }
    }
    if (!impl_->mesh_grid)
        throw FormatError("Couldn't find the mesh grid");

    LOGD("xdmf: %s has %zu time steps\n", path.c_str(), impl_->frames.size());
}

TimeSeriesReader::~TimeSeriesReader()
{
    close();
}

void TimeSeriesReader::close()
{
    if (impl_)
        impl_->items.close();
}

std::size_t TimeSeriesReader::num_steps() const
{
    return impl_->frames.size();
}

std::size_t TimeSeriesReader::debug_open_stores() const
{
    return impl_->items.debug_open_stores();
}

mesh::Mesh TimeSeriesReader::read_points_cells()
{
    mesh::Mesh m;
    bool have_points = false;
    std::vector<mesh::CellBlock> cells;

    for (xmlNodePtr c : element_children(impl_->mesh_grid))
    {
        if (has_name(c, "Topology"))
        {
            mesh::DataArray data = impl_->items.read(single_data_item(c, "Topology"));

            // XDMF3 spells it Type, XDMF2 TopologyType
            const auto type3 = attr(c, "Type");
            const auto type2 = attr(c, "TopologyType");
            if (type3 && type2)
                throw FormatError("Topology has both Type and TopologyType");
            if (!type3 && !type2)
                throw FormatError("Topology without a type");
            const std::string topology = type3 ? *type3 : *type2;

            if (topology == "Mixed")
            {
                cells = translate_mixed_cells(data);
                continue;
            }
            const std::string& type = topology_to_cell_type(topology);
            const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(type));
            if (!mesh::dtype_is_integer(data.dtype()))
                throw FormatError("Topology data must be integer, got " +
                                  std::string(mesh::dtype_name(data.dtype())));
            if (data.ndim() == 1)
            {
                if (data.size() % arity != 0)
                    throw FormatError("Topology holds " + std::to_string(data.size()) +
                                      " indices, not a multiple of " + std::to_string(arity));
                data.reshape({data.size() / arity, arity});
            }
            if (data.ndim() != 2 || data.cols() != arity)
                throw FormatError("Topology '" + topology + "' data has shape " +
                                  data.shape_string() + ", expected (n, " +
                                  std::to_string(arity) + ")");
            cells.clear();
            cells.push_back(mesh::CellBlock{type, std::move(data)});
        }
        else if (has_name(c, "Geometry"))
        {
            const auto geometry = attr(c, "GeometryType");
            if (geometry && *geometry != "XY" && *geometry != "XYZ")
                throw FormatError("Unsupported GeometryType '" + *geometry + "' (need XY or XYZ)");
            m.points = impl_->items.read(single_data_item(c, "Geometry"));
            have_points = true;
        }
    }
    if (!have_points)
        throw FormatError("Mesh grid has no Geometry");

    impl_->cells = cells;
    m.cells = std::move(cells);
    return m;
}

Frame TimeSeriesReader::read_data(std::size_t k)
{
    if (!impl_->cells)
        throw FormatError("read_points_cells() must be called before read_data()");
    if (k >= impl_->frames.size())
        throw std::out_of_range("Time step " + std::to_string(k) + " out of range [0, " +
                                std::to_string(impl_->frames.size()) + ")");

    Frame f;
    std::optional<double> t;
    mesh::RawCellData raw;
    for (xmlNodePtr c : element_children(impl_->frames[k]))
    {
        if (has_name(c, "Time"))
        {
            const auto value = attr(c, "Value");
            if (!value)
                throw FormatError("Time element without Value");
            try
            {
                t = std::stod(*value);
            }
            catch (const std::exception&)
            {
                throw FormatError("Malformed Time value '" + *value + "'");
            }
        }
        else if (has_name(c, "Attribute"))
        {
            const auto name = attr(c, "Name");
            if (!name)
                throw FormatError("Attribute without Name");
            mesh::DataArray data = impl_->items.read(single_data_item(c, "Attribute"));

            const std::string center = attr(c, "Center").value_or("");
            if (center == "Node")
                f.point_data[*name] = std::move(data);
            else if (center == "Cell")
                raw[*name] = std::move(data);
            else
                throw FormatError("Attribute '" + *name + "' has Center '" + center +
                                  "' (need Node or Cell)");
        }
        // xi:include, Topology, Geometry: the static mesh
    }
    if (!t)
        throw FormatError("Time step " + std::to_string(k) + " has no Time");

    f.time = *t;
    f.cell_data = mesh::cell_data_from_raw(*impl_->cells, raw);
    return f;
}

} // namespace meshwire::xdmf
