#include "Msh4Common.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "gmsh/GmshTypes.hpp"
#include "gmsh/WireIO.hpp"
#include "mesh/CellTypes.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

namespace meshwire::gmsh::detail
{

void Msh4State::add_node(std::int64_t tag, const double* p)
{
    node_tags.add(tag, static_cast<std::int64_t>(xyz.size() / 3));
    xyz.insert(xyz.end(), p, p + 3);
}

void Msh4State::add_element(int dim, int entity, int code, const std::int64_t* file_nodes)
{
    const std::string& type = gmsh_to_cell_type(code);
    const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(type));
    std::vector<std::int64_t> nodes(arity);
    for (std::size_t j = 0; j < arity; ++j)
        nodes[j] = node_tags.lookup(file_nodes[j]);
    grouper.add(type, nodes.data(), arity);

    int physical = 0;
    auto it = entity_physical.find({dim, entity});
    if (it != entity_physical.end())
        physical = it->second;
    tags.add(type, physical, entity);
}

void read_entities(Msh4State& s, bool v41)
{
    std::uint64_t counts[4];
    for (auto& c : counts)
        c = s.size_field("entity count");

    for (int dim = 0; dim < 4; ++dim)
    {
        for (std::uint64_t k = 0; k < counts[dim]; ++k)
        {
            const auto tag = s.value<std::int32_t>("entity tag");
            const int nbox = (v41 && dim == 0) ? 3 : 6;
            for (int b = 0; b < nbox; ++b)
                s.value<double>("entity bounding box");

            const auto nphys = s.size_field("physical tag count");
            for (std::uint64_t p = 0; p < nphys; ++p)
            {
                const auto phys = s.value<std::int32_t>("physical tag");
                if (p == 0)
                    s.entity_physical[{dim, tag}] = phys;
            }
            if (dim > 0)
            {
                const auto nbound = s.size_field("bounding entity count");
                for (std::uint64_t b = 0; b < nbound; ++b)
                    s.value<std::int32_t>("bounding entity tag");
            }
        }
    }
    expect_section_end(s.is, "Entities");
    s.have_entities = true;
}

mesh::Mesh read_msh4(std::istream& is, const FormatHeader& header, SectionFn entities,
                     SectionFn nodes, SectionFn elements)
{
    Msh4State s(is, header);

    std::string line;
    while (read_line(is, line))
    {
        line = trim(line);
        if (line.empty())
            continue;
        if (line[0] != '$')
            throw FormatError("Unexpected line outside of a section: '" + line + "'");
        const std::string section = line.substr(1);
        if (section == "PhysicalNames")
            read_physical_names(is, s.m.field_data);
        else if (section == "Entities")
            entities(s);
        else if (section == "Nodes")
            nodes(s);
        else if (section == "Elements")
            elements(s);
        else if (section == "NodeData")
            read_data(is, section, s.m.point_data, header.ascii);
        else if (section == "ElementData")
            read_data(is, section, s.raw, header.ascii);
        else
        {
            LOGD("gmsh: skipping section $%s\n", section.c_str());
            skip_to_section_end(is, section);
        }
    }

    const std::size_t n = s.xyz.size() / 3;
    s.m.points = mesh::DataArray::from(s.xyz, {n, 3});
    s.m.cells = s.grouper.finish();
    cells_from_gmsh_order(s.m.cells);
    s.tags.mark_geometrical();
    if (s.have_entities)
        s.tags.mark_physical();
    if (!s.m.cells.empty())
        s.tags.emit(s.m.cells, s.m.cell_data);
    attach_element_data(s.m.cells, s.raw, s.m.cell_data);
    return std::move(s.m);
}

int node_entity_dim(const mesh::Mesh& m)
{
    int dim = 0;
    for (const auto& block : m.cells)
        dim = std::max(dim, mesh::cell_dimension(block.type));
    return dim;
}

void write_msh4_data(std::ostream& os, const mesh::Mesh& m, bool binary)
{
    // Every block is written to entity 1, so per-element tags have nowhere to go
    for (const auto key : {kPhysicalKey, kGeometricalKey})
        if (m.cell_data.count(std::string(key)))
            LOGW("gmsh: '%s' is not stored by the 4.x writer; dropped\n",
                 std::string(key).c_str());

    for (const auto& [name, data] : m.point_data)
        write_data(os, "NodeData", name, data, binary);
    for (const auto& [name, data] : element_data_for_write(m))
        write_data(os, "ElementData", name, data, binary);
}

} // namespace meshwire::gmsh::detail
