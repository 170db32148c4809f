#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "gmsh/Codecs.hpp"
#include "gmsh/GmshTypes.hpp"
#include "gmsh/Sections.hpp"
#include "gmsh/WireIO.hpp"
#include "mesh/CellTypes.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

namespace meshwire::gmsh
{

using mesh::DataArray;
using mesh::DType;

namespace
{

struct State22
{
    std::istream& is;
    const FormatHeader& header;
    mesh::Mesh m;
    NodeTagMap node_tags;
    mesh::CellGrouper grouper;
    ElementTagSink tags;
    mesh::RawCellData raw;
};

void read_nodes(State22& s)
{
    const auto n = read_count_line(s.is, "$Nodes count");
    DataArray points(DType::Float64, {static_cast<std::size_t>(n), 3});
    double* xyz = points.as<double>();
    for (std::uint64_t i = 0; i < n; ++i)
    {
        if (s.header.ascii)
        {
            const auto tag = read_ascii<std::int64_t>(s.is, "node tag");
            for (int c = 0; c < 3; ++c)
                xyz[3 * i + c] = read_ascii<double>(s.is, "node coordinate");
            s.node_tags.add(tag, static_cast<std::int64_t>(i));
        }
        else
        {
            const auto tag = read_binary<std::int32_t>(s.is, "node tag");
            if (tag != static_cast<std::int64_t>(i) + 1)
                throw FormatError("Binary node " + std::to_string(i) + " has tag " +
                                  std::to_string(tag) + ", expected " + std::to_string(i + 1));
            read_binary(s.is, xyz + 3 * i, 3, "node coordinates");
            s.node_tags.add(tag, static_cast<std::int64_t>(i));
        }
    }
    expect_section_end(s.is, "Nodes");
    s.m.points = std::move(points);
}

template <class Int> void add_element(State22& s, int code, int ntags, const Int* rest)
{
    // rest = tags..., nodes...
    const std::string& type = gmsh_to_cell_type(code);
    const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(type));
    std::vector<std::int64_t> nodes(arity);
    for (std::size_t j = 0; j < arity; ++j)
        nodes[j] = s.node_tags.lookup(static_cast<std::int64_t>(rest[ntags + j]));
    s.grouper.add(type, nodes.data(), arity);

    const auto physical = ntags > 0 ? static_cast<std::int32_t>(rest[0]) : 0;
    const auto geometrical = ntags > 1 ? static_cast<std::int32_t>(rest[1]) : 0;
    if (ntags > 0)
        s.tags.mark_physical();
    if (ntags > 1)
        s.tags.mark_geometrical();
    s.tags.add(type, physical, geometrical);
}

void read_elements(State22& s)
{
    const auto n = read_count_line(s.is, "$Elements count");
    if (s.header.ascii)
    {
        for (std::uint64_t k = 0; k < n; ++k)
        {
            const std::string line = next_line(s.is, "element");
            std::istringstream iss(line);
            std::vector<std::int64_t> t;
            for (std::int64_t v; iss >> v;)
                t.push_back(v);
            if (t.size() < 3)
                throw FormatError("Malformed element line '" + line + "'");
            const int code = static_cast<int>(t[1]);
            const int ntags = static_cast<int>(t[2]);
            const auto arity = mesh::num_nodes_per_cell(gmsh_to_cell_type(code));
            if (ntags < 0 || t.size() < static_cast<std::size_t>(3 + ntags + arity))
                throw FormatError("Element line '" + line + "' is too short for its type");
            add_element(s, code, ntags, t.data() + 3);
        }
    }
    else
    {
        std::uint64_t done = 0;
        while (done < n)
        {
            std::int32_t hdr[3];
            read_binary(s.is, hdr, 3, "element block header");
            const int code = hdr[0];
            const auto count = static_cast<std::uint64_t>(hdr[1]);
            const int ntags = hdr[2];
            if (hdr[1] <= 0 || ntags < 0 || done + count > n)
                throw FormatError("Invalid binary element block header");
            const auto arity = mesh::num_nodes_per_cell(gmsh_to_cell_type(code));
            std::vector<std::int32_t> rec(static_cast<std::size_t>(1 + ntags + arity));
            for (std::uint64_t k = 0; k < count; ++k)
            {
                read_binary(s.is, rec.data(), rec.size(), "element record");
                add_element(s, code, ntags, rec.data() + 1);
            }
            done += count;
        }
    }
    expect_section_end(s.is, "Elements");
}

} // namespace

mesh::Mesh read_msh22(std::istream& is, const FormatHeader& header)
{
    State22 s{is, header, {}, {}, {}, {}, {}};
    s.m.points = DataArray(DType::Float64, {0, 3});

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
        else if (section == "Nodes")
            read_nodes(s);
        else if (section == "Elements")
            read_elements(s);
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

    s.m.cells = s.grouper.finish();
    cells_from_gmsh_order(s.m.cells);
    s.tags.emit(s.m.cells, s.m.cell_data);
    attach_element_data(s.m.cells, s.raw, s.m.cell_data);
    return std::move(s.m);
}

void write_msh22(std::ostream& os, const mesh::Mesh& m, bool binary)
{
    write_header(os, "2.2", binary, 8);
    if (!m.field_data.empty())
        write_physical_names(os, m.field_data);

    const DataArray pts = points_3d(m.points);
    const double* xyz = pts.as<double>();
    const std::size_t n = pts.rows();
    os << "$Nodes\n" << n << "\n";
    for (std::size_t i = 0; i < n; ++i)
    {
        if (binary)
        {
            write_binary<std::int32_t>(os, static_cast<std::int32_t>(i + 1));
            write_binary(os, xyz + 3 * i, 3);
        }
        else
        {
            os << i + 1 << " " << format_double(xyz[3 * i]) << " " << format_double(xyz[3 * i + 1])
               << " " << format_double(xyz[3 * i + 2]) << "\n";
        }
    }
    if (binary)
        os << "\n";
    os << "$EndNodes\n";

    os << "$Elements\n" << m.num_cells() << "\n";
    std::int64_t id = 1;
    for (const auto& block : m.cells)
    {
        const int code = cell_type_to_gmsh(block.type);
        const std::size_t arity = block.data.cols();
        const auto rows = cells_to_gmsh_order(block);
        auto physical = element_tags(m, kPhysicalKey, block);
        auto geometrical = element_tags(m, kGeometricalKey, block);
        const bool tagged = !physical.empty() || !geometrical.empty();
        if (tagged)
        {
            physical.resize(block.size(), 0);
            geometrical.resize(block.size(), 0);
        }
        const int ntags = tagged ? 2 : 0;

        if (binary)
        {
            // A block header must be followed by at least one record
            if (block.size() == 0)
                continue;
            const std::int32_t hdr[3] = {code, static_cast<std::int32_t>(block.size()), ntags};
            write_binary(os, hdr, 3);
            std::vector<std::int32_t> rec(1 + ntags + arity);
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                rec[0] = static_cast<std::int32_t>(id++);
                if (tagged)
                {
                    rec[1] = static_cast<std::int32_t>(physical[i]);
                    rec[2] = static_cast<std::int32_t>(geometrical[i]);
                }
                for (std::size_t j = 0; j < arity; ++j)
                    rec[1 + ntags + j] = static_cast<std::int32_t>(rows[i * arity + j] + 1);
                write_binary(os, rec.data(), rec.size());
            }
        }
        else
        {
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                os << id++ << " " << code << " " << ntags;
                if (tagged)
                    os << " " << physical[i] << " " << geometrical[i];
                for (std::size_t j = 0; j < arity; ++j)
                    os << " " << rows[i * arity + j] + 1;
                os << "\n";
            }
        }
    }
    if (binary)
        os << "\n";
    os << "$EndElements\n";

    for (const auto& [name, data] : m.point_data)
        write_data(os, "NodeData", name, data, binary);

    for (const auto& [name, data] : element_data_for_write(m))
        write_data(os, "ElementData", name, data, binary);
}

} // namespace meshwire::gmsh
