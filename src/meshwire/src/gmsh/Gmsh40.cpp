#include "Msh4Common.hpp"
#include "common/Errors.hpp"
#include "gmsh/Codecs.hpp"
#include "gmsh/GmshTypes.hpp"
#include "gmsh/WireIO.hpp"
#include "mesh/CellTypes.hpp"

#include <cstdint>
#include <vector>

namespace meshwire::gmsh
{

using detail::Msh4State;

namespace
{

void entities40(Msh4State& s)
{
    detail::read_entities(s, false);
}

// Blocks: tagEntity dimEntity typeNode(parametric) numNodes; records: tag x y z [u v w].
void nodes40(Msh4State& s)
{
    const auto nblocks = s.size_field("node block count");
    s.size_field("node count");
    for (std::uint64_t b = 0; b < nblocks; ++b)
    {
        s.value<std::int32_t>("node entity tag");
        const auto dim = s.value<std::int32_t>("node entity dimension");
        const auto parametric = s.value<std::int32_t>("node parametric flag");
        const auto n = s.size_field("node block size");
        const int extra = parametric != 0 ? dim : 0;
        for (std::uint64_t i = 0; i < n; ++i)
        {
            const auto tag = s.value<std::int32_t>("node tag");
            double p[3];
            for (double& c : p)
                c = s.value<double>("node coordinate");
            for (int k = 0; k < extra; ++k)
                s.value<double>("node parametric coordinate");
            s.add_node(tag, p);
        }
    }
    expect_section_end(s.is, "Nodes");
}

// Blocks: tagEntity dimEntity typeEle numElements; records: tag nodes...
void elements40(Msh4State& s)
{
    const auto nblocks = s.size_field("element block count");
    s.size_field("element count");
    for (std::uint64_t b = 0; b < nblocks; ++b)
    {
        const auto entity = s.value<std::int32_t>("element entity tag");
        const auto dim = s.value<std::int32_t>("element entity dimension");
        const auto code = s.value<std::int32_t>("element type");
        const auto n = s.size_field("element block size");
        const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(gmsh_to_cell_type(code)));
        std::vector<std::int32_t> rec(1 + arity);
        std::vector<std::int64_t> nodes(arity);
        for (std::uint64_t i = 0; i < n; ++i)
        {
            if (s.header.ascii)
                for (auto& v : rec)
                    v = read_ascii<std::int32_t>(s.is, "element record");
            else
                read_binary(s.is, rec.data(), rec.size(), "element record");
            for (std::size_t j = 0; j < arity; ++j)
                nodes[j] = rec[1 + j];
            s.add_element(dim, entity, code, nodes.data());
        }
    }
    expect_section_end(s.is, "Elements");
}

} // namespace

mesh::Mesh read_msh40(std::istream& is, const FormatHeader& header)
{
    return detail::read_msh4(is, header, &entities40, &nodes40, &elements40);
}

void write_msh40(std::ostream& os, const mesh::Mesh& m, bool binary)
{
    constexpr int kSize = 8;
    write_header(os, "4.0", binary, kSize);
    if (!m.field_data.empty())
        write_physical_names(os, m.field_data);

    const mesh::DataArray pts = points_3d(m.points);
    const double* xyz = pts.as<double>();
    const std::size_t n = pts.rows();
    const int node_dim = detail::node_entity_dim(m);

    os << "$Nodes\n";
    if (binary)
    {
        write_size(os, 1, kSize);
        write_size(os, n, kSize);
        const std::int32_t hdr[3] = {1, node_dim, 0};
        write_binary(os, hdr, 3);
        write_size(os, n, kSize);
        for (std::size_t i = 0; i < n; ++i)
        {
            write_binary<std::int32_t>(os, static_cast<std::int32_t>(i + 1));
            write_binary(os, xyz + 3 * i, 3);
        }
        os << "\n";
    }
    else
    {
        os << "1 " << n << "\n";
        os << "1 " << node_dim << " 0 " << n << "\n";
        for (std::size_t i = 0; i < n; ++i)
            os << i + 1 << " " << format_double(xyz[3 * i]) << " "
               << format_double(xyz[3 * i + 1]) << " " << format_double(xyz[3 * i + 2]) << "\n";
    }
    os << "$EndNodes\n";

    os << "$Elements\n";
    if (binary)
    {
        write_size(os, m.cells.size(), kSize);
        write_size(os, m.num_cells(), kSize);
    }
    else
    {
        os << m.cells.size() << " " << m.num_cells() << "\n";
    }
    std::int64_t id = 1;
    for (const auto& block : m.cells)
    {
        const int code = cell_type_to_gmsh(block.type);
        const int dim = mesh::cell_dimension(block.type);
        const std::size_t arity = block.data.cols();
        const auto rows = cells_to_gmsh_order(block);
        if (binary)
        {
            const std::int32_t hdr[3] = {1, dim, code};
            write_binary(os, hdr, 3);
            write_size(os, block.size(), kSize);
            std::vector<std::int32_t> rec(1 + arity);
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                rec[0] = static_cast<std::int32_t>(id++);
                for (std::size_t j = 0; j < arity; ++j)
                    rec[1 + j] = static_cast<std::int32_t>(rows[i * arity + j] + 1);
                write_binary(os, rec.data(), rec.size());
            }
        }
        else
        {
            os << "1 " << dim << " " << code << " " << block.size() << "\n";
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                os << id++;
                for (std::size_t j = 0; j < arity; ++j)
                    os << " " << rows[i * arity + j] + 1;
                os << "\n";
            }
        }
    }
    if (binary)
        os << "\n";
    os << "$EndElements\n";

    detail::write_msh4_data(os, m, binary);
}

} // namespace meshwire::gmsh
