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

void entities41(Msh4State& s)
{
    detail::read_entities(s, true);
}

// Header: numBlocks numNodes minTag maxTag. Blocks: dim tag parametric n, then n tags, then
// n coordinate records.
void nodes41(Msh4State& s)
{
    const auto nblocks = s.size_field("node block count");
    for (int k = 0; k < 3; ++k)
        s.size_field("node section header");
    for (std::uint64_t b = 0; b < nblocks; ++b)
    {
        const auto dim = s.value<std::int32_t>("node entity dimension");
        s.value<std::int32_t>("node entity tag");
        const auto parametric = s.value<std::int32_t>("node parametric flag");
        const auto n = s.size_field("node block size");
        const int extra = parametric != 0 ? dim : 0;

        std::vector<std::uint64_t> tags(n);
        for (auto& t : tags)
            t = s.size_field("node tag");
        for (std::uint64_t i = 0; i < n; ++i)
        {
            double p[3];
            for (double& c : p)
                c = s.value<double>("node coordinate");
            for (int k = 0; k < extra; ++k)
                s.value<double>("node parametric coordinate");
            s.add_node(static_cast<std::int64_t>(tags[i]), p);
        }
    }
    expect_section_end(s.is, "Nodes");
}

// Header: numBlocks numElements minTag maxTag. Blocks: dim tag type n; records: tag nodes...
void elements41(Msh4State& s)
{
    const auto nblocks = s.size_field("element block count");
    for (int k = 0; k < 3; ++k)
        s.size_field("element section header");
    for (std::uint64_t b = 0; b < nblocks; ++b)
    {
        const auto dim = s.value<std::int32_t>("element entity dimension");
        const auto entity = s.value<std::int32_t>("element entity tag");
        const auto code = s.value<std::int32_t>("element type");
        const auto n = s.size_field("element block size");
        const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(gmsh_to_cell_type(code)));
        std::vector<std::int64_t> nodes(arity);
        for (std::uint64_t i = 0; i < n; ++i)
        {
            s.size_field("element tag");
            for (auto& v : nodes)
                v = static_cast<std::int64_t>(s.size_field("element node tag"));
            s.add_element(dim, entity, code, nodes.data());
        }
    }
    expect_section_end(s.is, "Elements");
}

} // namespace

mesh::Mesh read_msh41(std::istream& is, const FormatHeader& header)
{
    return detail::read_msh4(is, header, &entities41, &nodes41, &elements41);
}

void write_msh41(std::ostream& os, const mesh::Mesh& m, bool binary)
{
    constexpr int kSize = 8;
    write_header(os, "4.1", binary, kSize);
    if (!m.field_data.empty())
        write_physical_names(os, m.field_data);

    const mesh::DataArray pts = points_3d(m.points);
    const double* xyz = pts.as<double>();
    const std::size_t n = pts.rows();
    const std::size_t nblocks = n > 0 ? 1 : 0;
    const int node_dim = detail::node_entity_dim(m);

    os << "$Nodes\n";
    if (binary)
    {
        const std::uint64_t hdr[4] = {nblocks, n, n > 0 ? 1u : 0u, n};
        write_binary(os, hdr, 4);
        if (n > 0)
        {
            const std::int32_t block[3] = {node_dim, 1, 0};
            write_binary(os, block, 3);
            write_size(os, n, kSize);
            for (std::uint64_t i = 1; i <= n; ++i)
                write_size(os, i, kSize);
            write_binary(os, xyz, 3 * n);
        }
        os << "\n";
    }
    else
    {
        os << nblocks << " " << n << " " << (n > 0 ? 1 : 0) << " " << n << "\n";
        if (n > 0)
        {
            os << node_dim << " 1 0 " << n << "\n";
            for (std::size_t i = 1; i <= n; ++i)
                os << i << "\n";
            for (std::size_t i = 0; i < n; ++i)
                os << format_double(xyz[3 * i]) << " " << format_double(xyz[3 * i + 1]) << " "
                   << format_double(xyz[3 * i + 2]) << "\n";
        }
    }
    os << "$EndNodes\n";

    const std::size_t total = m.num_cells();
    os << "$Elements\n";
    if (binary)
    {
        const std::uint64_t hdr[4] = {m.cells.size(), total, total > 0 ? 1u : 0u, total};
        write_binary(os, hdr, 4);
    }
    else
    {
        os << m.cells.size() << " " << total << " " << (total > 0 ? 1 : 0) << " " << total
           << "\n";
    }
    std::uint64_t id = 1;
    for (const auto& block : m.cells)
    {
        const int code = cell_type_to_gmsh(block.type);
        const int dim = mesh::cell_dimension(block.type);
        const std::size_t arity = block.data.cols();
        const auto rows = cells_to_gmsh_order(block);
        if (binary)
        {
            const std::int32_t hdr[3] = {dim, 1, code};
            write_binary(os, hdr, 3);
            write_size(os, block.size(), kSize);
            std::vector<std::uint64_t> rec(1 + arity);
            for (std::size_t i = 0; i < block.size(); ++i)
            {
                rec[0] = id++;
                for (std::size_t j = 0; j < arity; ++j)
                    rec[1 + j] = static_cast<std::uint64_t>(rows[i * arity + j] + 1);
                write_binary(os, rec.data(), rec.size());
            }
        }
        else
        {
            os << dim << " 1 " << code << " " << block.size() << "\n";
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
