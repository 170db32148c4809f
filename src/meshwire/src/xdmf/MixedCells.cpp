#include "xdmf/MixedCells.hpp"
#include "common/Errors.hpp"
#include "mesh/CellTypes.hpp"
#include "xdmf/XdmfTypes.hpp"

namespace meshwire::xdmf
{

namespace
{
constexpr int kLineIndex = 2;
}

std::vector<mesh::CellBlock> translate_mixed_cells(const mesh::DataArray& stream)
{
    if (!mesh::dtype_is_integer(stream.dtype()))
        throw FormatError("Mixed topology stream must be integer, got " +
                          std::string(mesh::dtype_name(stream.dtype())));

    const std::size_t n = stream.size();
    mesh::CellGrouper grouper;
    std::vector<std::int64_t> nodes;
    std::size_t i = 0;
    while (i < n)
    {
        const int index = static_cast<int>(stream.get_int(i++));
        const std::string& type = cell_type_of_mixed_index(index);
        if (index == kLineIndex)
        {
            if (i >= n)
                throw FormatError("Mixed topology stream truncated after polyline index");
            const auto count = stream.get_int(i++);
            if (count != 2)
                throw FormatError("Only 2-node polylines are supported in mixed topology, got " +
                                  std::to_string(count));
        }
        const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(type));
        if (i + arity > n)
            throw FormatError("Mixed topology stream truncated inside a '" + type + "' cell");
        nodes.resize(arity);
        for (std::size_t j = 0; j < arity; ++j)
            nodes[j] = stream.get_int(i + j);
        grouper.add(type, nodes.data(), arity);
        i += arity;
    }
    return grouper.finish();
}

std::size_t mixed_stream_size(const std::vector<mesh::CellBlock>& cells)
{
    std::size_t total = 0;
    for (const auto& block : cells)
    {
        total += block.size() * (block.data.cols() + 1);
        if (block.type == "line")
            total += block.size();
    }
    return total;
}

mesh::DataArray flatten_mixed_cells(const std::vector<mesh::CellBlock>& cells)
{
    mesh::DataArray out(mesh::DType::Int64, {mixed_stream_size(cells)});
    auto* dst = out.as<std::int64_t>();
    for (const auto& block : cells)
    {
        const std::int64_t index = mixed_index_of(block.type);
        const std::size_t arity = block.data.cols();
        for (std::size_t i = 0; i < block.size(); ++i)
        {
            *dst++ = index;
            if (block.type == "line")
                *dst++ = static_cast<std::int64_t>(arity);
            for (std::size_t j = 0; j < arity; ++j)
                *dst++ = block.data.get_int(i * arity + j);
        }
    }
    return out;
}

} // namespace meshwire::xdmf
