#include "mesh/Mesh.hpp"
#include "common/Errors.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace meshwire::mesh
{

std::size_t Mesh::num_cells() const noexcept
{
    std::size_t n = 0;
    for (const auto& b : cells)
        n += b.size();
    return n;
}

const CellBlock* Mesh::find_cells(std::string_view type) const noexcept
{
    auto it = std::find_if(cells.begin(), cells.end(),
                           [&](const CellBlock& b) { return b.type == type; });
    return it == cells.end() ? nullptr : &*it;
}

RawCellData raw_from_cell_data(const std::vector<CellBlock>& cells, const CellData& cell_data)
{
    RawCellData raw;
    for (const auto& [name, per_type] : cell_data)
    {
        std::vector<const DataArray*> parts;
        for (const auto& block : cells)
        {
            auto it = per_type.find(block.type);
            if (it == per_type.end())
                throw WriteError("Cell data '" + name + "' has no values for cell type '" +
                                 block.type + "'");
            if (it->second.rows() != block.size())
                throw WriteError("Cell data '" + name + "' for '" + block.type + "' has " +
                                 std::to_string(it->second.rows()) + " rows, expected " +
                                 std::to_string(block.size()));
            parts.push_back(&it->second);
        }
        if (!parts.empty())
            raw.emplace(name, DataArray::concatenate_rows(parts));
    }
    return raw;
}

CellData cell_data_from_raw(const std::vector<CellBlock>& cells, const RawCellData& raw)
{
    std::size_t total = 0;
    for (const auto& block : cells)
        total += block.size();

    CellData out;
    for (const auto& [name, values] : raw)
    {
        if (values.rows() != total)
            throw FormatError("Cell data '" + name + "' has " + std::to_string(values.rows()) +
                              " entries, mesh has " + std::to_string(total) + " cells");
        const std::size_t row_bytes = values.cols() * dtype_size(values.dtype());
        std::size_t row = 0;
        for (const auto& block : cells)
        {
            std::vector<std::size_t> shape = values.shape();
            shape[0] = block.size();
            DataArray part(values.dtype(), shape);
            if (part.nbytes())
                std::memcpy(part.data(),
                            static_cast<const unsigned char*>(values.data()) + row * row_bytes,
                            part.nbytes());
            out[name].emplace(block.type, std::move(part));
            row += block.size();
        }
    }
    return out;
}

void CellGrouper::add(const std::string& type, const std::int64_t* nodes, std::size_t count)
{
    auto it = std::find_if(blocks_.begin(), blocks_.end(),
                           [&](const Pending& p) { return p.type == type; });
    if (it == blocks_.end())
    {
        blocks_.push_back(Pending{type, count, {}});
        it = std::prev(blocks_.end());
    }
    else if (it->arity != count)
    {
        throw FormatError("Cell of type '" + type + "' has " + std::to_string(count) +
                          " nodes, expected " + std::to_string(it->arity));
    }
    it->nodes.insert(it->nodes.end(), nodes, nodes + count);
}

std::vector<CellBlock> CellGrouper::finish()
{
    std::vector<CellBlock> out;
    out.reserve(blocks_.size());
    for (auto& p : blocks_)
    {
        const std::size_t n = p.arity ? p.nodes.size() / p.arity : 0;
        out.push_back(CellBlock{p.type, DataArray::from(p.nodes, {n, p.arity})});
    }
    blocks_.clear();
    return out;
}

} // namespace meshwire::mesh
