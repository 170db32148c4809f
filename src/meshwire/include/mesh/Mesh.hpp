#pragma once
#include "mesh/DataArray.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Mesh.hpp
 * @brief Canonical in-memory mesh shared by all codecs.
 *
 * @details
 * - ``points``: ``(N, 2|3)`` coordinates.
 * - ``cells``: ordered blocks, one per canonical cell type, each an integer ``(n, arity)`` array
 *   of 0-based point indices. Block order is the iteration order used by every writer.
 * - ``point_data``: name -> array aligned with ``points``.
 * - ``cell_data``: name -> (cell type -> array aligned with that block).
 * - ``field_data``: name -> small integer tuple; physical groups store ``(id, dimension)``.
 *
 * Codecs exchange cell data with the wire in its *raw* form (one array per name covering all
 * blocks in order); :cpp:func:`raw_from_cell_data` and :cpp:func:`cell_data_from_raw` convert.
 */

namespace meshwire::mesh
{

struct CellBlock
{
    std::string type;
    DataArray data; // (n, arity), integer dtype

    std::size_t size() const noexcept { return data.rows(); }
};

using PointData = std::map<std::string, DataArray>;
using CellData = std::map<std::string, std::map<std::string, DataArray>>;
using FieldData = std::map<std::string, DataArray>;
using RawCellData = std::map<std::string, DataArray>;

struct Mesh
{
    DataArray points;
    std::vector<CellBlock> cells;
    PointData point_data;
    CellData cell_data;
    FieldData field_data;

    std::size_t num_points() const noexcept { return points.rows(); }
    std::size_t num_cells() const noexcept;

    const CellBlock* find_cells(std::string_view type) const noexcept;
};

// Concatenates every cell-data name over the blocks of `cells`, in block order.
// Throws WriteError if a name lacks an array for one of the blocks or a length is off.
RawCellData raw_from_cell_data(const std::vector<CellBlock>& cells, const CellData& cell_data);

// Splits raw per-name arrays into per-block arrays. Throws FormatError on a length mismatch.
CellData cell_data_from_raw(const std::vector<CellBlock>& cells, const RawCellData& raw);

// Groups a type-tagged cell sequence into blocks, preserving first-seen type order and
// within-type order. `nodes` holds the concatenated node lists.
class CellGrouper
{
  public:
    void add(const std::string& type, const std::int64_t* nodes, std::size_t count);
    std::vector<CellBlock> finish();

  private:
    struct Pending
    {
        std::string type;
        std::size_t arity = 0;
        std::vector<std::int64_t> nodes;
    };
    std::vector<Pending> blocks_;
};

} // namespace meshwire::mesh
