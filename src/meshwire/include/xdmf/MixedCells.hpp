#pragma once
#include "mesh/Mesh.hpp"
#include <cstddef>
#include <vector>

/**
 * @file MixedCells.hpp
 * @brief ``TopologyType="Mixed"`` stream <-> grouped cell blocks.
 *
 * @details
 * The stream is ``index n0 n1 ...`` per cell, with the node count inserted after the index for
 * polylines only:
 *
 * @rst
 * .. code-block:: text
 *
 *    4 0 1 2      # triangle
 *    2 2 0 3      # line: index 2, count 2, nodes
 * @endrst
 *
 * Its length is the sum of ``arity + 1`` over all cells plus one per line cell.
 */

namespace meshwire::xdmf
{

// Groups by type in first-seen order; blocks are int64.
std::vector<mesh::CellBlock> translate_mixed_cells(const mesh::DataArray& stream);

// Concatenates blocks in order into a 1-D int64 stream.
mesh::DataArray flatten_mixed_cells(const std::vector<mesh::CellBlock>& cells);

std::size_t mixed_stream_size(const std::vector<mesh::CellBlock>& cells);

} // namespace meshwire::xdmf
