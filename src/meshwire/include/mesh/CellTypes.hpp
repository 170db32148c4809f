#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file CellTypes.hpp
 * @brief Canonical cell-type vocabulary (name -> arity, topological dimension).
 *
 * @details
 * Every codec translates its own type codes to these names; the name is the key under which
 * cells are grouped in :cpp:struct:`meshwire::mesh::Mesh`. The table is a load-time constant.
 */

namespace meshwire::mesh
{

struct CellTypeInfo
{
    std::string_view name;
    int num_nodes = 0;
    int dimension = 0;
};

// Throws UnsupportedCellTypeError for names outside the table.
const CellTypeInfo& cell_type_info(std::string_view name);
int num_nodes_per_cell(std::string_view name);
int cell_dimension(std::string_view name);
bool is_known_cell_type(std::string_view name) noexcept;

const std::vector<CellTypeInfo>& all_cell_types();

} // namespace meshwire::mesh
