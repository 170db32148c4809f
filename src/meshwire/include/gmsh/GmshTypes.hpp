#pragma once
#include <string>
#include <string_view>
#include <vector>

/**
 * @file GmshTypes.hpp
 * @brief Gmsh element-type codes <-> canonical cell-type names.
 *
 * @details
 * Codes follow the MSH element table (``1`` line, ``2`` triangle, ... ``110`` wedge550).
 * Lookups in either direction throw :cpp:class:`meshwire::UnsupportedCellTypeError`.
 *
 * Gmsh and the canonical vocabulary order the local nodes of ``tetra10`` and ``hexahedron20``
 * differently; :cpp:func:`gmsh_node_permutation` returns the permutation applied on read
 * (``canonical[i] = gmsh[perm[i]]``), or an empty vector for types that need none.
 */

namespace meshwire::gmsh
{

const std::string& gmsh_to_cell_type(int code);
int cell_type_to_gmsh(std::string_view type);

const std::vector<int>& gmsh_node_permutation(std::string_view type);
std::vector<int> invert_permutation(const std::vector<int>& perm);

} // namespace meshwire::gmsh
