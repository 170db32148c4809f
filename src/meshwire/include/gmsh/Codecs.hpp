#pragma once
#include "gmsh/Header.hpp"
#include "mesh/Mesh.hpp"
#include <istream>
#include <ostream>

/**
 * @file Codecs.hpp
 * @brief Per-version MSH body codecs.
 *
 * @details
 * Readers start right after ``$EndMeshFormat`` and consume the rest of the stream. Writers emit
 * the whole file, header included, and assume :cpp:func:`validate_for_write` already passed.
 */

namespace meshwire::gmsh
{

mesh::Mesh read_msh22(std::istream& is, const FormatHeader& header);
mesh::Mesh read_msh40(std::istream& is, const FormatHeader& header);
mesh::Mesh read_msh41(std::istream& is, const FormatHeader& header);

void write_msh22(std::ostream& os, const mesh::Mesh& m, bool binary);
void write_msh40(std::ostream& os, const mesh::Mesh& m, bool binary);
void write_msh41(std::ostream& os, const mesh::Mesh& m, bool binary);

} // namespace meshwire::gmsh
