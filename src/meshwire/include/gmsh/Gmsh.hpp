#pragma once
#include "mesh/Mesh.hpp"
#include <istream>
#include <ostream>
#include <string>

/**
 * @file Gmsh.hpp
 * @brief Read and write Gmsh MSH files (2.2, 4.0, 4.1; ASCII or binary).
 *
 * @details
 * The reader detects version and mode from ``$MeshFormat``. The writer validates the whole mesh
 * before the output file is created, so a rejected mesh never leaves a partial file behind.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto m = meshwire::gmsh::read("part.msh");
 *   meshwire::gmsh::write("part_v22.msh", m, "2.2", false);
 * @endrst
 */

namespace meshwire::gmsh
{

mesh::Mesh read(const std::string& path);
mesh::Mesh read_stream(std::istream& is);

void write(const std::string& path, const mesh::Mesh& m, const std::string& version = "4.1",
           bool binary = true);
void write_stream(std::ostream& os, const mesh::Mesh& m, const std::string& version = "4.1",
                  bool binary = true);

} // namespace meshwire::gmsh
