#pragma once
#include "mesh/DataArray.hpp"
#include <string>
#include <string_view>
#include <utility>

/**
 * @file XdmfTypes.hpp
 * @brief XDMF vocabularies: number types, topology names, mixed-topology indices.
 *
 * @details
 * - Number types are a ``(DataType|NumberType, Precision)`` pair, e.g. ``("Float", "8")``.
 *   Unknown pairs raise :cpp:class:`meshwire::UnsupportedTypeError`.
 * - Topology names accept the XDMF aliases (``Tri_6``, ``Hex_20``, ...) on read; the writer
 *   always emits the long form.
 * - Mixed-topology indices prefix each cell of a ``TopologyType="Mixed"`` stream.
 */

namespace meshwire::xdmf
{

mesh::DType dtype_from_xdmf(std::string_view data_type, std::string_view precision);
std::pair<std::string, std::string> dtype_to_xdmf(mesh::DType t);

const std::string& topology_to_cell_type(std::string_view topology);
const std::string& cell_type_to_topology(std::string_view cell_type);

int mixed_index_of(std::string_view cell_type);
const std::string& cell_type_of_mixed_index(int index);

// Scalar | Vector | Tensor | Tensor6 | Matrix from the array shape; WriteError otherwise.
std::string attribute_type(const mesh::DataArray& data);

} // namespace meshwire::xdmf
