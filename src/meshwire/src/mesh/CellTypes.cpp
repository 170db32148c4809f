#include "mesh/CellTypes.hpp"
#include "common/Errors.hpp"

#include <algorithm>

namespace meshwire::mesh
{

const std::vector<CellTypeInfo>& all_cell_types()
{
    static const std::vector<CellTypeInfo> table = {
        {"vertex", 1, 0},
        // lines
        {"line", 2, 1},
        {"line3", 3, 1},
        {"line4", 4, 1},
        {"line5", 5, 1},
        {"line6", 6, 1},
        {"line7", 7, 1},
        {"line8", 8, 1},
        {"line9", 9, 1},
        {"line10", 10, 1},
        {"line11", 11, 1},
        // triangles
        {"triangle", 3, 2},
        {"triangle6", 6, 2},
        {"triangle10", 10, 2},
        {"triangle15", 15, 2},
        {"triangle21", 21, 2},
        {"triangle28", 28, 2},
        {"triangle36", 36, 2},
        {"triangle45", 45, 2},
        {"triangle55", 55, 2},
        {"triangle66", 66, 2},
        // quads
        {"quad", 4, 2},
        {"quad8", 8, 2},
        {"quad9", 9, 2},
        {"quad16", 16, 2},
        {"quad25", 25, 2},
        {"quad36", 36, 2},
        {"quad49", 49, 2},
        {"quad64", 64, 2},
        {"quad81", 81, 2},
        {"quad100", 100, 2},
        {"quad121", 121, 2},
        // tetrahedra
        {"tetra", 4, 3},
        {"tetra10", 10, 3},
        {"tetra20", 20, 3},
        {"tetra35", 35, 3},
        {"tetra56", 56, 3},
        {"tetra84", 84, 3},
        {"tetra120", 120, 3},
        {"tetra165", 165, 3},
        {"tetra220", 220, 3},
        {"tetra286", 286, 3},
        // wedges
        {"wedge", 6, 3},
        {"wedge15", 15, 3},
        {"wedge18", 18, 3},
        {"wedge40", 40, 3},
        {"wedge75", 75, 3},
        {"wedge126", 126, 3},
        {"wedge196", 196, 3},
        {"wedge288", 288, 3},
        {"wedge405", 405, 3},
        {"wedge550", 550, 3},
        // pyramids
        {"pyramid", 5, 3},
        {"pyramid13", 13, 3},
        {"pyramid14", 14, 3},
        // hexahedra
        {"hexahedron", 8, 3},
        {"hexahedron20", 20, 3},
        {"hexahedron24", 24, 3},
        {"hexahedron27", 27, 3},
        {"hexahedron64", 64, 3},
        {"hexahedron125", 125, 3},
        {"hexahedron216", 216, 3},
        {"hexahedron343", 343, 3},
        {"hexahedron512", 512, 3},
        {"hexahedron729", 729, 3},
        {"hexahedron1000", 1000, 3},
    };
    return table;
}

static const CellTypeInfo* find_cell_type(std::string_view name) noexcept
{
    const auto& table = all_cell_types();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const CellTypeInfo& c) { return c.name == name; });
    return it == table.end() ? nullptr : &*it;
}

const CellTypeInfo& cell_type_info(std::string_view name)
{
    const CellTypeInfo* info = find_cell_type(name);
    if (!info)
        throw UnsupportedCellTypeError("Unknown cell type '" + std::string(name) + "'");
    return *info;
}

int num_nodes_per_cell(std::string_view name)
{
    return cell_type_info(name).num_nodes;
}

int cell_dimension(std::string_view name)
{
    return cell_type_info(name).dimension;
}

bool is_known_cell_type(std::string_view name) noexcept
{
    return find_cell_type(name) != nullptr;
}

} // namespace meshwire::mesh
