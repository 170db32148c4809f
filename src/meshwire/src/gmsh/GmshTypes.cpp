#include "gmsh/GmshTypes.hpp"
#include "common/Errors.hpp"

#include <map>
#include <utility>

namespace meshwire::gmsh
{

namespace
{

// http://gmsh.info/doc/texinfo/gmsh.html#MSH-file-format
const std::map<int, std::string>& code_table()
{
    static const std::map<int, std::string> table = {
        {1, "line"},
        {2, "triangle"},
        {3, "quad"},
        {4, "tetra"},
        {5, "hexahedron"},
        {6, "wedge"},
        {7, "pyramid"},
        {8, "line3"},
        {9, "triangle6"},
        {10, "quad9"},
        {11, "tetra10"},
        {12, "hexahedron27"},
        {13, "wedge18"},
        {14, "pyramid14"},
        {15, "vertex"},
        {16, "quad8"},
        {17, "hexahedron20"},
        {18, "wedge15"},
        {19, "pyramid13"},
        {21, "triangle10"},
        {23, "triangle15"},
        {25, "triangle21"},
        {26, "line4"},
        {27, "line5"},
        {28, "line6"},
        {29, "tetra20"},
        {30, "tetra35"},
        {31, "tetra56"},
        {36, "quad16"},
        {37, "quad25"},
        {38, "quad36"},
        {42, "triangle28"},
        {43, "triangle36"},
        {44, "triangle45"},
        {45, "triangle55"},
        {46, "triangle66"},
        {47, "quad49"},
        {48, "quad64"},
        {49, "quad81"},
        {50, "quad100"},
        {51, "quad121"},
        {62, "line7"},
        {63, "line8"},
        {64, "line9"},
        {65, "line10"},
        {66, "line11"},
        {71, "tetra84"},
        {72, "tetra120"},
        {73, "tetra165"},
        {74, "tetra220"},
        {75, "tetra286"},
        {90, "wedge40"},
        {91, "wedge75"},
        {92, "hexahedron64"},
        {93, "hexahedron125"},
        {94, "hexahedron216"},
        {95, "hexahedron343"},
        {96, "hexahedron512"},
        {97, "hexahedron729"},
        {98, "hexahedron1000"},
        {106, "wedge126"},
        {107, "wedge196"},
        {108, "wedge288"},
        {109, "wedge405"},
        {110, "wedge550"},
    };
    return table;
}

const std::map<std::string, int, std::less<>>& name_table()
{
    static const std::map<std::string, int, std::less<>> table = []
    {
        std::map<std::string, int, std::less<>> t;
        for (const auto& [code, name] : code_table())
            t.emplace(name, code);
        return t;
    }();
    return table;
}

} // namespace

const std::string& gmsh_to_cell_type(int code)
{
    auto it = code_table().find(code);
    if (it == code_table().end())
        throw UnsupportedCellTypeError("Unsupported Gmsh element type " + std::to_string(code));
    return it->second;
}

int cell_type_to_gmsh(std::string_view type)
{
    auto it = name_table().find(type);
    if (it == name_table().end())
        throw UnsupportedCellTypeError("Cell type '" + std::string(type) +
                                       "' has no Gmsh element code");
    return it->second;
}

const std::vector<int>& gmsh_node_permutation(std::string_view type)
{
    static const std::vector<int> none;
    static const std::vector<int> tetra10 = {0, 1, 2, 3, 4, 5, 6, 7, 9, 8};
    static const std::vector<int> hexahedron20 = {0,  1,  2,  3,  4,  5,  6,  7,  8,  11,
                                                  16, 9,  17, 10, 18, 19, 12, 15, 13, 14};
    if (type == "tetra10")
        return tetra10;
    if (type == "hexahedron20")
        return hexahedron20;
    return none;
}

std::vector<int> invert_permutation(const std::vector<int>& perm)
{
    std::vector<int> inv(perm.size());
    for (std::size_t i = 0; i < perm.size(); ++i)
        inv[static_cast<std::size_t>(perm[i])] = static_cast<int>(i);
    return inv;
}

} // namespace meshwire::gmsh
