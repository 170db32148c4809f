#include "xdmf/XdmfTypes.hpp"
#include "common/Errors.hpp"

#include <functional>
#include <map>

namespace meshwire::xdmf
{

using mesh::DType;

namespace
{

using Key = std::pair<std::string, std::string>;

const std::map<Key, DType>& number_types()
{
    static const std::map<Key, DType> table = {
        {{"Int", "1"}, DType::Int8},     {{"Int", "2"}, DType::Int16},
        {{"Int", "4"}, DType::Int32},    {{"Int", "8"}, DType::Int64},
        {{"UInt", "1"}, DType::UInt8},   {{"UInt", "2"}, DType::UInt16},
        {{"UInt", "4"}, DType::UInt32},  {{"UInt", "8"}, DType::UInt64},
        {{"Char", "1"}, DType::Int8},    {{"UChar", "1"}, DType::UInt8},
        {{"Float", "4"}, DType::Float32}, {{"Float", "8"}, DType::Float64},
    };
    return table;
}

const std::map<std::string, std::string, std::less<>>& topologies()
{
    static const std::map<std::string, std::string, std::less<>> table = {
        {"Polyvertex", "vertex"},
        {"Polyline", "line"},
        {"Triangle", "triangle"},
        {"Quadrilateral", "quad"},
        {"Tetrahedron", "tetra"},
        {"Pyramid", "pyramid"},
        {"Wedge", "wedge"},
        {"Hexahedron", "hexahedron"},
        {"Edge_3", "line3"},
        {"Triangle_6", "triangle6"},
        {"Tri_6", "triangle6"},
        {"Quadrilateral_8", "quad8"},
        {"Quad_8", "quad8"},
        {"Quadrilateral_9", "quad9"},
        {"Tetrahedron_10", "tetra10"},
        {"Tet_10", "tetra10"},
        {"Pyramid_13", "pyramid13"},
        {"Wedge_15", "wedge15"},
        {"Wedge_18", "wedge18"},
        {"Hexahedron_20", "hexahedron20"},
        {"Hex_20", "hexahedron20"},
        {"Hexahedron_24", "hexahedron24"},
        {"Hexahedron_27", "hexahedron27"},
    };
    return table;
}

// Long names only; aliases are read-side.
const std::map<std::string, std::string, std::less<>>& topology_names()
{
    static const std::map<std::string, std::string, std::less<>> table = [] {
        std::map<std::string, std::string, std::less<>> t;
        for (const auto& [name, type] : topologies())
            if (name != "Tri_6" && name != "Quad_8" && name != "Tet_10" && name != "Hex_20")
                t.emplace(type, name);
        return t;
    }();
    return table;
}

const std::map<std::string, int, std::less<>>& mixed_indices()
{
    static const std::map<std::string, int, std::less<>> table = {
        {"vertex", 1},        {"line", 2},          {"triangle", 4},      {"quad", 5},
        {"tetra", 6},         {"pyramid", 7},       {"wedge", 8},         {"hexahedron", 9},
        {"line3", 34},        {"quad9", 35},        {"triangle6", 36},    {"quad8", 37},
        {"tetra10", 38},      {"pyramid13", 39},    {"wedge15", 40},      {"wedge18", 41},
        {"hexahedron20", 48}, {"hexahedron24", 49}, {"hexahedron27", 50},
    };
    return table;
}

} // namespace

DType dtype_from_xdmf(std::string_view data_type, std::string_view precision)
{
    const auto& table = number_types();
    auto it = table.find(Key{std::string(data_type), std::string(precision)});
    if (it == table.end())
        throw UnsupportedTypeError("Unsupported XDMF number type (" + std::string(data_type) +
                                   ", " + std::string(precision) + ")");
    return it->second;
}

std::pair<std::string, std::string> dtype_to_xdmf(DType t)
{
    switch (t)
    {
    case DType::Int8:
        return {"Char", "1"};
    case DType::UInt8:
        return {"UChar", "1"};
    case DType::Int16:
        return {"Int", "2"};
    case DType::Int32:
        return {"Int", "4"};
    case DType::Int64:
        return {"Int", "8"};
    case DType::UInt16:
        return {"UInt", "2"};
    case DType::UInt32:
        return {"UInt", "4"};
    case DType::UInt64:
        return {"UInt", "8"};
    case DType::Float32:
        return {"Float", "4"};
    case DType::Float64:
        return {"Float", "8"};
    }
    throw UnsupportedTypeError("Unsupported dtype for XDMF");
}

const std::string& topology_to_cell_type(std::string_view topology)
{
    const auto& table = topologies();
    auto it = table.find(topology);
    if (it == table.end())
        throw UnsupportedCellTypeError("Unknown XDMF topology '" + std::string(topology) + "'");
    return it->second;
}

const std::string& cell_type_to_topology(std::string_view cell_type)
{
    const auto& table = topology_names();
    auto it = table.find(cell_type);
    if (it == table.end())
        throw UnsupportedCellTypeError("Cell type '" + std::string(cell_type) +
                                       "' has no XDMF topology");
    return it->second;
}

int mixed_index_of(std::string_view cell_type)
{
    const auto& table = mixed_indices();
    auto it = table.find(cell_type);
    if (it == table.end())
        throw UnsupportedCellTypeError("Cell type '" + std::string(cell_type) +
                                       "' has no XDMF mixed-topology index");
    return it->second;
}

const std::string& cell_type_of_mixed_index(int index)
{
    for (const auto& [type, idx] : mixed_indices())
        if (idx == index)
            return type;
    throw UnsupportedCellTypeError("Unknown XDMF mixed-topology index " + std::to_string(index));
}

std::string attribute_type(const mesh::DataArray& data)
{
    const auto& s = data.shape();
    if (s.size() == 1 || (s.size() == 2 && s[1] == 1))
        return "Scalar";
    if (s.size() == 2 && (s[1] == 2 || s[1] == 3))
        return "Vector";
    if ((s.size() == 2 && s[1] == 9) || (s.size() == 3 && s[1] == 3 && s[2] == 3))
        return "Tensor";
    if (s.size() == 2 && s[1] == 6)
        return "Tensor6";
    if (s.size() == 3)
        return "Matrix";
    throw WriteError("Cannot infer XDMF AttributeType for shape " + data.shape_string());
}

} // namespace meshwire::xdmf
