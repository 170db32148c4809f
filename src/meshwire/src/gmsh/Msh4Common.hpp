#pragma once
#include "gmsh/Header.hpp"
#include "gmsh/Sections.hpp"
#include "gmsh/WireIO.hpp"
#include "mesh/Mesh.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

// Reader state and section loop shared by the 4.0 and 4.1 codecs.

namespace meshwire::gmsh::detail
{

struct Msh4State
{
    Msh4State(std::istream& in, const FormatHeader& h) : is(in), header(h) {}

    std::istream& is;
    const FormatHeader& header;
    mesh::Mesh m;
    NodeTagMap node_tags;
    std::vector<double> xyz;
    mesh::CellGrouper grouper;
    ElementTagSink tags;
    mesh::RawCellData raw;
    std::map<std::pair<int, int>, int> entity_physical; // (dim, tag) -> first physical tag
    bool have_entities = false;

    std::uint64_t size_field(std::string_view what)
    {
        return read_size(is, header.ascii, header.data_size, what);
    }
    template <class T> T value(std::string_view what)
    {
        return read_value<T>(is, header.ascii, what);
    }

    void add_node(std::int64_t tag, const double* p);
    void add_element(int dim, int entity, int code, const std::int64_t* file_nodes);
};

// Reads $Entities; `v41` selects the 4.1 point-entity layout (a point instead of a box).
void read_entities(Msh4State& s, bool v41);

using SectionFn = void (*)(Msh4State&);
mesh::Mesh read_msh4(std::istream& is, const FormatHeader& header, SectionFn entities,
                     SectionFn nodes, SectionFn elements);

// Entity dimension used for the single node block on write.
int node_entity_dim(const mesh::Mesh& m);

// $NodeData / $ElementData tail shared by both 4.x writers.
void write_msh4_data(std::ostream& os, const mesh::Mesh& m, bool binary);

} // namespace meshwire::gmsh::detail
