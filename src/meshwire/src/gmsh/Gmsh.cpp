#include "gmsh/Gmsh.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "gmsh/Header.hpp"
#include "gmsh/Sections.hpp"
#include "gmsh/VersionTable.hpp"

#include <fstream>

namespace meshwire::gmsh
{

mesh::Mesh read_stream(std::istream& is)
{
    const FormatHeader header = read_preamble(is);
    const Codec& codec = reader_table().resolve(header.version);
    return codec.read(is, header);
}

mesh::Mesh read(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw Error("gmsh: cannot open '" + path + "' for reading");
    LOGI("gmsh: reading %s\n", path.c_str());
    auto m = read_stream(in);
    LOGI("gmsh: %zu points, %zu cells in %zu blocks\n", m.num_points(), m.num_cells(),
         m.cells.size());
    return m;
}

void write_stream(std::ostream& os, const mesh::Mesh& m, const std::string& version, bool binary)
{
    const Codec& codec = writer_table().resolve(version);
    validate_for_write(m);
    codec.write(os, m, binary);
}

void write(const std::string& path, const mesh::Mesh& m, const std::string& version, bool binary)
{
    const Codec& codec = writer_table().resolve(version);
    validate_for_write(m);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw Error("gmsh: cannot open '" + path + "' for writing");
    LOGI("gmsh: writing %s (version %s, %s)\n", path.c_str(), version.c_str(),
         binary ? "binary" : "ascii");
    codec.write(out, m, binary);
    out.flush();
    if (!out)
        throw Error("gmsh: write to '" + path + "' failed");
}

} // namespace meshwire::gmsh
