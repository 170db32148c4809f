#include "gmsh/Header.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "gmsh/WireIO.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

namespace meshwire::gmsh
{

FormatHeader read_header(std::istream& is)
{
    const std::string line = next_line(is, "$MeshFormat declaration");
    std::istringstream iss(line);
    std::vector<std::string> fields;
    for (std::string tok; iss >> tok;)
        fields.push_back(tok);
    if (fields.size() < 3)
        throw FormatError("Malformed $MeshFormat line '" + line + "'");

    FormatHeader h;
    h.version = fields[0];
    if (fields[1] != "0" && fields[1] != "1")
        throw FormatError("File type must be 0 (ASCII) or 1 (binary), got '" + fields[1] + "'");
    h.ascii = fields[1] == "0";
    try
    {
        h.data_size = std::stoi(fields[2]);
    }
    catch (const std::exception&)
    {
        throw FormatError("Malformed data size '" + fields[2] + "' in $MeshFormat");
    }

    if (!h.ascii)
    {
        const auto one = read_binary<std::int32_t>(is, "endianness sentinel");
        if (one != 1)
            throw FormatError("Binary endianness sentinel is " + std::to_string(one) +
                              ", expected 1");
    }

    // Tolerate anything between the declaration and the terminator
    skip_to_section_end(is, "MeshFormat");
    LOGD("gmsh: format %s, %s, data size %d\n", h.version.c_str(), h.ascii ? "ascii" : "binary",
         h.data_size);
    return h;
}

FormatHeader read_preamble(std::istream& is)
{
    std::string line = next_line(is, "$MeshFormat");
    while (line.empty() || line == "$Comments")
    {
        if (line == "$Comments")
            skip_to_section_end(is, "Comments");
        line = next_line(is, "$MeshFormat");
    }
    if (line != "$MeshFormat")
        throw FormatError("Expected $MeshFormat, found '" + line + "'");
    return read_header(is);
}

void write_header(std::ostream& os, std::string_view version, bool binary, int data_size)
{
    os << "$MeshFormat\n" << version << " " << (binary ? 1 : 0) << " " << data_size << "\n";
    if (binary)
    {
        write_binary<std::int32_t>(os, 1);
        os << "\n";
    }
    os << "$EndMeshFormat\n";
}

} // namespace meshwire::gmsh
