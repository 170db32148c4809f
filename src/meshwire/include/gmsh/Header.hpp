#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

/**
 * @file Header.hpp
 * @brief ``$MeshFormat`` negotiation: version string, word size, ASCII/binary mode.
 *
 * @details
 * The declaration line is ``<version> <0|1> <word-size>``. The version is kept as text so that
 * dispatch can match ``"2"``, ``"4"``, ``"4.0"``, ``"4.1"`` exactly. In binary mode the line is
 * followed by the integer ``1`` in host byte order; anything else means the file was written on
 * a machine of the other endianness (or is corrupt) and is rejected, not byte-swapped.
 */

namespace meshwire::gmsh
{

struct FormatHeader
{
    std::string version;
    int data_size = 8;
    bool ascii = true;
};

// Stream positioned just after the "$MeshFormat" marker. Consumes through "$EndMeshFormat".
FormatHeader read_header(std::istream& is);

// Skips leading $Comments blocks, requires "$MeshFormat", then calls read_header().
FormatHeader read_preamble(std::istream& is);

void write_header(std::ostream& os, std::string_view version, bool binary, int data_size);

} // namespace meshwire::gmsh
