#pragma once
#include "gmsh/Header.hpp"
#include "mesh/Mesh.hpp"
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

/**
 * @file VersionTable.hpp
 * @brief Version-string -> codec dispatch for MSH reading and writing.
 *
 * @details
 * Keys are the version strings accepted on input (the ``$MeshFormat`` field) or requested on
 * output. :cpp:func:`VersionTable::resolve` tries an exact match first and then the major
 * version (the text before the first ``.``), so ``"2.2"`` reaches the ``"2"`` entry on read.
 * Unknown versions raise :cpp:class:`meshwire::UnsupportedVersionError` listing the keys.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   const auto& codec = gmsh::reader_table().resolve(header.version);
 *   mesh::Mesh m = codec.read(stream, header);
 * @endrst
 */

namespace meshwire::gmsh
{

struct Codec
{
    using ReadFn = mesh::Mesh (*)(std::istream&, const FormatHeader&);
    using WriteFn = void (*)(std::ostream&, const mesh::Mesh&, bool binary);

    ReadFn read = nullptr;
    WriteFn write = nullptr;
};

class VersionTable
{
  public:
    void add(std::string key, Codec c) { codecs_[std::move(key)] = c; }

    const Codec& resolve(const std::string& version) const;
    std::vector<std::string> keys() const;

  private:
    std::map<std::string, Codec> codecs_;
};

// "2" -> 2.2, "4"/"4.0" -> 4.0, "4.1" -> 4.1
const VersionTable& reader_table();
// "2" -> 2.2, "4"/"4.1" -> 4.1, "4.0" -> 4.0
const VersionTable& writer_table();

} // namespace meshwire::gmsh
