#include "gmsh/VersionTable.hpp"
#include "common/Errors.hpp"
#include "gmsh/Codecs.hpp"

using namespace meshwire::gmsh;

const Codec& VersionTable::resolve(const std::string& version) const {
  auto it = codecs_.find(version);
  if (it == codecs_.end()) it = codecs_.find(version.substr(0, version.find('.')));
  if (it != codecs_.end()) return it->second;

  std::string known;
  for (const auto& k : keys()) known += (known.empty() ? "" : ", ") + k;
  throw UnsupportedVersionError("Need mesh format in [" + known + "] (got " + version + ")");
}

std::vector<std::string> VersionTable::keys() const {
  std::vector<std::string> out;
  for (const auto& kv : codecs_) out.push_back(kv.first);
  return out;
}

const VersionTable& meshwire::gmsh::reader_table() {
  static const VersionTable table = [] {
    VersionTable t;
    t.add("2", Codec{&read_msh22, &write_msh22});
    t.add("4", Codec{&read_msh40, &write_msh40});
    t.add("4.0", Codec{&read_msh40, &write_msh40});
    t.add("4.1", Codec{&read_msh41, &write_msh41});
    return t;
  }();
  return table;
}

const VersionTable& meshwire::gmsh::writer_table() {
  static const VersionTable table = [] {
    VersionTable t;
    t.add("2", Codec{&read_msh22, &write_msh22});
    t.add("4", Codec{&read_msh41, &write_msh41});
    t.add("4.0", Codec{&read_msh40, &write_msh40});
    t.add("4.1", Codec{&read_msh41, &write_msh41});
    return t;
  }();
  return table;
}
