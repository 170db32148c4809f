#include "gmsh/Sections.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "gmsh/GmshTypes.hpp"
#include "gmsh/WireIO.hpp"
#include "mesh/CellTypes.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <tuple>

namespace meshwire::gmsh
{

using mesh::DataArray;
using mesh::DType;

namespace
{

int parse_count(const std::string& line, std::string_view what)
{
    try
    {
        std::size_t pos = 0;
        const int v = std::stoi(line, &pos);
        if (v < 0 || trim(line.substr(pos)).size() != 0)
            throw FormatError("");
        return v;
    }
    catch (const std::exception&)
    {
        throw FormatError("Malformed " + std::string(what) + " '" + line + "'");
    }
}

std::string unquote(std::string s)
{
    s = trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
        return s.substr(1, s.size() - 2);
    return s;
}

int components_of(const DataArray& a)
{
    return a.ndim() <= 1 ? 1 : static_cast<int>(a.cols());
}

void check_components(const std::string& name, const DataArray& a)
{
    const int c = components_of(a);
    if (c != 1 && c != 3 && c != 9)
        throw WriteError("Gmsh only permits 1, 3, or 9 components per data field; '" + name +
                         "' has " + std::to_string(c));
}

} // namespace

bool is_gmsh_tag_key(std::string_view name) noexcept
{
    return name == kPhysicalKey || name == kGeometricalKey;
}

void read_physical_names(std::istream& is, mesh::FieldData& field_data)
{
    const int n = parse_count(next_line(is, "$PhysicalNames count"), "physical name count");
    for (int k = 0; k < n; ++k)
    {
        const std::string line = next_line(is, "$PhysicalNames entry");
        std::istringstream iss(line);
        std::int64_t dim = 0, id = 0;
        if (!(iss >> dim >> id))
            throw FormatError("Malformed physical name entry '" + line + "'");
        std::string rest;
        std::getline(iss, rest);
        const std::string name = unquote(rest);
        if (name.empty())
            throw FormatError("Physical name entry without a name: '" + line + "'");
        field_data[name] = DataArray::from<std::int64_t>({id, dim}, {2});
    }
    const std::string end = next_line(is, "$EndPhysicalNames");
    if (end != "$EndPhysicalNames")
        throw FormatError("Expected $EndPhysicalNames, found '" + end + "'");
}

void write_physical_names(std::ostream& os, const mesh::FieldData& field_data)
{
    std::vector<std::tuple<std::int64_t, std::int64_t, std::string>> entries;
    for (const auto& [name, value] : field_data)
    {
        if (value.size() != 2 || !std::isfinite(value.get(0)) || !std::isfinite(value.get(1)))
        {
            LOGW("gmsh: field data '%s' is not an (id, dimension) pair; skipped\n", name.c_str());
            continue;
        }
        const auto id = static_cast<std::int64_t>(value.get(0));
        const auto dim = static_cast<std::int64_t>(value.get(1));
        entries.emplace_back(dim, id, name);
    }
    std::sort(entries.begin(), entries.end());
    if (entries.empty())
        return;

    os << "$PhysicalNames\n" << entries.size() << "\n";
    for (const auto& [dim, id, name] : entries)
        os << dim << " " << id << " \"" << name << "\"\n";
    os << "$EndPhysicalNames\n";
}

void read_data(std::istream& is, std::string_view tag, std::map<std::string, DataArray>& out,
               bool ascii)
{
    std::vector<std::string> string_tags;
    const int ns = parse_count(next_line(is, "string tag count"), "string tag count");
    for (int k = 0; k < ns; ++k)
        string_tags.push_back(unquote(next_line(is, "string tag")));

    const int nr = parse_count(next_line(is, "real tag count"), "real tag count");
    for (int k = 0; k < nr; ++k)
        next_line(is, "real tag");

    std::vector<int> int_tags;
    const int ni = parse_count(next_line(is, "integer tag count"), "integer tag count");
    for (int k = 0; k < ni; ++k)
        int_tags.push_back(parse_count(next_line(is, "integer tag"), "integer tag"));

    if (string_tags.empty())
        throw FormatError("$" + std::string(tag) + " without a name tag");
    if (int_tags.size() < 3)
        throw FormatError("$" + std::string(tag) + " '" + string_tags[0] +
                          "' needs at least 3 integer tags, got " +
                          std::to_string(int_tags.size()));

    const auto nc = static_cast<std::size_t>(int_tags[1]);
    const auto n = static_cast<std::size_t>(int_tags[2]);
    if (nc == 0)
        throw FormatError("$" + std::string(tag) + " '" + string_tags[0] + "' has 0 components");

    DataArray values(DType::Float64, nc == 1 ? std::vector<std::size_t>{n}
                                             : std::vector<std::size_t>{n, nc});
    double* dst = values.as<double>();
    for (std::size_t i = 0; i < n; ++i)
    {
        if (ascii)
        {
            read_ascii<double>(is, "data index");
            for (std::size_t c = 0; c < nc; ++c)
                dst[i * nc + c] = read_ascii<double>(is, "data value");
        }
        else
        {
            const auto index = read_binary<std::int32_t>(is, "data index");
            if (index != static_cast<std::int64_t>(i) + 1)
                throw FormatError("$" + std::string(tag) + " '" + string_tags[0] +
                                  "': record " + std::to_string(i) + " has index " +
                                  std::to_string(index) + ", expected " + std::to_string(i + 1));
            read_binary(is, dst + i * nc, nc, "data value");
        }
    }
    skip_to_section_end(is, tag);
    out[string_tags[0]] = std::move(values);
}

void write_data(std::ostream& os, std::string_view tag, const std::string& name,
                const DataArray& data, bool binary)
{
    check_components(name, data);
    const auto nc = static_cast<std::size_t>(components_of(data));
    const std::size_t n = data.rows();

    os << "$" << tag << "\n";
    os << "1\n\"" << name << "\"\n";
    os << "1\n0.0\n";
    os << "3\n0\n" << nc << "\n" << n << "\n";
    if (binary)
    {
        std::vector<double> row(nc);
        for (std::size_t i = 0; i < n; ++i)
        {
            write_binary<std::int32_t>(os, static_cast<std::int32_t>(i + 1));
            for (std::size_t c = 0; c < nc; ++c)
                row[c] = data.get(i * nc + c);
            write_binary(os, row.data(), nc);
        }
        os << "\n";
    }
    else
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            os << i + 1;
            for (std::size_t c = 0; c < nc; ++c)
                os << " " << format_double(data.get(i * nc + c));
            os << "\n";
        }
    }
    os << "$End" << tag << "\n";
}

void validate_for_write(const mesh::Mesh& m)
{
    if (m.points.ndim() != 2 || (m.points.cols() != 2 && m.points.cols() != 3))
        throw WriteError("Points must have shape (N, 2) or (N, 3), got " +
                         m.points.shape_string());

    for (const auto& block : m.cells)
    {
        cell_type_to_gmsh(block.type);
        const auto arity = static_cast<std::size_t>(mesh::num_nodes_per_cell(block.type));
        if (!mesh::dtype_is_integer(block.data.dtype()) || block.data.ndim() != 2 ||
            block.data.cols() != arity)
            throw WriteError("Cell block '" + block.type + "' must be an integer (n, " +
                             std::to_string(arity) + ") array, got " +
                             block.data.shape_string());
    }

    for (const auto& [name, data] : m.point_data)
    {
        if (data.rows() != m.num_points())
            throw WriteError("Point data '" + name + "' has " + std::to_string(data.rows()) +
                             " rows for " + std::to_string(m.num_points()) + " points");
        check_components(name, data);
    }

    for (const auto& [name, data] : element_data_for_write(m))
        check_components(name, data);
}

mesh::RawCellData element_data_for_write(const mesh::Mesh& m)
{
    mesh::CellData user;
    for (const auto& [name, per_type] : m.cell_data)
        if (!is_gmsh_tag_key(name))
            user.emplace(name, per_type);
    return mesh::raw_from_cell_data(m.cells, user);
}

DataArray points_3d(const DataArray& points)
{
    const std::size_t n = points.rows();
    const std::size_t dim = points.cols();
    if (dim == 3)
        return points.astype(DType::Float64);
    if (dim != 2)
        throw WriteError("Points must have shape (N, 2) or (N, 3), got " + points.shape_string());

    LOGW("gmsh: 2D points padded with z = 0 (the format stores 3 coordinates)\n");
    DataArray out(DType::Float64, {n, 3});
    double* dst = out.as<double>();
    for (std::size_t i = 0; i < n; ++i)
    {
        dst[3 * i + 0] = points.get(2 * i + 0);
        dst[3 * i + 1] = points.get(2 * i + 1);
        dst[3 * i + 2] = 0.0;
    }
    return out;
}

std::vector<std::int64_t> cells_to_gmsh_order(const mesh::CellBlock& block)
{
    const std::size_t n = block.data.rows();
    const std::size_t arity = block.data.cols();
    const auto inv = invert_permutation(gmsh_node_permutation(block.type));
    std::vector<std::int64_t> out(n * arity);
    for (std::size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = 0; j < arity; ++j)
        {
            const std::size_t src = inv.empty() ? j : static_cast<std::size_t>(inv[j]);
            out[i * arity + j] = block.data.get_int(i * arity + src);
        }
    }
    return out;
}

void cells_from_gmsh_order(std::vector<mesh::CellBlock>& blocks)
{
    for (auto& block : blocks)
    {
        const auto& perm = gmsh_node_permutation(block.type);
        if (perm.empty())
            continue;
        const std::size_t n = block.data.rows();
        const std::size_t arity = block.data.cols();
        auto* rows = block.data.as<std::int64_t>();
        std::vector<std::int64_t> tmp(arity);
        for (std::size_t i = 0; i < n; ++i)
        {
            std::int64_t* row = rows + i * arity;
            for (std::size_t j = 0; j < arity; ++j)
                tmp[j] = row[perm[j]];
            std::copy(tmp.begin(), tmp.end(), row);
        }
    }
}

std::vector<std::int64_t> element_tags(const mesh::Mesh& m, std::string_view key,
                                       const mesh::CellBlock& block)
{
    auto it = m.cell_data.find(std::string(key));
    if (it == m.cell_data.end())
        return {};
    auto jt = it->second.find(block.type);
    if (jt == it->second.end() || jt->second.size() != block.size())
        return {};
    std::vector<std::int64_t> out(block.size());
    for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = jt->second.get_int(i);
    return out;
}

std::int64_t NodeTagMap::lookup(std::int64_t tag) const
{
    auto it = map_.find(tag);
    if (it == map_.end())
        throw FormatError("Element references unknown node tag " + std::to_string(tag));
    return it->second;
}

void ElementTagSink::add(const std::string& type, std::int32_t physical, std::int32_t geometrical)
{
    physical_[type].push_back(physical);
    geometrical_[type].push_back(geometrical);
}

void ElementTagSink::emit(const std::vector<mesh::CellBlock>& blocks,
                          mesh::CellData& cell_data) const
{
    auto put = [&](std::string_view key, const std::map<std::string, std::vector<std::int32_t>>& src)
    {
        auto& dst = cell_data[std::string(key)];
        for (const auto& block : blocks)
        {
            auto it = src.find(block.type);
            std::vector<std::int32_t> values =
                it == src.end() ? std::vector<std::int32_t>(block.size(), 0) : it->second;
            dst[block.type] = DataArray::from(values, {values.size()});
        }
    };
    if (have_physical_)
        put(kPhysicalKey, physical_);
    if (have_geometrical_)
        put(kGeometricalKey, geometrical_);
}

void attach_element_data(const std::vector<mesh::CellBlock>& blocks, const mesh::RawCellData& raw,
                         mesh::CellData& cell_data)
{
    if (raw.empty())
        return;
    for (auto& [name, per_type] : mesh::cell_data_from_raw(blocks, raw))
        cell_data[name] = std::move(per_type);
}

} // namespace meshwire::gmsh
