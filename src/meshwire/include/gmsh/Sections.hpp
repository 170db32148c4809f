#pragma once
#include "mesh/Mesh.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @file Sections.hpp
 * @brief Version-independent MSH sections and the helpers every version codec shares.
 *
 * @details
 * ``$PhysicalNames``, ``$NodeData`` and ``$ElementData`` have the same layout in 2.2, 4.0 and
 * 4.1. A data section starts with three tag blocks:
 *
 * @rst
 * .. code-block:: text
 *
 *    1            # string tags
 *    "pressure"   # the first one is the field name
 *    1            # real tags (ignored on read, 0.0 on write)
 *    0.0
 *    3            # integer tags: step, components, items
 *    0
 *    1
 *    8
 * @endrst
 *
 * followed by ``items`` records of ``index`` + ``components`` doubles. In binary the index is a
 * 4-byte int and must count 1..items.
 */

namespace meshwire::gmsh
{

// Keys under which element tags travel in cell_data. Never written as $ElementData.
inline constexpr std::string_view kPhysicalKey = "gmsh:physical";
inline constexpr std::string_view kGeometricalKey = "gmsh:geometrical";
bool is_gmsh_tag_key(std::string_view name) noexcept;

// Stream positioned after "$PhysicalNames"; consumes through "$EndPhysicalNames".
void read_physical_names(std::istream& is, mesh::FieldData& field_data);
void write_physical_names(std::ostream& os, const mesh::FieldData& field_data);

// Stream positioned after "$<tag>"; stores the array under its string-tag name.
void read_data(std::istream& is, std::string_view tag, std::map<std::string, mesh::DataArray>& out,
               bool ascii);
void write_data(std::ostream& os, std::string_view tag, const std::string& name,
                const mesh::DataArray& data, bool binary);

// Everything a writer can reject, checked before the output file is created.
void validate_for_write(const mesh::Mesh& m);

// Cell data to emit as $ElementData: everything but the element tag keys, concatenated.
mesh::RawCellData element_data_for_write(const mesh::Mesh& m);

// (N,2) points padded with z = 0; (N,3) points converted to float64.
mesh::DataArray points_3d(const mesh::DataArray& points);

// Cell blocks as int64 rows in Gmsh local node order.
std::vector<std::int64_t> cells_to_gmsh_order(const mesh::CellBlock& block);
// In-place reorder of freshly read blocks into canonical local node order.
void cells_from_gmsh_order(std::vector<mesh::CellBlock>& blocks);

// Element tag arrays for one block, or empty if the mesh carries none under `key`.
std::vector<std::int64_t> element_tags(const mesh::Mesh& m, std::string_view key,
                                       const mesh::CellBlock& block);

// File node tags -> 0-based point index.
class NodeTagMap
{
  public:
    void add(std::int64_t tag, std::int64_t index) { map_[tag] = index; }
    bool empty() const noexcept { return map_.empty(); }
    std::int64_t lookup(std::int64_t tag) const;

  private:
    std::unordered_map<std::int64_t, std::int64_t> map_;
};

// Per-type element tag accumulation while reading, emitted as int32 cell_data.
class ElementTagSink
{
  public:
    void add(const std::string& type, std::int32_t physical, std::int32_t geometrical);
    void mark_physical() noexcept { have_physical_ = true; }
    void mark_geometrical() noexcept { have_geometrical_ = true; }
    void emit(const std::vector<mesh::CellBlock>& blocks, mesh::CellData& cell_data) const;

  private:
    std::map<std::string, std::vector<std::int32_t>> physical_;
    std::map<std::string, std::vector<std::int32_t>> geometrical_;
    bool have_physical_ = false;
    bool have_geometrical_ = false;
};

// Moves raw $ElementData arrays into per-block cell_data.
void attach_element_data(const std::vector<mesh::CellBlock>& blocks, const mesh::RawCellData& raw,
                         mesh::CellData& cell_data);

} // namespace meshwire::gmsh
