#include "common/Errors.hpp"
#include "mesh/Mesh.hpp"
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using namespace meshwire;
using namespace meshwire::mesh;

static std::vector<CellBlock> two_blocks()
{
    std::vector<CellBlock> cells;
    cells.push_back({"triangle", DataArray::from<std::int64_t>({0, 1, 2, 1, 3, 2}, {2, 3})});
    cells.push_back({"line", DataArray::from<std::int64_t>({0, 1, 1, 3, 3, 2}, {3, 2})});
    return cells;
}

TEST_CASE("raw_from_cell_data concatenates in block order", "[core][mesh]")
{
    const auto cells = two_blocks();
    CellData cd;
    cd["a"]["triangle"] = DataArray::from<double>({1, 2}, {2});
    cd["a"]["line"] = DataArray::from<double>({3, 4, 5}, {3});

    const auto raw = raw_from_cell_data(cells, cd);
    REQUIRE(raw.at("a").size() == 5);
    REQUIRE(raw.at("a").get(0) == 1.0);
    REQUIRE(raw.at("a").get(4) == 5.0);

    const auto back = cell_data_from_raw(cells, raw);
    REQUIRE(back.at("a").at("line").size() == 3);
    REQUIRE(back.at("a").at("line").get(2) == 5.0);
}

TEST_CASE("raw_from_cell_data rejects incomplete names", "[core][mesh]")
{
    const auto cells = two_blocks();
    CellData cd;
    cd["a"]["triangle"] = DataArray::from<double>({1, 2}, {2});
    REQUIRE_THROWS_AS(raw_from_cell_data(cells, cd), WriteError);

    RawCellData raw;
    raw["a"] = DataArray::from<double>({1, 2, 3}, {3});
    REQUIRE_THROWS_AS(cell_data_from_raw(cells, raw), FormatError);
}

TEST_CASE("CellGrouper keeps first-seen type order", "[core][mesh]")
{
    CellGrouper g;
    const std::int64_t tri0[] = {0, 1, 2};
    const std::int64_t ln0[] = {2, 3};
    const std::int64_t tri1[] = {1, 3, 2};
    g.add("triangle", tri0, 3);
    g.add("line", ln0, 2);
    g.add("triangle", tri1, 3);
    REQUIRE_THROWS_AS(g.add("line", tri1, 3), FormatError);

    const auto blocks = g.finish();
    REQUIRE(blocks.size() == 2);
    REQUIRE(blocks[0].type == "triangle");
    REQUIRE(blocks[0].size() == 2);
    REQUIRE(blocks[0].data.get_int(3) == 1);
    REQUIRE(blocks[1].type == "line");

    Mesh m;
    m.cells = blocks;
    REQUIRE(m.num_cells() == 3);
    REQUIRE(m.find_cells("line") != nullptr);
    REQUIRE(m.find_cells("quad") == nullptr);
}
