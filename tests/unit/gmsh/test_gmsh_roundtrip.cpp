#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "common/Errors.hpp"
#include "gmsh/Gmsh.hpp"
#include "gmsh/Sections.hpp"
#include "TempPath.hpp"

using namespace meshwire;
using Catch::Approx;
using mesh::DataArray;

// Two triangles and a line on a unit square, with point, cell and field data
static mesh::Mesh square_mesh()
{
    mesh::Mesh m;
    m.points = DataArray::from<double>({0.0, 0.0, 0.0,  //
                                        1.0, 0.0, 0.0,  //
                                        1.0, 1.0, 0.0,  //
                                        0.1, 0.7, 1e-3},
                                       {4, 3});
    m.cells.push_back({"triangle", DataArray::from<std::int64_t>({0, 1, 2, 0, 2, 3}, {2, 3})});
    m.cells.push_back({"line", DataArray::from<std::int64_t>({0, 1}, {1, 2})});
    m.point_data["u"] = DataArray::from<double>({0.5, 1.5, 2.5, 3.5}, {4});
    m.point_data["v"] =
        DataArray::from<double>({1, 0, 0, 0, 1, 0, 0, 0, 1, 1, 1, 1}, {4, 3});
    m.cell_data["p"]["triangle"] = DataArray::from<double>({10.0, 20.0}, {2});
    m.cell_data["p"]["line"] = DataArray::from<double>({30.0}, {1});
    m.field_data["boundary"] = DataArray::from<std::int64_t>({3, 1}, {2});
    m.field_data["plate"] = DataArray::from<std::int64_t>({7, 2}, {2});
    return m;
}

static void require_close(const DataArray& a, const DataArray& b)
{
    REQUIRE(a.shape() == b.shape());
    for (std::size_t i = 0; i < a.size(); ++i)
        REQUIRE(std::abs(a.get(i) - b.get(i)) <= 1e-15);
}

static void require_same_cells(const mesh::Mesh& a, const mesh::Mesh& b)
{
    REQUIRE(a.cells.size() == b.cells.size());
    for (std::size_t k = 0; k < a.cells.size(); ++k)
    {
        REQUIRE(a.cells[k].type == b.cells[k].type);
        REQUIRE(a.cells[k].data.shape() == b.cells[k].data.shape());
        for (std::size_t i = 0; i < a.cells[k].data.size(); ++i)
            REQUIRE(a.cells[k].data.get_int(i) == b.cells[k].data.get_int(i));
    }
}

TEST_CASE("Every version round-trips in ASCII and binary", "[gmsh][io]")
{
    const auto m = square_mesh();
    for (const std::string version : {"2.2", "4.0", "4.1"})
    {
        for (bool binary : {false, true})
        {
            INFO("version " << version << (binary ? " binary" : " ascii"));
            const auto path = temp_path("roundtrip", ".msh").string();
            gmsh::write(path, m, version, binary);
            const auto r = gmsh::read(path);

            require_close(r.points, m.points);
            require_same_cells(r, m);

            REQUIRE(r.point_data.size() == 2);
            require_close(r.point_data.at("u"), m.point_data.at("u"));
            require_close(r.point_data.at("v"), m.point_data.at("v"));

            REQUIRE(r.cell_data.at("p").at("triangle").get(1) == Approx(20.0));
            REQUIRE(r.cell_data.at("p").at("line").get(0) == Approx(30.0));

            REQUIRE(r.field_data.size() == 2);
            REQUIRE(r.field_data.at("plate").get_int(0) == 7);
            REQUIRE(r.field_data.at("plate").get_int(1) == 2);
            REQUIRE(r.field_data.at("boundary").get_int(0) == 3);
            REQUIRE(r.field_data.at("boundary").get_int(1) == 1);
        }
    }
}

TEST_CASE("Empty cell blocks do not break a round trip", "[gmsh][io]")
{
    auto m = square_mesh();
    m.cell_data.clear();
    m.cells[1].data = DataArray(mesh::DType::Int64, {0, 2});
    for (const bool empty_first : {false, true})
    {
        if (empty_first)
            std::swap(m.cells[0], m.cells[1]);
        for (const std::string version : {"2.2", "4.0", "4.1"})
        {
            for (bool binary : {false, true})
            {
                INFO("version " << version << (binary ? " binary" : " ascii")
                                << (empty_first ? " empty first" : " empty last"));
                std::stringstream ss;
                gmsh::write_stream(ss, m, version, binary);
                const auto r = gmsh::read_stream(ss);
                REQUIRE(r.cells.size() == 1);
                REQUIRE(r.cells[0].type == "triangle");
                REQUIRE(r.cells[0].data.get_int(5) == 3);
            }
        }
    }
}

TEST_CASE("Second-order tetra node order survives the Gmsh permutation", "[gmsh][io]")
{
    mesh::Mesh m;
    std::vector<double> xyz;
    for (int i = 0; i < 10; ++i)
    {
        xyz.push_back(i);
        xyz.push_back(i * 0.5);
        xyz.push_back(-i);
    }
    m.points = DataArray::from(xyz, {10, 3});
    m.cells.push_back(
        {"tetra10", DataArray::from<std::int64_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 10})});

    std::stringstream ss;
    gmsh::write_stream(ss, m, "2.2", false);
    // nodes 8 and 9 trade places on disk
    REQUIRE(ss.str().find("1 11 0 1 2 3 4 5 6 7 8 10 9\n") != std::string::npos);

    for (const std::string version : {"2.2", "4.0", "4.1"})
    {
        std::stringstream rt;
        gmsh::write_stream(rt, m, version, true);
        const auto r = gmsh::read_stream(rt);
        require_same_cells(r, m);
    }
}

TEST_CASE("2D points are padded with z = 0", "[gmsh][io]")
{
    mesh::Mesh m;
    m.points = DataArray::from<double>({0, 0, 2, 0, 0, 3}, {3, 2});
    m.cells.push_back({"triangle", DataArray::from<std::int64_t>({0, 1, 2}, {1, 3})});

    std::stringstream ss;
    gmsh::write_stream(ss, m, "4.1", false);
    const auto r = gmsh::read_stream(ss);
    REQUIRE(r.points.shape() == std::vector<std::size_t>{3, 3});
    REQUIRE(r.points.get(3) == 2.0);
    REQUIRE(r.points.get(7) == 3.0);
    REQUIRE(r.points.get(2) == 0.0);
    REQUIRE(r.points.get(5) == 0.0);
    REQUIRE(r.points.get(8) == 0.0);
}

TEST_CASE("Element tags survive a 2.2 round trip", "[gmsh][io][tags]")
{
    auto m = square_mesh();
    m.cell_data[std::string(gmsh::kPhysicalKey)]["triangle"] =
        DataArray::from<std::int32_t>({7, 7}, {2});
    m.cell_data[std::string(gmsh::kPhysicalKey)]["line"] = DataArray::from<std::int32_t>({3}, {1});
    m.cell_data[std::string(gmsh::kGeometricalKey)]["triangle"] =
        DataArray::from<std::int32_t>({1, 2}, {2});

    for (bool binary : {false, true})
    {
        std::stringstream ss;
        gmsh::write_stream(ss, m, "2.2", binary);
        const auto r = gmsh::read_stream(ss);

        const auto& phys = r.cell_data.at(std::string(gmsh::kPhysicalKey));
        REQUIRE(phys.at("triangle").dtype() == mesh::DType::Int32);
        REQUIRE(phys.at("triangle").get_int(0) == 7);
        REQUIRE(phys.at("line").get_int(0) == 3);

        // the line block had no geometrical tag and is zero-filled
        const auto& geom = r.cell_data.at(std::string(gmsh::kGeometricalKey));
        REQUIRE(geom.at("triangle").get_int(1) == 2);
        REQUIRE(geom.at("line").get_int(0) == 0);

        // tags are not emitted as element data
        REQUIRE(r.cell_data.size() == 3);
    }
}

TEST_CASE("4.1 elements take physical tags from their entity", "[gmsh][io][tags]")
{
    const char* text = "$MeshFormat\n4.1 0 8\n$EndMeshFormat\n"
                       "$PhysicalNames\n1\n2 7 \"plate\"\n$EndPhysicalNames\n"
                       "$Entities\n0 0 1 0\n1 0 0 0 1 1 0 1 7 0\n$EndEntities\n"
                       "$Nodes\n1 4 1 4\n2 1 0 4\n1\n2\n3\n4\n"
                       "0 0 0\n1 0 0\n1 1 0\n0 1 0\n$EndNodes\n"
                       "$Elements\n1 2 1 2\n2 1 2 2\n1 1 2 3\n2 1 3 4\n$EndElements\n";
    std::istringstream is(text);
    const auto m = gmsh::read_stream(is);

    REQUIRE(m.num_points() == 4);
    REQUIRE(m.cells.size() == 1);
    REQUIRE(m.cells[0].type == "triangle");
    REQUIRE(m.cells[0].data.get_int(3) == 0);
    REQUIRE(m.cells[0].data.get_int(5) == 3);

    const auto& phys = m.cell_data.at(std::string(gmsh::kPhysicalKey)).at("triangle");
    const auto& geom = m.cell_data.at(std::string(gmsh::kGeometricalKey)).at("triangle");
    REQUIRE(phys.get_int(0) == 7);
    REQUIRE(phys.get_int(1) == 7);
    REQUIRE(geom.get_int(0) == 1);
    REQUIRE(m.field_data.at("plate").get_int(0) == 7);
}

TEST_CASE("ASCII doubles are written exactly", "[gmsh][io]")
{
    mesh::Mesh m;
    m.points = DataArray::from<double>({0.1, 1.0 / 3.0, 2.0e-300}, {1, 3});

    std::stringstream ss;
    gmsh::write_stream(ss, m, "2.2", false);
    REQUIRE(ss.str().find("1 0.1 0.3333333333333333 2e-300\n") != std::string::npos);

    const auto r = gmsh::read_stream(ss);
    REQUIRE(r.points.get(1) == 1.0 / 3.0);
    REQUIRE(r.cells.empty());
}

TEST_CASE("Missing files are reported", "[gmsh][io]")
{
    REQUIRE_THROWS_AS(gmsh::read(temp_path("absent", ".msh").string()), Error);
}
