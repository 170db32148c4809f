#include <catch2/catch_test_macros.hpp>

#include <hdf5.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "xdmf/TimeSeries.hpp"
#include "TempPath.hpp"

using namespace meshwire;
using mesh::DataArray;
using DataFormat = xdmf::WriterConfig::DataFormat;

static DataArray square_points()
{
    return DataArray::from<double>({0.0, 0.0, 0.0,  //
                                    1.0, 0.0, 0.0,  //
                                    1.0, 1.0, 0.0,  //
                                    0.1, 0.7, 1.0 / 3.0},
                                   {4, 3});
}

static std::vector<mesh::CellBlock> mixed_cells()
{
    std::vector<mesh::CellBlock> cells;
    cells.push_back({"triangle", DataArray::from<std::int64_t>({0, 1, 2, 0, 2, 3}, {2, 3})});
    cells.push_back({"line", DataArray::from<std::int64_t>({0, 1}, {1, 2})});
    return cells;
}

static std::string slurp(const std::filesystem::path& p)
{
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void require_same(const DataArray& a, const DataArray& b)
{
    REQUIRE(a.shape() == b.shape());
    for (std::size_t i = 0; i < a.size(); ++i)
        REQUIRE(a.get(i) == b.get(i));
}

TEST_CASE("Time series round-trips in every data format", "[io][xdmf]")
{
    for (DataFormat format : {DataFormat::XML, DataFormat::Binary, DataFormat::HDF})
    {
        INFO("format " << xdmf::data_format_name(format));
        const auto path = temp_path("series", ".xdmf");
        const auto points = square_points();
        const auto cells = mixed_cells();
        const std::vector<double> times = {0.0, 0.5, 1.25};

        {
            xdmf::WriterConfig cfg;
            cfg.data_format = format;
            xdmf::TimeSeriesWriter w(path.string(), cfg);
            w.write_points_cells(points, cells);
            for (std::size_t k = 0; k < times.size(); ++k)
            {
                mesh::PointData pd;
                pd["u"] = DataArray::from<double>({1.0 * k, 2.0, 3.0, 4.0}, {4});
                mesh::CellData cd;
                cd["id"]["triangle"] = DataArray::from<std::int32_t>({10, 11}, {2});
                cd["id"]["line"] = DataArray::from<std::int32_t>({static_cast<std::int32_t>(k)}, {1});
                w.write_data(times[k], pd, cd);
            }
            // points, topology, then two attributes per step
            REQUIRE(w.data_counter() == 2 + 2 * times.size());
        }

        xdmf::TimeSeriesReader r(path.string());
        REQUIRE(r.num_steps() == times.size());

        const auto m = r.read_points_cells();
        require_same(m.points, points);
        REQUIRE(m.cells.size() == 2);
        REQUIRE(m.cells[0].type == "triangle");
        REQUIRE(m.cells[1].type == "line");
        require_same(m.cells[0].data, cells[0].data);
        require_same(m.cells[1].data, cells[1].data);

        for (std::size_t k = 0; k < times.size(); ++k)
        {
            const auto f = r.read_data(k);
            REQUIRE(f.time == times[k]);
            REQUIRE(f.point_data.at("u").get(0) == 1.0 * k);
            REQUIRE(f.cell_data.at("id").at("triangle").get_int(1) == 11);
            REQUIRE(f.cell_data.at("id").at("line").dtype() == mesh::DType::Int32);
            REQUIRE(f.cell_data.at("id").at("line").get_int(0) == static_cast<std::int64_t>(k));
        }
    }
}

TEST_CASE("A single cell type is written as a plain topology", "[io][xdmf]")
{
    const auto path = temp_path("single", ".xdmf");
    std::vector<mesh::CellBlock> cells;
    cells.push_back({"quad", DataArray::from<std::int32_t>({0, 1, 2, 3}, {1, 4})});
    {
        xdmf::WriterConfig cfg;
        cfg.data_format = DataFormat::XML;
        xdmf::TimeSeriesWriter w(path.string(), cfg);
        w.write_points_cells(square_points(), cells);
        w.write_data(2.0);
    }

    const std::string text = slurp(path);
    REQUIRE(text.find("TopologyType=\"Quadrilateral\"") != std::string::npos);
    REQUIRE(text.find("NumberOfElements=\"1\"") != std::string::npos);
    REQUIRE(text.find("xmlns:xi=\"http://www.w3.org/2003/XInclude\"") != std::string::npos);
    REQUIRE(text.find("<xi:include") != std::string::npos);
    REQUIRE(text.find("CollectionType=\"Temporal\"") != std::string::npos);

    xdmf::TimeSeriesReader r(path.string());
    const auto m = r.read_points_cells();
    REQUIRE(m.cells.size() == 1);
    REQUIRE(m.cells[0].type == "quad");
    REQUIRE(m.cells[0].data.dtype() == mesh::DType::Int32);
    REQUIRE(r.read_data(0).time == 2.0);
}

TEST_CASE("HDF store holds one dataset per written array", "[io][xdmf][hdf5]")
{
    const auto path = temp_path("store", ".xdmf");
    {
        xdmf::TimeSeriesWriter w(path.string());
        w.write_points_cells(square_points(), mixed_cells());
        mesh::PointData pd;
        pd["v"] = DataArray::from<float>({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}, {4, 3});
        w.write_data(0.0, pd);
        w.close();
        w.close(); // idempotent
    }

    auto h5 = path;
    h5.replace_extension(".h5");
    REQUIRE(std::filesystem::exists(h5));

    hid_t f = H5Fopen(h5.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    REQUIRE(f >= 0);
    hid_t d = H5Dopen2(f, "/data0", H5P_DEFAULT);
    REQUIRE(d >= 0);
    hid_t s = H5Dget_space(d);
    hsize_t dims[2] = {0, 0};
    REQUIRE(H5Sget_simple_extent_ndims(s) == 2);
    H5Sget_simple_extent_dims(s, dims, nullptr);
    REQUIRE(dims[0] == 4);
    REQUIRE(dims[1] == 3);
    H5Sclose(s);
    H5Dclose(d);

    hid_t v = H5Dopen2(f, "/data2", H5P_DEFAULT);
    REQUIRE(v >= 0);
    hid_t t = H5Dget_type(v);
    REQUIRE(H5Tget_class(t) == H5T_FLOAT);
    REQUIRE(H5Tget_size(t) == 4);
    H5Tclose(t);
    H5Dclose(v);
    H5Fclose(f);

    xdmf::TimeSeriesReader r(path.string());
    r.read_points_cells();
    const auto frame = r.read_data(0);
    REQUIRE(frame.point_data.at("v").dtype() == mesh::DType::Float32);
    REQUIRE(frame.point_data.at("v").get(11) == 12.0);
    REQUIRE(r.debug_open_stores() == 1);
    r.close();
    REQUIRE(r.debug_open_stores() == 0);
}

TEST_CASE("Binary sidecars are numbered after the XDMF stem", "[io][xdmf]")
{
    const auto path = temp_path("sidecars", ".xdmf");
    {
        xdmf::WriterConfig cfg;
        cfg.data_format = DataFormat::Binary;
        xdmf::TimeSeriesWriter w(path.string(), cfg);
        w.write_points_cells(square_points(), mixed_cells());
        w.write_data(0.0);
        w.write_data(1.0);
    }
    const auto dir = path.parent_path();
    const auto stem = path.stem().string();
    REQUIRE(std::filesystem::exists(dir / (stem + "0.bin")));
    REQUIRE(std::filesystem::exists(dir / (stem + "1.bin")));
    REQUIRE_FALSE(std::filesystem::exists(dir / (stem + "2.bin")));
    REQUIRE(std::filesystem::file_size(dir / (stem + "0.bin")) == 4 * 3 * sizeof(double));

    xdmf::TimeSeriesReader r(path.string());
    r.read_points_cells();
    REQUIRE(r.num_steps() == 2);
    REQUIRE(r.read_data(1).time == 1.0);
    REQUIRE(r.read_data(1).point_data.empty());
}

TEST_CASE("Writer call order is enforced", "[io][xdmf]")
{
    const auto path = temp_path("order", ".xdmf");
    xdmf::WriterConfig cfg;
    cfg.data_format = DataFormat::XML;
    xdmf::TimeSeriesWriter w(path.string(), cfg);

    REQUIRE_THROWS_AS(w.write_data(0.0), WriteError);
    REQUIRE_THROWS_AS(w.write_points_cells(DataArray::from<double>({1, 2, 3, 4}, {4}), {}),
                      WriteError);

    std::vector<mesh::CellBlock> odd;
    odd.push_back({"polygon", DataArray::from<std::int64_t>({0, 1, 2}, {1, 3})});
    REQUIRE_THROWS(w.write_points_cells(square_points(), odd));

    w.write_points_cells(square_points(), mixed_cells());
    REQUIRE_THROWS_AS(w.write_points_cells(square_points(), mixed_cells()), WriteError);

    mesh::CellData partial;
    partial["id"]["triangle"] = DataArray::from<std::int32_t>({1, 2}, {2});
    REQUIRE_THROWS_AS(w.write_data(0.0, {}, partial), WriteError);

    mesh::PointData bad;
    bad["w"] = DataArray(mesh::DType::Float64, {4, 4});
    REQUIRE_THROWS_AS(w.write_data(0.0, bad), WriteError);

    w.write_data(0.0);
    w.close();
    xdmf::TimeSeriesReader r(path.string());
    REQUIRE(r.num_steps() == 1);
}
