#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <fstream>
#include <string>

#include "common/Errors.hpp"
#include "xdmf/DataItem.hpp"
#include "xdmf/XdmfTypes.hpp"
#include "xdmf/XmlTree.hpp"
#include "TempPath.hpp"

using namespace meshwire;
using mesh::DataArray;
using mesh::DType;
using DataFormat = xdmf::WriterConfig::DataFormat;

static xdmf::XmlDoc parse_snippet(const std::string& xml)
{
    const auto path = temp_path("item", ".xml");
    std::ofstream out(path);
    out << xml;
    out.close();
    return xdmf::parse_xml_file(path.string());
}

static xdmf::DataItemRef parse_item(const std::string& xml)
{
    auto doc = parse_snippet(xml);
    return xdmf::parse_data_item(xmlDocGetRootElement(doc.get()));
}

TEST_CASE("DataItem attributes have XDMF defaults", "[xdmf][dataitem]")
{
    const auto ref = parse_item("<DataItem Dimensions=\"2 3\">1 2 3 4 5 6</DataItem>");
    REQUIRE(ref.format == DataFormat::XML);
    REQUIRE(ref.dtype == DType::Float32);
    REQUIRE(ref.dimensions == std::vector<std::size_t>{2, 3});

    xdmf::DataItemReader reader(".");
    const auto a = reader.read(ref);
    REQUIRE(a.shape() == std::vector<std::size_t>{2, 3});
    REQUIRE(a.get(5) == 6.0);
}

TEST_CASE("DataItem number types map to dtypes", "[xdmf][dataitem]")
{
    REQUIRE(parse_item("<DataItem Dimensions=\"1\" DataType=\"Int\" Precision=\"8\">7</DataItem>")
                .dtype == DType::Int64);
    REQUIRE(parse_item("<DataItem Dimensions=\"1\" NumberType=\"UInt\">7</DataItem>").dtype ==
            DType::UInt32);
    REQUIRE(parse_item("<DataItem Dimensions=\"1\" DataType=\"Char\" Precision=\"1\">7</DataItem>")
                .dtype == DType::Int8);
    REQUIRE(xdmf::dtype_to_xdmf(DType::UInt8) == std::pair<std::string, std::string>{"UChar", "1"});
    REQUIRE(xdmf::dtype_to_xdmf(DType::Float64) == std::pair<std::string, std::string>{"Float", "8"});
}

TEST_CASE("Malformed DataItems are rejected", "[xdmf][dataitem]")
{
    REQUIRE_THROWS_AS(
        parse_item("<DataItem Dimensions=\"1\" DataType=\"Int\" NumberType=\"Int\">1</DataItem>"),
        FormatError);
    REQUIRE_THROWS_AS(parse_item("<DataItem Dimensions=\"1\" Format=\"NetCDF\">1</DataItem>"),
                      FormatError);
    REQUIRE_THROWS_AS(parse_item("<DataItem>1</DataItem>"), FormatError);
    REQUIRE_THROWS_AS(parse_item("<DataItem Dimensions=\"2 x\">1 2</DataItem>"), FormatError);
    REQUIRE_THROWS_AS(
        parse_item("<DataItem Dimensions=\"1\" DataType=\"Float\" Precision=\"2\">1</DataItem>"),
        UnsupportedTypeError);
    REQUIRE_THROWS_AS(parse_item("<Attribute Name=\"x\"/>"), FormatError);
}

TEST_CASE("Inline values must fill the declared dimensions", "[xdmf][dataitem]")
{
    xdmf::DataItemReader reader(".");
    REQUIRE_THROWS_AS(reader.read(parse_item("<DataItem Dimensions=\"3\">1 2</DataItem>")),
                      FormatError);
    REQUIRE_THROWS_AS(reader.read(parse_item(
                          "<DataItem Dimensions=\"2\" DataType=\"Int\">1 2.5</DataItem>")),
                      FormatError);
}

TEST_CASE("HDF locations need an absolute dataset path", "[xdmf][dataitem]")
{
    xdmf::DataItemReader reader(".");
    const auto no_slash = parse_item("<DataItem Dimensions=\"1\" Format=\"HDF\">a.h5:data0</DataItem>");
    REQUIRE(no_slash.location == "a.h5:data0");
    REQUIRE_THROWS_AS(reader.read(no_slash), FormatError);

    const auto no_colon = parse_item("<DataItem Dimensions=\"1\" Format=\"HDF\">a.h5</DataItem>");
    REQUIRE_THROWS_AS(reader.read(no_colon), FormatError);

    const auto missing =
        parse_item("<DataItem Dimensions=\"1\" Format=\"HDF\">\n  absent_store.h5:/data0\n</DataItem>");
    REQUIRE(missing.location == "absent_store.h5:/data0");
    REQUIRE_THROWS_AS(reader.read(missing), Error);
    REQUIRE(reader.debug_open_stores() == 0);
}

TEST_CASE("Binary sidecars are read relative to the base directory", "[xdmf][dataitem]")
{
    const auto bin = temp_path("sidecar", ".bin");
    const std::int32_t values[4] = {3, 1, 4, 1};
    {
        std::ofstream out(bin, std::ios::binary);
        out.write(reinterpret_cast<const char*>(values), sizeof(values));
    }

    xdmf::DataItemReader reader(bin.parent_path());
    xdmf::DataItemRef ref;
    ref.format = DataFormat::Binary;
    ref.dimensions = {2, 2};
    ref.dtype = DType::Int32;
    ref.location = bin.filename().string();
    const auto a = reader.read(ref);
    REQUIRE(a.get_int(2) == 4);

    ref.dimensions = {3, 2};
    REQUIRE_THROWS_AS(reader.read(ref), FormatError);
}

TEST_CASE("Attribute types follow the data shape", "[xdmf][dataitem]")
{
    auto shaped = [](std::vector<std::size_t> shape)
    { return DataArray(DType::Float64, std::move(shape)); };

    REQUIRE(xdmf::attribute_type(shaped({4})) == "Scalar");
    REQUIRE(xdmf::attribute_type(shaped({4, 1})) == "Scalar");
    REQUIRE(xdmf::attribute_type(shaped({4, 2})) == "Vector");
    REQUIRE(xdmf::attribute_type(shaped({4, 3})) == "Vector");
    REQUIRE(xdmf::attribute_type(shaped({4, 6})) == "Tensor6");
    REQUIRE(xdmf::attribute_type(shaped({4, 9})) == "Tensor");
    REQUIRE(xdmf::attribute_type(shaped({4, 3, 3})) == "Tensor");
    REQUIRE(xdmf::attribute_type(shaped({4, 2, 5})) == "Matrix");
    REQUIRE_THROWS_AS(xdmf::attribute_type(shaped({4, 4})), WriteError);
}

TEST_CASE("Data formats parse by their XDMF names", "[xdmf][dataitem]")
{
    REQUIRE(xdmf::parse_data_format("XML") == DataFormat::XML);
    REQUIRE(xdmf::parse_data_format("Binary") == DataFormat::Binary);
    REQUIRE(xdmf::parse_data_format("HDF") == DataFormat::HDF);
    REQUIRE(std::string(xdmf::data_format_name(DataFormat::Binary)) == "Binary");
    REQUIRE_THROWS_AS(xdmf::parse_data_format("binary"), WriteError);
}
