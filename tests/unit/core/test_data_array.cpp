#include "mesh/DataArray.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace meshwire::mesh;
using Catch::Approx;

TEST_CASE("DataArray construction is zero-filled and shaped", "[core][array]")
{
    DataArray a(DType::Int32, {4, 3});
    REQUIRE(a.dtype() == DType::Int32);
    REQUIRE(a.ndim() == 2);
    REQUIRE(a.size() == 12);
    REQUIRE(a.rows() == 4);
    REQUIRE(a.cols() == 3);
    REQUIRE(a.nbytes() == 48);
    for (std::size_t i = 0; i < a.size(); ++i)
        REQUIRE(a.get_int(i) == 0);
    REQUIRE(a.shape_string() == "(4, 3)");

    DataArray v(DType::Float32, {5});
    REQUIRE(v.cols() == 1);
    REQUIRE(v.shape_string() == "(5,)");
}

TEST_CASE("DataArray typed access checks the dtype", "[core][array]")
{
    auto a = DataArray::from<double>({1.5, 2.5, 3.5}, {3});
    REQUIRE(a.as<double>()[1] == Approx(2.5));
    REQUIRE_THROWS_AS(a.as<float>(), std::runtime_error);
    REQUIRE_THROWS_AS(DataArray::from<int>({1, 2, 3}, {2, 2}), std::runtime_error);
}

TEST_CASE("DataArray converting access and astype", "[core][array]")
{
    auto a = DataArray::from<std::int64_t>({-3, 7, 42}, {3});
    REQUIRE(a.get(0) == Approx(-3.0));
    a.set(1, 9.0);
    REQUIRE(a.get_int(1) == 9);

    auto f = a.astype(DType::Float32);
    REQUIRE(f.dtype() == DType::Float32);
    REQUIRE(f.as<float>()[2] == Approx(42.0f));
    REQUIRE(dtype_size(DType::UInt16) == 2);
    REQUIRE(dtype_is_integer(DType::UInt8));
    REQUIRE_FALSE(dtype_is_integer(DType::Float64));
}

TEST_CASE("DataArray reshape keeps the element count", "[core][array]")
{
    auto a = DataArray::from<int>({0, 1, 2, 3, 4, 5}, {6});
    a.reshape({2, 3});
    REQUIRE(a.rows() == 2);
    REQUIRE(a.cols() == 3);
    REQUIRE(a.get_int(5) == 5);
    REQUIRE_THROWS_AS(a.reshape({4, 2}), std::runtime_error);
}

TEST_CASE("concatenate_rows stacks along axis 0", "[core][array]")
{
    auto a = DataArray::from<double>({1, 2, 3, 4}, {2, 2});
    auto b = DataArray::from<double>({5, 6}, {1, 2});
    auto c = DataArray::concatenate_rows({&a, &b});
    REQUIRE(c.shape() == std::vector<std::size_t>{3, 2});
    REQUIRE(c.get(4) == Approx(5.0));

    auto bad = DataArray::from<double>({1, 2, 3}, {1, 3});
    REQUIRE_THROWS_AS(DataArray::concatenate_rows({&a, &bad}), std::runtime_error);
}
