#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file DataArray.hpp
 * @brief Typed, shaped, contiguous numeric buffer used for every mesh payload.
 *
 * @details
 * A :cpp:class:`DataArray` owns row-major bytes plus a runtime element type (:cpp:enum:`DType`)
 * and a shape. Points, cell connectivity, point/cell data and field data all travel through the
 * codecs as ``DataArray`` so that the on-wire type survives a read/write cycle unchanged.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto pts = DataArray::from<double>({0,0,0, 1,0,0, 0,1,0}, {3, 3});
 *   pts.get(4);                      // 0.0, converting read
 *   auto f = pts.astype(DType::Float32);
 *   for (std::size_t i = 0; i < f.rows(); ++i) { ... f.as<float>()[i * f.cols()] ... }
 * @endrst
 */

namespace meshwire::mesh
{

enum class DType
{
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64
};

std::size_t dtype_size(DType t) noexcept;
const char* dtype_name(DType t) noexcept;
bool dtype_is_integer(DType t) noexcept;

template <class T> constexpr DType dtype_of()
{
    if constexpr (std::is_same_v<T, std::int8_t>)
        return DType::Int8;
    else if constexpr (std::is_same_v<T, std::int16_t>)
        return DType::Int16;
    else if constexpr (std::is_same_v<T, std::int32_t>)
        return DType::Int32;
    else if constexpr (std::is_same_v<T, std::int64_t>)
        return DType::Int64;
    else if constexpr (std::is_same_v<T, std::uint8_t>)
        return DType::UInt8;
    else if constexpr (std::is_same_v<T, std::uint16_t>)
        return DType::UInt16;
    else if constexpr (std::is_same_v<T, std::uint32_t>)
        return DType::UInt32;
    else if constexpr (std::is_same_v<T, std::uint64_t>)
        return DType::UInt64;
    else if constexpr (std::is_same_v<T, float>)
        return DType::Float32;
    else
    {
        static_assert(std::is_same_v<T, double>, "unsupported element type");
        return DType::Float64;
    }
}

// Calls f(T{}) with the C++ type behind a DType.
template <class F> decltype(auto) visit_dtype(DType t, F&& f)
{
    switch (t)
    {
    case DType::Int8:
        return f(std::int8_t{});
    case DType::Int16:
        return f(std::int16_t{});
    case DType::Int32:
        return f(std::int32_t{});
    case DType::Int64:
        return f(std::int64_t{});
    case DType::UInt8:
        return f(std::uint8_t{});
    case DType::UInt16:
        return f(std::uint16_t{});
    case DType::UInt32:
        return f(std::uint32_t{});
    case DType::UInt64:
        return f(std::uint64_t{});
    case DType::Float32:
        return f(float{});
    case DType::Float64:
    default:
        return f(double{});
    }
}

class DataArray
{
  public:
    DataArray() = default;
    DataArray(DType dtype, std::vector<std::size_t> shape);

    template <class T>
    static DataArray from(const std::vector<T>& values, std::vector<std::size_t> shape)
    {
        DataArray a(dtype_of<T>(), std::move(shape));
        if (a.size() != values.size())
            throw std::runtime_error("DataArray::from: " + std::to_string(values.size()) +
                                     " values do not fill shape " + a.shape_string());
        if (!values.empty())
            std::memcpy(a.data(), values.data(), values.size() * sizeof(T));
        return a;
    }

    DType dtype() const noexcept { return dtype_; }
    const std::vector<std::size_t>& shape() const noexcept { return shape_; }
    std::size_t ndim() const noexcept { return shape_.size(); }
    std::size_t size() const noexcept;
    std::size_t rows() const noexcept { return shape_.empty() ? 0 : shape_[0]; }
    std::size_t cols() const noexcept;
    std::size_t nbytes() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    void* data() noexcept { return bytes_.data(); }
    const void* data() const noexcept { return bytes_.data(); }

    template <class T> T* as()
    {
        check_dtype(dtype_of<T>());
        return reinterpret_cast<T*>(bytes_.data());
    }
    template <class T> const T* as() const
    {
        check_dtype(dtype_of<T>());
        return reinterpret_cast<const T*>(bytes_.data());
    }

    // Converting element access on the flat (row-major) index
    double get(std::size_t i) const;
    std::int64_t get_int(std::size_t i) const;
    void set(std::size_t i, double v);

    DataArray astype(DType t) const;
    void reshape(std::vector<std::size_t> shape);
    std::string shape_string() const;

    // Stacks arrays along axis 0; trailing extents must agree. Result takes the first dtype.
    static DataArray concatenate_rows(const std::vector<const DataArray*>& parts);

  private:
    void check_dtype(DType want) const;

    DType dtype_ = DType::Float64;
    std::vector<std::size_t> shape_;
    std::vector<unsigned char> bytes_;
};

std::size_t shape_size(const std::vector<std::size_t>& shape) noexcept;

} // namespace meshwire::mesh
