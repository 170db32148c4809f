#include "mesh/DataArray.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace meshwire::mesh
{

std::size_t dtype_size(DType t) noexcept
{
    return visit_dtype(t, [](auto v) { return sizeof(v); });
}

const char* dtype_name(DType t) noexcept
{
    switch (t)
    {
    case DType::Int8:
        return "int8";
    case DType::Int16:
        return "int16";
    case DType::Int32:
        return "int32";
    case DType::Int64:
        return "int64";
    case DType::UInt8:
        return "uint8";
    case DType::UInt16:
        return "uint16";
    case DType::UInt32:
        return "uint32";
    case DType::UInt64:
        return "uint64";
    case DType::Float32:
        return "float32";
    case DType::Float64:
        return "float64";
    }
    return "unknown";
}

bool dtype_is_integer(DType t) noexcept
{
    return t != DType::Float32 && t != DType::Float64;
}

std::size_t shape_size(const std::vector<std::size_t>& shape) noexcept
{
    if (shape.empty())
        return 0;
    std::size_t n = 1;
    for (auto s : shape)
        n *= s;
    return n;
}

DataArray::DataArray(DType dtype, std::vector<std::size_t> shape)
    : dtype_(dtype), shape_(std::move(shape)), bytes_(shape_size(shape_) * dtype_size(dtype))
{
}

std::size_t DataArray::size() const noexcept
{
    return shape_size(shape_);
}

std::size_t DataArray::cols() const noexcept
{
    std::size_t n = 1;
    for (std::size_t k = 1; k < shape_.size(); ++k)
        n *= shape_[k];
    return n;
}

void DataArray::check_dtype(DType want) const
{
    if (want != dtype_)
        throw std::runtime_error(std::string("DataArray: requested ") + dtype_name(want) +
                                 " view of " + dtype_name(dtype_) + " data");
}

double DataArray::get(std::size_t i) const
{
    return visit_dtype(dtype_,
                       [&](auto v)
                       {
                           using T = decltype(v);
                           T x;
                           std::memcpy(&x, bytes_.data() + i * sizeof(T), sizeof(T));
                           return static_cast<double>(x);
                       });
}

std::int64_t DataArray::get_int(std::size_t i) const
{
    return visit_dtype(dtype_,
                       [&](auto v)
                       {
                           using T = decltype(v);
                           T x;
                           std::memcpy(&x, bytes_.data() + i * sizeof(T), sizeof(T));
                           return static_cast<std::int64_t>(x);
                       });
}

void DataArray::set(std::size_t i, double v)
{
    visit_dtype(dtype_,
                [&](auto tag)
                {
                    using T = decltype(tag);
                    const T x = static_cast<T>(v);
                    std::memcpy(bytes_.data() + i * sizeof(T), &x, sizeof(T));
                });
}

template <class SrcT, class DstT>
static void cast_copy(DstT* __restrict d, const SrcT* __restrict s, std::size_t n)
{
    for (std::size_t i = 0; i < n; ++i)
        d[i] = static_cast<DstT>(s[i]);
}

DataArray DataArray::astype(DType t) const
{
    if (t == dtype_)
        return *this;
    DataArray out(t, shape_);
    const std::size_t n = size();
    visit_dtype(dtype_,
                [&](auto s)
                {
                    using SrcT = decltype(s);
                    visit_dtype(t,
                                [&](auto d)
                                {
                                    using DstT = decltype(d);
                                    cast_copy(out.as<DstT>(), as<SrcT>(), n);
                                });
                });
    return out;
}

void DataArray::reshape(std::vector<std::size_t> shape)
{
    if (shape_size(shape) != size())
    {
        DataArray probe;
        probe.shape_ = shape;
        throw std::runtime_error("DataArray: cannot reshape " + shape_string() + " to " +
                                 probe.shape_string());
    }
    shape_ = std::move(shape);
}

std::string DataArray::shape_string() const
{
    std::ostringstream os;
    os << "(";
    for (std::size_t k = 0; k < shape_.size(); ++k)
        os << (k ? ", " : "") << shape_[k];
    if (shape_.size() == 1)
        os << ",";
    os << ")";
    return os.str();
}

DataArray DataArray::concatenate_rows(const std::vector<const DataArray*>& parts)
{
    if (parts.empty())
        return {};
    const DataArray& first = *parts.front();
    std::vector<std::size_t> shape = first.shape_;
    std::size_t total_rows = 0;
    for (const DataArray* p : parts)
    {
        if (p->ndim() != first.ndim() ||
            !std::equal(p->shape_.begin() + 1, p->shape_.end(), first.shape_.begin() + 1))
            throw std::runtime_error("DataArray: cannot stack " + p->shape_string() + " onto " +
                                     first.shape_string());
        total_rows += p->rows();
    }
    shape[0] = total_rows;

    DataArray out(first.dtype_, shape);
    std::size_t offset = 0;
    for (const DataArray* p : parts)
    {
        const DataArray converted = p->astype(first.dtype_);
        std::memcpy(out.bytes_.data() + offset, converted.bytes_.data(), converted.nbytes());
        offset += converted.nbytes();
    }
    return out;
}

} // namespace meshwire::mesh
