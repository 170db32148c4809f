#include "xdmf/DataItem.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "xdmf/XdmfTypes.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace meshwire::xdmf
{

namespace fs = std::filesystem;
using mesh::DataArray;
using mesh::DType;
using DataFormat = WriterConfig::DataFormat;

/// \cond DOXYGEN_EXCLUDE

static hid_t h5_native(DType t)
{
    switch (t)
    {
    case DType::Int8:
        return H5T_NATIVE_INT8;
    case DType::Int16:
        return H5T_NATIVE_INT16;
    case DType::Int32:
        return H5T_NATIVE_INT32;
    case DType::Int64:
        return H5T_NATIVE_INT64;
    case DType::UInt8:
        return H5T_NATIVE_UINT8;
    case DType::UInt16:
        return H5T_NATIVE_UINT16;
    case DType::UInt32:
        return H5T_NATIVE_UINT32;
    case DType::UInt64:
        return H5T_NATIVE_UINT64;
    case DType::Float32:
        return H5T_NATIVE_FLOAT;
    case DType::Float64:
        return H5T_NATIVE_DOUBLE;
    }
    return H5T_NATIVE_DOUBLE;
}

// Closes the handles of one dataset lookup on every exit path.
struct H5Scope
{
    std::vector<hid_t> groups;
    hid_t dset = -1;
    hid_t space = -1;

    ~H5Scope()
    {
        if (space >= 0)
            H5Sclose(space);
        if (dset >= 0)
            H5Dclose(dset);
        for (auto it = groups.rbegin(); it != groups.rend(); ++it)
            H5Gclose(*it);
    }
};

static std::string trimmed(const std::string& s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

template <class T> static T parse_token(const std::string& tok)
{
    if constexpr (std::is_floating_point_v<T>)
    {
        char* end = nullptr;
        const double v = std::strtod(tok.c_str(), &end);
        if (end != tok.c_str() + tok.size())
            throw FormatError("Malformed number '" + tok + "' in inline DataItem");
        return static_cast<T>(v);
    }
    else
    {
        T v{};
        auto res = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        if (res.ec != std::errc() || res.ptr != tok.data() + tok.size())
            throw FormatError("Malformed integer '" + tok + "' in inline DataItem");
        return v;
    }
}

static std::string format_inline(const DataArray& data)
{
    std::string out = "\n";
    mesh::visit_dtype(data.dtype(), [&](auto tag) {
        using T = decltype(tag);
        const T* src = data.as<T>();
        char buf[64];
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            if constexpr (std::is_same_v<T, double>)
                std::snprintf(buf, sizeof(buf), "%.16e", src[i]);
            else if constexpr (std::is_same_v<T, float>)
                std::snprintf(buf, sizeof(buf), "%.7e", static_cast<double>(src[i]));
            else if constexpr (std::is_unsigned_v<T>)
                std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(src[i]));
            else
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(src[i]));
            out += buf;
            out += '\n';
        }
    });
    return out;
}

/// \endcond

WriterConfig::DataFormat parse_data_format(std::string_view s)
{
    if (s == "XML")
        return DataFormat::XML;
    if (s == "Binary")
        return DataFormat::Binary;
    if (s == "HDF")
        return DataFormat::HDF;
    throw WriteError("Unknown XDMF data format '" + std::string(s) +
                     "' (use 'XML', 'Binary', or 'HDF')");
}

const char* data_format_name(WriterConfig::DataFormat f) noexcept
{
    switch (f)
    {
    case DataFormat::XML:
        return "XML";
    case DataFormat::Binary:
        return "Binary";
    case DataFormat::HDF:
        return "HDF";
    }
    return "XML";
}

std::vector<std::size_t> parse_dimensions(const std::string& s)
{
    std::istringstream iss(s);
    std::vector<std::size_t> dims;
    for (std::string tok; iss >> tok;)
    {
        std::size_t v = 0;
        auto res = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        if (res.ec != std::errc() || res.ptr != tok.data() + tok.size())
            throw FormatError("Malformed Dimensions '" + s + "'");
        dims.push_back(v);
    }
    if (dims.empty())
        throw FormatError("Empty Dimensions attribute");
    return dims;
}

std::string format_dimensions(const std::vector<std::size_t>& dims)
{
    std::string out;
    for (std::size_t k = 0; k < dims.size(); ++k)
        out += (k ? " " : "") + std::to_string(dims[k]);
    return out;
}

DataItemRef parse_data_item(const xmlNode* node)
{
    if (!has_name(node, "DataItem"))
        throw FormatError("Expected a DataItem element");

    DataItemRef ref;
    const auto dims = attr(node, "Dimensions");
    if (!dims)
        throw FormatError("DataItem without Dimensions");
    ref.dimensions = parse_dimensions(*dims);

    // NumberType is the XDMF2 spelling; files in the wild use either
    const auto data_type = attr(node, "DataType");
    const auto number_type = attr(node, "NumberType");
    if (data_type && number_type)
        throw FormatError("DataItem has both DataType and NumberType");
    const std::string type = data_type ? *data_type : number_type ? *number_type : "Float";
    const std::string precision = attr(node, "Precision").value_or("4");
    ref.dtype = dtype_from_xdmf(type, precision);

    const std::string format = attr(node, "Format").value_or("XML");
    if (format == "XML")
        ref.format = DataFormat::XML;
    else if (format == "Binary")
        ref.format = DataFormat::Binary;
    else if (format == "HDF")
        ref.format = DataFormat::HDF;
    else
        throw FormatError("Unknown XDMF Format '" + format + "'");

    ref.location = text_of(node);
    if (ref.format != DataFormat::XML)
        ref.location = trimmed(ref.location);
    return ref;
}

// ---------------------------------------------------------------------------------------------

DataItemReader::DataItemReader(fs::path base_dir) : base_(std::move(base_dir)) {}

DataItemReader::~DataItemReader()
{
    close();
}

void DataItemReader::close()
{
    for (auto& [path, id] : stores_)
    {
        LOGD("xdmf: closing store %s\n", path.c_str());
        H5Fclose(id);
    }
    stores_.clear();
}

DataArray DataItemReader::read(const DataItemRef& ref)
{
    switch (ref.format)
    {
    case DataFormat::XML:
        return read_inline(ref);
    case DataFormat::Binary:
        return read_sidecar(ref);
    case DataFormat::HDF:
        return read_store(ref);
    }
    throw FormatError("Unknown XDMF Format");
}

DataArray DataItemReader::read_inline(const DataItemRef& ref) const
{
    DataArray out(ref.dtype, ref.dimensions);
    std::istringstream iss(ref.location);
    std::vector<std::string> tokens;
    for (std::string tok; iss >> tok;)
        tokens.push_back(std::move(tok));
    if (tokens.size() != out.size())
        throw FormatError("Inline DataItem holds " + std::to_string(tokens.size()) +
                          " values, Dimensions declare " + std::to_string(out.size()));

    mesh::visit_dtype(ref.dtype, [&](auto tag) {
        using T = decltype(tag);
        T* dst = out.as<T>();
        for (std::size_t i = 0; i < tokens.size(); ++i)
            dst[i] = parse_token<T>(tokens[i]);
    });
    return out;
}

DataArray DataItemReader::read_sidecar(const DataItemRef& ref) const
{
    fs::path p(ref.location);
    if (p.is_relative())
        p = base_ / p;
    std::ifstream in(p, std::ios::binary);
    if (!in)
        throw Error("Cannot open binary DataItem file '" + p.string() + "'");

    DataArray out(ref.dtype, ref.dimensions);
    if (!in.read(static_cast<char*>(out.data()), static_cast<std::streamsize>(out.nbytes())))
        throw FormatError("Binary DataItem file '" + p.string() + "' is shorter than " +
                          std::to_string(out.nbytes()) + " bytes");
    return out;
}

hid_t DataItemReader::store(const fs::path& path)
{
    const std::string key = fs::absolute(path).lexically_normal().string();
    auto it = stores_.find(key);
    if (it != stores_.end())
        return it->second;

    hid_t f = -1;
    H5E_BEGIN_TRY
    {
        f = H5Fopen(key.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    }
    H5E_END_TRY;
    if (f < 0)
        throw Error("Cannot open HDF5 store '" + key + "'");
    LOGD("xdmf: opened store %s\n", key.c_str());
    stores_.emplace(key, f);
    return f;
}

DataArray DataItemReader::read_store(const DataItemRef& ref)
{
    const auto colon = ref.location.rfind(':');
    if (colon == std::string::npos)
        throw FormatError("HDF DataItem '" + ref.location + "' is not of the form file:/path");
    const std::string file = ref.location.substr(0, colon);
    const std::string h5path = ref.location.substr(colon + 1);
    if (h5path.empty() || h5path[0] != '/')
        throw FormatError("HDF dataset path '" + h5path + "' must start with '/'");

    std::vector<std::string> segments;
    std::istringstream iss(h5path.substr(1));
    for (std::string seg; std::getline(iss, seg, '/');)
        if (!seg.empty())
            segments.push_back(seg);
    if (segments.empty())
        throw FormatError("HDF dataset path '" + h5path + "' names no dataset");

    fs::path fp(file);
    if (fp.is_relative())
        fp = base_ / fp;
    hid_t cur = store(fp);

    H5Scope scope;
    for (std::size_t k = 0; k + 1 < segments.size(); ++k)
    {
        hid_t g = -1;
        H5E_BEGIN_TRY
        {
            g = H5Gopen2(cur, segments[k].c_str(), H5P_DEFAULT);
        }
        H5E_END_TRY;
        if (g < 0)
            throw FormatError("HDF group '" + segments[k] + "' not found in '" + h5path + "'");
        scope.groups.push_back(g);
        cur = g;
    }
    H5E_BEGIN_TRY
    {
        scope.dset = H5Dopen2(cur, segments.back().c_str(), H5P_DEFAULT);
    }
    H5E_END_TRY;
    if (scope.dset < 0)
        throw FormatError("HDF dataset '" + h5path + "' not found");

    scope.space = H5Dget_space(scope.dset);
    const auto npoints = H5Sget_simple_extent_npoints(scope.space);
    DataArray out(ref.dtype, ref.dimensions);
    if (npoints < 0 || static_cast<std::size_t>(npoints) != out.size())
        throw FormatError("HDF dataset '" + h5path + "' holds " + std::to_string(npoints) +
                          " values, Dimensions declare " + std::to_string(out.size()));
    if (H5Dread(scope.dset, h5_native(ref.dtype), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) < 0)
        throw FormatError("Failed to read HDF dataset '" + h5path + "'");
    return out;
}

// ---------------------------------------------------------------------------------------------

DataItemWriter::DataItemWriter(const fs::path& xdmf_path, DataFormat format)
    : format_(format), dir_(xdmf_path.parent_path()), stem_(xdmf_path.stem().string())
{
    if (format_ == DataFormat::HDF)
    {
        h5_path_ = dir_ / (stem_ + ".h5");
        file_ = H5Fcreate(h5_path_.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (file_ < 0)
            throw Error("Cannot create HDF5 store '" + h5_path_.string() + "'");
    }
}

DataItemWriter::~DataItemWriter()
{
    close();
}

void DataItemWriter::close()
{
    if (file_ >= 0)
    {
        H5Fclose(file_);
        file_ = -1;
    }
}

xmlNodePtr DataItemWriter::write(xmlNodePtr parent, const DataArray& data)
{
    const auto [type, precision] = dtype_to_xdmf(data.dtype());
    xmlNodePtr node = add_child(parent, "DataItem");
    set_attr(node, "DataType", type);
    set_attr(node, "Dimensions", format_dimensions(data.shape()));
    set_attr(node, "Format", data_format_name(format_));
    set_attr(node, "Precision", precision);

    switch (format_)
    {
    case DataFormat::XML:
        set_text(node, format_inline(data));
        break;
    case DataFormat::Binary:
        set_text(node, write_sidecar(data));
        break;
    case DataFormat::HDF:
        set_text(node, write_store(data));
        break;
    }
    return node;
}

std::string DataItemWriter::write_sidecar(const DataArray& data)
{
    const std::string name = stem_ + std::to_string(counter_++) + ".bin";
    const fs::path p = dir_ / name;
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(static_cast<const char*>(data.data()), static_cast<std::streamsize>(data.nbytes()));
    if (!out)
        throw WriteError("Cannot write binary DataItem file '" + p.string() + "'");
    return name;
}

std::string DataItemWriter::write_store(const DataArray& data)
{
    if (file_ < 0)
        throw WriteError("HDF5 store is closed");
    const std::string name = "data" + std::to_string(counter_++);

    std::vector<hsize_t> dims(data.shape().begin(), data.shape().end());
    const hid_t space = H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr);
    const hid_t type = h5_native(data.dtype());
    const hid_t dset =
        H5Dcreate2(file_, name.c_str(), type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    herr_t st = -1;
    if (dset >= 0)
    {
        st = H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
        H5Dclose(dset);
    }
    H5Sclose(space);
    if (st < 0)
        throw WriteError("Failed to write HDF5 dataset '" + name + "'");
    return h5_path_.filename().string() + ":/" + name;
}

} // namespace meshwire::xdmf
