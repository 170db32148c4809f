#include "gmsh/WireIO.hpp"

#include <array>
#include <charconv>
#include <system_error>

namespace meshwire::gmsh
{

bool read_line(std::istream& is, std::string& line)
{
    if (!std::getline(is, line))
        return false;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

std::string trim(std::string_view s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

std::string next_line(std::istream& is, std::string_view what)
{
    std::string line;
    if (!read_line(is, line))
        throw FormatError("Unexpected end of file while reading " + std::string(what));
    return trim(line);
}

std::uint64_t read_count_line(std::istream& is, std::string_view what)
{
    const std::string line = next_line(is, what);
    std::uint64_t v = 0;
    const char* end = line.data() + line.size();
    auto res = std::from_chars(line.data(), end, v);
    if (line.empty() || res.ec != std::errc() || res.ptr != end)
        throw FormatError("Malformed " + std::string(what) + " '" + line + "'");
    return v;
}

void expect_section_end(std::istream& is, std::string_view section)
{
    const std::string want = "$End" + std::string(section);
    std::string line;
    while (read_line(is, line))
    {
        const std::string t = trim(line);
        if (t.empty())
            continue;
        if (t != want)
            throw FormatError("Expected " + want + ", found '" + t + "'");
        return;
    }
    throw FormatError("Missing " + want + " before end of file");
}

void skip_to_section_end(std::istream& is, std::string_view section)
{
    const std::string want = "$End" + std::string(section);
    std::string line;
    while (read_line(is, line))
    {
        if (trim(line) == want)
            return;
    }
    throw FormatError("Missing " + want + " before end of file");
}

std::uint64_t read_size(std::istream& is, bool ascii, int data_size, std::string_view what)
{
    if (ascii)
        return read_ascii<std::uint64_t>(is, what);
    if (data_size == 8)
        return read_binary<std::uint64_t>(is, what);
    if (data_size == 4)
        return read_binary<std::uint32_t>(is, what);
    throw FormatError("Unsupported data size " + std::to_string(data_size) +
                      " (expected 4 or 8)");
}

void write_size(std::ostream& os, std::uint64_t v, int data_size)
{
    if (data_size == 4)
        write_binary(os, static_cast<std::uint32_t>(v));
    else
        write_binary(os, v);
}

std::string format_double(double v)
{
    std::array<char, 32> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    return std::string(buf.data(), res.ptr);
}

} // namespace meshwire::gmsh
