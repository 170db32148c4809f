#pragma once
#include "common/Errors.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

/**
 * @file WireIO.hpp
 * @brief Line/token/record primitives for the interleaved ASCII+binary MSH stream.
 *
 * @details
 * MSH files mix ASCII section markers with either ASCII token streams or raw host-order binary
 * records. All helpers read from one ``std::istream`` opened in binary mode; ASCII numbers are
 * whitespace-separated tokens regardless of line breaks. Short reads raise
 * :cpp:class:`meshwire::FormatError` naming ``what`` was being read.
 */

namespace meshwire::gmsh
{

// Reads one line without its terminator (and without a trailing '\r'). False at EOF.
bool read_line(std::istream& is, std::string& line);
std::string trim(std::string_view s);

// Next line, trimmed; FormatError at EOF.
std::string next_line(std::istream& is, std::string_view what);

// Next line as a single non-negative integer; FormatError otherwise.
std::uint64_t read_count_line(std::istream& is, std::string_view what);

// Next non-blank line must be $End<section>.
void expect_section_end(std::istream& is, std::string_view section);
// Ignores everything up to and including $End<section>.
void skip_to_section_end(std::istream& is, std::string_view section);

template <class T> T read_ascii(std::istream& is, std::string_view what)
{
    T v{};
    if (!(is >> v))
        throw FormatError("Unexpected end of data while reading " + std::string(what));
    return v;
}

template <class T> void read_binary(std::istream& is, T* dst, std::size_t n, std::string_view what)
{
    if (n == 0)
        return;
    if (!is.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n * sizeof(T))))
        throw FormatError("Truncated binary block while reading " + std::string(what));
}

template <class T> T read_binary(std::istream& is, std::string_view what)
{
    T v{};
    read_binary(is, &v, 1, what);
    return v;
}

template <class T> T read_value(std::istream& is, bool ascii, std::string_view what)
{
    return ascii ? read_ascii<T>(is, what) : read_binary<T>(is, what);
}

// size_t-typed fields use the word size declared in the header when binary.
std::uint64_t read_size(std::istream& is, bool ascii, int data_size, std::string_view what);

template <class T> void write_binary(std::ostream& os, const T* src, std::size_t n)
{
    os.write(reinterpret_cast<const char*>(src), static_cast<std::streamsize>(n * sizeof(T)));
}

template <class T> void write_binary(std::ostream& os, T v)
{
    write_binary(os, &v, 1);
}

void write_size(std::ostream& os, std::uint64_t v, int data_size);

// Shortest text that reads back to the same double.
std::string format_double(double v);

} // namespace meshwire::gmsh
