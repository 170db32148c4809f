#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the Gmsh and XDMF codecs.
 *
 * @details
 * Every failure raised by a codec is fatal to the current read/write call and derives from
 * :cpp:class:`meshwire::Error`, so callers can catch the whole family at once.
 *
 * - ``FormatError``: structural violation in the input (markers, tags, attributes, sentinels).
 * - ``UnsupportedVersionError`` / ``UnsupportedTypeError`` / ``UnsupportedCellTypeError``:
 *   a well-formed value outside the supported tables.
 * - ``WriteError``: caller data violating an output constraint.
 */

namespace meshwire
{

class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class FormatError : public Error
{
  public:
    using Error::Error;
};

class UnsupportedVersionError : public Error
{
  public:
    using Error::Error;
};

class UnsupportedTypeError : public Error
{
  public:
    using Error::Error;
};

class UnsupportedCellTypeError : public Error
{
  public:
    using Error::Error;
};

class WriteError : public Error
{
  public:
    using Error::Error;
};

} // namespace meshwire
