#pragma once
#include <string>
#include <string_view>

/**
 * @file WriterConfig.hpp
 * @brief Options for :cpp:class:`TimeSeriesWriter` (heavy-data encoding, XML layout).
 *
 * @details
 * ``data_format`` selects where array payloads go:
 *
 * - ``XML``: inline text inside each ``DataItem``.
 * - ``Binary``: one raw ``<stem><n>.bin`` sidecar per array next to the XDMF file.
 * - ``HDF``: datasets ``data<n>`` in ``<stem>.h5`` next to the XDMF file.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   WriterConfig cfg;
 *   cfg.data_format = WriterConfig::DataFormat::Binary;
 *   cfg.pretty      = false;
 *   TimeSeriesWriter w("out/series.xdmf", cfg);
 * @endrst
 */

namespace meshwire::xdmf
{

struct WriterConfig
{
    enum class DataFormat
    {
        XML,
        Binary,
        HDF
    };

    DataFormat data_format = DataFormat::HDF;
    bool pretty = true; // indent the XML index
};

// "XML" | "Binary" | "HDF"; anything else is a WriteError.
WriterConfig::DataFormat parse_data_format(std::string_view s);
const char* data_format_name(WriterConfig::DataFormat f) noexcept;

} // namespace meshwire::xdmf
