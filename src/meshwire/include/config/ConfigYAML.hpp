#pragma once
#include "common/Log.hpp"
#include "xdmf/WriterConfig.hpp"
#include <cctype>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML -> ConvertConfig loader and schema for the converter app.
 *
 * @details
 * @rst
 * The **YAML configuration** drives ``meshconv``. This file defines:
 *
 * - :cpp:struct:`ConvertConfig`: the strongly-typed config object (input, output, log)
 * - :cpp:func:`load_config_from_yaml`: loader that parses a YAML file into :cpp:struct:`ConvertConfig`
 *
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    input:
 *      path: in.msh
 *      format: gmsh          # gmsh | xdmf
 *      frame: 0              # XDMF input: time step whose data is carried over
 *
 *    output:
 *      path: out.xdmf
 *      format: xdmf          # gmsh | xdmf
 *      gmsh:
 *        version: "4.1"      # 2 | 2.2 | 4 | 4.0 | 4.1
 *        binary: true
 *      xdmf:
 *        data_format: HDF    # XML | Binary | HDF
 *        pretty: true
 *
 *    log:
 *      level: info           # quiet | error | warn | info | debug
 *
 * **Semantics**
 *
 * - An unrecognised ``format`` falls back to ``gmsh``.
 * - ``data_format`` is case-sensitive and must be one of the three XDMF names; anything else is a
 *   :cpp:class:`meshwire::WriteError`.
 * - ``log.level`` is applied through :cpp:func:`meshwire::logx::init`; without it the
 *   ``MESHWIRE_LOG`` environment variable decides.
 * @endrst
 */

struct ConvertConfig
{
    enum class Format
    {
        Gmsh,
        Xdmf
    };

    struct Input
    {
        std::string path;
        Format format = Format::Gmsh;
        int frame = 0;
    } input;

    struct Output
    {
        std::string path;
        Format format = Format::Gmsh;

        struct Gmsh
        {
            std::string version = "4.1";
            bool binary = true;
        } gmsh;

        meshwire::xdmf::WriterConfig xdmf;
    } output;

    meshwire::logx::Config log;
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}
static inline ConvertConfig::Format parse_format(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "xdmf" || v == "xmf")
        return ConvertConfig::Format::Xdmf;
    return ConvertConfig::Format::Gmsh;
}

inline ConvertConfig load_config_from_yaml(const std::string& path)
{
    ConvertConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto I = root["input"])
    {
        if (auto n = I["path"])
            cfg.input.path = n.as<std::string>();
        if (auto n = I["format"])
            cfg.input.format = parse_format(n.as<std::string>());
        if (auto n = I["frame"])
            cfg.input.frame = n.as<int>();
    }

    if (auto O = root["output"])
    {
        if (auto n = O["path"])
            cfg.output.path = n.as<std::string>();
        if (auto n = O["format"])
            cfg.output.format = parse_format(n.as<std::string>());
        if (auto G = O["gmsh"])
        {
            if (auto n = G["version"])
                cfg.output.gmsh.version = n.as<std::string>();
            if (auto n = G["binary"])
                cfg.output.gmsh.binary = n.as<bool>();
        }
        if (auto X = O["xdmf"])
        {
            if (auto n = X["data_format"])
                cfg.output.xdmf.data_format =
                    meshwire::xdmf::parse_data_format(n.as<std::string>());
            if (auto n = X["pretty"])
                cfg.output.xdmf.pretty = n.as<bool>();
        }
    }

    if (auto L = root["log"])
    {
        if (auto n = L["level"])
            cfg.log.level = meshwire::logx::level_from_string(n.as<std::string>(),
                                                              meshwire::logx::Level::Warn);
    }

    return cfg;
}
