#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libxml/tree.h>

/**
 * @file XmlTree.hpp
 * @brief Thin helpers over the libxml2 tree API used by the XDMF reader and writer.
 *
 * @details
 * Documents are owned by :cpp:type:`XmlDoc` (``xmlFreeDoc`` on destruction); nodes are borrowed
 * ``xmlNodePtr`` valid for the lifetime of their document. Names are compared by local name, so
 * ``xi:include`` matches ``"include"``.
 */

namespace meshwire::xdmf
{

struct XmlDocDeleter
{
    void operator()(xmlDoc* d) const noexcept { xmlFreeDoc(d); }
};
using XmlDoc = std::unique_ptr<xmlDoc, XmlDocDeleter>;

// Parses `path` (comments dropped); FormatError if it is not well-formed XML.
XmlDoc parse_xml_file(const std::string& path);

bool has_name(const xmlNode* node, std::string_view name) noexcept;

// Element children, optionally restricted to one local name.
std::vector<xmlNodePtr> element_children(xmlNodePtr node, std::string_view name = {});

std::optional<std::string> attr(const xmlNode* node, const char* name);
std::string text_of(const xmlNode* node);

xmlNodePtr add_child(xmlNodePtr parent, const char* name, xmlNsPtr ns = nullptr);
void set_attr(xmlNodePtr node, const char* name, const std::string& value);
void set_text(xmlNodePtr node, const std::string& text);

// Serializes the whole document; Error if the file cannot be written.
void save_xml(xmlDoc* doc, const std::string& path, bool pretty);

} // namespace meshwire::xdmf
