#include "xdmf/XmlTree.hpp"
#include "common/Errors.hpp"

#include <libxml/parser.h>
#include <libxml/xmlsave.h>

namespace meshwire::xdmf
{

namespace
{
const xmlChar* X(const char* s)
{
    return reinterpret_cast<const xmlChar*>(s);
}
} // namespace

XmlDoc parse_xml_file(const std::string& path)
{
    xmlDoc* doc = xmlReadFile(path.c_str(), nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_HUGE);
    if (!doc)
        throw FormatError("Cannot parse XML file '" + path + "'");
    return XmlDoc(doc);
}

bool has_name(const xmlNode* node, std::string_view name) noexcept
{
    return node && node->type == XML_ELEMENT_NODE &&
           name == reinterpret_cast<const char*>(node->name);
}

std::vector<xmlNodePtr> element_children(xmlNodePtr node, std::string_view name)
{
    std::vector<xmlNodePtr> out;
    for (xmlNodePtr c = node ? node->children : nullptr; c; c = c->next)
    {
        if (c->type != XML_ELEMENT_NODE)
            continue;
        if (name.empty() || has_name(c, name))
            out.push_back(c);
    }
    return out;
}

std::optional<std::string> attr(const xmlNode* node, const char* name)
{
    xmlChar* v = xmlGetProp(node, X(name));
    if (!v)
        return std::nullopt;
    std::string s(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return s;
}

std::string text_of(const xmlNode* node)
{
    xmlChar* v = xmlNodeGetContent(node);
    if (!v)
        return {};
    std::string s(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return s;
}

xmlNodePtr add_child(xmlNodePtr parent, const char* name, xmlNsPtr ns)
{
    return xmlNewChild(parent, ns, X(name), nullptr);
}

void set_attr(xmlNodePtr node, const char* name, const std::string& value)
{
    xmlSetProp(node, X(name), X(value.c_str()));
}

void set_text(xmlNodePtr node, const std::string& text)
{
    xmlNodeAddContentLen(node, X(text.c_str()), static_cast<int>(text.size()));
}

void save_xml(xmlDoc* doc, const std::string& path, bool pretty)
{
    if (xmlSaveFormatFileEnc(path.c_str(), doc, "UTF-8", pretty ? 1 : 0) < 0)
        throw Error("Cannot write XML file '" + path + "'");
}

} // namespace meshwire::xdmf
