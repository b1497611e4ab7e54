
//   Copyright 2016 otris software AG
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
//
//   This project is hosted at https://github.com/otris

#pragma once

#include <algorithm>
#include <ctype.h>
#include <functional>
#include <iterator>
#include <memory>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <rapidxml/rapidxml.hpp>

#include "errors.hpp"
#include "eas_fwd.hpp"

namespace eas
{
namespace internal
{
    // Poor man's std::optional replacement
    template <typename T> class optional final
    {
        static_assert(std::is_copy_constructible<T>::value,
                      "T needs to be copy constructible");

    public:
        typedef T value_type;

        optional() : value_set_(false), val_() {}

        template <typename U,
                  typename = typename std::enable_if<!std::is_same<
                      typename std::decay<U>::type, optional>::value>::type>
        optional(U&& val) : value_set_(true), val_(std::forward<U>(val))
        {
        }

        optional& operator=(T&& value)
        {
            val_ = std::move(value);
            value_set_ = true;
            return *this;
        }

        bool has_value() const EAS_NOEXCEPT { return value_set_; }

        explicit operator bool() const EAS_NOEXCEPT { return value_set_; }

        // Note we throw eas::exception instead of std::bad_optional_access
        const T& value() const
        {
            if (!has_value())
            {
                throw exception("Bad eas::internal::optional access");
            }
            return val_;
        }

        T value_or(T default_value) const
        {
            return has_value() ? val_ : default_value;
        }

    private:
        bool value_set_;
        value_type val_;
    };

    template <typename T, typename U>
    inline bool operator==(const optional<T>& opt, const U& value)
    {
        return opt.has_value() ? opt.value() == value : false;
    }

    // Escapes the five XML metacharacters. Every free-text value that is
    // interpolated into a request body goes through here.
    inline std::string escape(const std::string& str)
    {
        std::string res;
        res.reserve(str.size() + (str.size() / 8));
        for (auto c : str)
        {
            switch (c)
            {
            case '&':
                res += "&amp;";
                break;
            case '<':
                res += "&lt;";
                break;
            case '>':
                res += "&gt;";
                break;
            case '"':
                res += "&quot;";
                break;
            case '\'':
                res += "&apos;";
                break;
            default:
                res += c;
            }
        }
        return res;
    }

    inline void append_utf8(std::string& out, unsigned long code_point)
    {
        if (code_point < 0x80)
        {
            out += static_cast<char>(code_point);
        }
        else if (code_point < 0x800)
        {
            out += static_cast<char>(0xC0 | (code_point >> 6));
            out += static_cast<char>(0x80 | (code_point & 0x3F));
        }
        else if (code_point < 0x10000)
        {
            out += static_cast<char>(0xE0 | (code_point >> 12));
            out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code_point & 0x3F));
        }
        else if (code_point < 0x110000)
        {
            out += static_cast<char>(0xF0 | (code_point >> 18));
            out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code_point & 0x3F));
        }
    }

    // Reverses escape(); also resolves numeric character references and
    // strips CDATA sections. Unknown entities are kept verbatim.
    inline std::string unescape(const std::string& str)
    {
        std::string res;
        res.reserve(str.size());
        std::string::size_type i = 0;
        while (i < str.size())
        {
            if (str.compare(i, 9, "<![CDATA[") == 0)
            {
                const auto end = str.find("]]>", i + 9);
                if (end == std::string::npos)
                {
                    res.append(str, i + 9, std::string::npos);
                    break;
                }
                res.append(str, i + 9, end - i - 9);
                i = end + 3;
                continue;
            }

            if (str[i] != '&')
            {
                res += str[i++];
                continue;
            }

            const auto semicolon = str.find(';', i);
            if (semicolon == std::string::npos || semicolon - i > 10)
            {
                res += str[i++];
                continue;
            }

            const auto entity = str.substr(i + 1, semicolon - i - 1);
            if (entity == "amp")
            {
                res += '&';
            }
            else if (entity == "lt")
            {
                res += '<';
            }
            else if (entity == "gt")
            {
                res += '>';
            }
            else if (entity == "quot")
            {
                res += '"';
            }
            else if (entity == "apos")
            {
                res += '\'';
            }
            else if (entity.size() > 1 && entity[0] == '#')
            {
                const bool hex = entity[1] == 'x' || entity[1] == 'X';
                const auto digits = entity.substr(hex ? 2 : 1);
                char* end = nullptr;
                const auto code_point =
                    strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (digits.empty() || end == nullptr || *end != '\0')
                {
                    res.append(str, i, semicolon - i + 1);
                }
                else
                {
                    append_utf8(res, code_point);
                }
            }
            else
            {
                res.append(str, i, semicolon - i + 1);
            }
            i = semicolon + 1;
        }
        return res;
    }

    inline std::string trim(const std::string& str)
    {
        static const char* const whitespace = " \t\r\n";
        const auto first = str.find_first_not_of(whitespace);
        if (first == std::string::npos)
        {
            return std::string();
        }
        const auto last = str.find_last_not_of(whitespace);
        return str.substr(first, last - first + 1);
    }

    // Compares a qualified element name against a wanted name. A wanted
    // name without prefix matches any prefix.
    inline bool name_matches(const std::string& qname,
                             const std::string& wanted) EAS_NOEXCEPT
    {
        if (wanted.find(':') != std::string::npos)
        {
            return qname == wanted;
        }
        const auto colon = qname.rfind(':');
        if (colon == std::string::npos)
        {
            return qname == wanted;
        }
        return qname.compare(colon + 1, std::string::npos, wanted) == 0;
    }

    // Location of one element inside a text buffer
    struct element_span
    {
        std::string::size_type start;
        std::string::size_type content_begin;
        std::string::size_type content_end;
        std::string::size_type end;
    };

    // Tolerant tag scanner: finds the next element named 'name' (any
    // namespace prefix) at or after 'from'. Handles self-closing elements
    // and nested elements of the same name. Returns false if there is no
    // such element or the document is truncated.
    inline bool find_element_span(const std::string& xml,
                                  const std::string& name,
                                  std::string::size_type from,
                                  element_span& span)
    {
        static const char* const name_terminators = " \t\r\n/>";
        const auto npos = std::string::npos;

        auto i = from;
        while ((i = xml.find('<', i)) != npos)
        {
            const auto name_begin = i + 1;
            if (name_begin >= xml.size())
            {
                return false;
            }
            const char c = xml[name_begin];
            if (c == '/' || c == '?' || c == '!')
            {
                i = name_begin;
                continue;
            }
            const auto name_end =
                xml.find_first_of(name_terminators, name_begin);
            if (name_end == npos)
            {
                return false;
            }
            const auto qname = xml.substr(name_begin, name_end - name_begin);
            if (!name_matches(qname, name))
            {
                i = name_end;
                continue;
            }
            const auto tag_close = xml.find('>', name_end);
            if (tag_close == npos)
            {
                return false;
            }

            span.start = i;
            if (xml[tag_close - 1] == '/')
            {
                span.content_begin = span.content_end = tag_close;
                span.end = tag_close + 1;
                return true;
            }

            span.content_begin = tag_close + 1;
            auto depth = 1;
            auto j = span.content_begin;
            while (depth > 0)
            {
                j = xml.find('<', j);
                if (j == npos || j + 1 >= xml.size())
                {
                    return false;
                }
                if (xml[j + 1] == '/')
                {
                    const auto close_end = xml.find('>', j);
                    if (close_end == npos)
                    {
                        return false;
                    }
                    const auto close_name =
                        trim(xml.substr(j + 2, close_end - j - 2));
                    if (close_name == qname && --depth == 0)
                    {
                        span.content_end = j;
                        span.end = close_end + 1;
                        return true;
                    }
                    j = close_end + 1;
                    continue;
                }

                const auto inner_end =
                    xml.find_first_of(name_terminators, j + 1);
                if (inner_end == npos)
                {
                    return false;
                }
                if (xml.compare(j + 1, inner_end - j - 1, qname) == 0)
                {
                    const auto inner_close = xml.find('>', inner_end);
                    if (inner_close == npos)
                    {
                        return false;
                    }
                    if (xml[inner_close - 1] != '/')
                    {
                        ++depth;
                    }
                    j = inner_close + 1;
                }
                else
                {
                    j = inner_end;
                }
            }
        }
        return false;
    }

    // Returns the raw inner markup of the first element named 'tag'
    inline optional<std::string> extract_block(const std::string& xml,
                                               const std::string& tag)
    {
        element_span span;
        if (!find_element_span(xml, tag, 0, span))
        {
            return optional<std::string>();
        }
        return xml.substr(span.content_begin,
                          span.content_end - span.content_begin);
    }

    // Returns the raw inner markup of every element named 'tag', in
    // document order. Nested occurrences are part of their parent's block.
    inline std::vector<std::string> extract_all_blocks(const std::string& xml,
                                                       const std::string& tag)
    {
        std::vector<std::string> blocks;
        element_span span;
        std::string::size_type from = 0;
        while (find_element_span(xml, tag, from, span))
        {
            blocks.emplace_back(xml.substr(
                span.content_begin, span.content_end - span.content_begin));
            from = span.end;
        }
        return blocks;
    }

    //! \brief Returns the text content of the first element named 'tag'.
    //!
    //! Tolerates namespace prefixes; entities are resolved. Absence of the
    //! element is not an error.
    inline optional<std::string> extract(const std::string& xml,
                                         const std::string& tag)
    {
        auto block = extract_block(xml, tag);
        if (!block.has_value())
        {
            return block;
        }
        return unescape(block.value());
    }

    inline std::vector<std::string> extract_all(const std::string& xml,
                                                const std::string& tag)
    {
        auto blocks = extract_all_blocks(xml, tag);
        std::transform(begin(blocks), end(blocks), begin(blocks),
                       [](const std::string& b) { return unescape(b); });
        return blocks;
    }

    // Returns the first element's text as integer, if it is one
    inline optional<int> extract_int(const std::string& xml,
                                     const std::string& tag)
    {
        const auto text = extract(xml, tag);
        if (!text.has_value())
        {
            return optional<int>();
        }
        const auto trimmed = trim(text.value());
        if (trimmed.empty())
        {
            return optional<int>();
        }
        char* end = nullptr;
        const auto val = strtol(trimmed.c_str(), &end, 10);
        if (end == nullptr || *end != '\0')
        {
            return optional<int>();
        }
        return static_cast<int>(val);
    }

    // Returns the value of attribute 'attribute' on the first element named
    // 'tag'
    inline optional<std::string> extract_attribute(const std::string& xml,
                                                   const std::string& tag,
                                                   const std::string& attribute)
    {
        element_span span;
        if (!find_element_span(xml, tag, 0, span))
        {
            return optional<std::string>();
        }
        const auto tag_end = xml.find('>', span.start);
        const auto start_tag = xml.substr(span.start, tag_end - span.start);

        std::string::size_type pos = 0;
        while ((pos = start_tag.find('=', pos)) != std::string::npos)
        {
            auto name_end = pos;
            while (name_end > 0 && isspace(static_cast<unsigned char>(
                                       start_tag[name_end - 1])))
            {
                --name_end;
            }
            auto name_begin = name_end;
            while (name_begin > 0 && !isspace(static_cast<unsigned char>(
                                         start_tag[name_begin - 1])))
            {
                --name_begin;
            }
            const auto name =
                start_tag.substr(name_begin, name_end - name_begin);

            auto quote = start_tag.find_first_of("\"'", pos);
            if (quote == std::string::npos)
            {
                break;
            }
            const auto value_end = start_tag.find(start_tag[quote], quote + 1);
            if (value_end == std::string::npos)
            {
                break;
            }
            if (name_matches(name, attribute))
            {
                return unescape(
                    start_tag.substr(quote + 1, value_end - quote - 1));
            }
            pos = value_end + 1;
        }
        return optional<std::string>();
    }

    // Returns xml with every element named 'tag' (including content) cut out
    inline std::string remove_blocks(const std::string& xml,
                                     const std::string& tag)
    {
        std::string res;
        element_span span;
        std::string::size_type from = 0;
        while (find_element_span(xml, tag, from, span))
        {
            res.append(xml, from, span.start - from);
            from = span.end;
        }
        res.append(xml, from, std::string::npos);
        return res;
    }

    // Owns a mutable copy of a document and its RapidXml DOM. The parsed
    // nodes point into the buffer, so both share one lifetime.
    //
    // Note: RapidXml is used in destructive mode (the parser modifies the
    // source text during parsing), hence the private copy.
    class xml_document final
    {
    public:
        explicit xml_document(const std::string& text)
            : buffer_(text.begin(), text.end())
        {
            if (buffer_.empty())
            {
                throw xml_parse_error("Cannot parse empty document");
            }
            buffer_.push_back('\0');
            try
            {
                static const int flags = 0;
                doc_.parse<flags>(&buffer_[0]);
            }
            catch (rapidxml::parse_error& exc)
            {
                throw xml_parse_error(error_message_from(exc, text));
            }
        }

        xml_document(const xml_document&) = delete;
        xml_document& operator=(const xml_document&) = delete;

        rapidxml::xml_node<>* root() const { return doc_.first_node(); }

        const rapidxml::xml_document<>& document() const EAS_NOEXCEPT
        {
            return doc_;
        }

    private:
        static std::string error_message_from(const rapidxml::parse_error& exc,
                                              const std::string& text)
        {
            std::string msg = exc.what();
            msg += " (document size " + std::to_string(text.size()) + ")";
            return msg;
        }

        std::vector<char> buffer_;
        rapidxml::xml_document<> doc_;
    };

    inline std::string node_name(const rapidxml::xml_node<>& node)
    {
        return std::string(node.name(), node.name_size());
    }

    inline std::string local_name(const rapidxml::xml_node<>& node)
    {
        const auto qname = node_name(node);
        const auto colon = qname.rfind(':');
        return colon == std::string::npos ? qname : qname.substr(colon + 1);
    }

    inline std::string prefix(const rapidxml::xml_node<>& node)
    {
        const auto qname = node_name(node);
        const auto colon = qname.find(':');
        return colon == std::string::npos ? std::string()
                                          : qname.substr(0, colon);
    }

    inline std::string node_value(const rapidxml::xml_node<>& node)
    {
        return std::string(node.value(), node.value_size());
    }

    // Traverse elements, depth first, beginning with given node.
    //
    // Applies given function to every element during traversal, stopping as
    // soon as that function returns true.
    template <typename Function>
    inline bool traverse_elements(const rapidxml::xml_node<>& node,
                                  Function func)
    {
        for (auto child = node.first_node(); child != nullptr;
             child = child->next_sibling())
        {
            if (child->type() != rapidxml::node_element)
            {
                continue;
            }
            if (func(*child))
            {
                return true;
            }
            if (traverse_elements(*child, func))
            {
                return true;
            }
        }
        return false;
    }

    // Select first element by local name (ignoring namespace prefix),
    // nullptr if there is no such element
    inline rapidxml::xml_node<>*
    get_element_by_local_name(const rapidxml::xml_node<>& node,
                              const std::string& name)
    {
        rapidxml::xml_node<>* element = nullptr;
        traverse_elements(node, [&](rapidxml::xml_node<>& elem) -> bool {
            if (local_name(elem) == name)
            {
                element = std::addressof(elem);
                return true;
            }
            return false;
        });
        return element;
    }

    inline std::vector<rapidxml::xml_node<>*>
    get_elements_by_local_name(const rapidxml::xml_node<>& node,
                               const std::string& name)
    {
        std::vector<rapidxml::xml_node<>*> elements;
        traverse_elements(node, [&](rapidxml::xml_node<>& elem) -> bool {
            if (local_name(elem) == name)
            {
                elements.push_back(std::addressof(elem));
            }
            return false;
        });
        return elements;
    }

    // Direct child element by local name
    inline rapidxml::xml_node<>* get_child(const rapidxml::xml_node<>& node,
                                           const std::string& name)
    {
        for (auto child = node.first_node(); child != nullptr;
             child = child->next_sibling())
        {
            if (child->type() == rapidxml::node_element &&
                local_name(*child) == name)
            {
                return child;
            }
        }
        return nullptr;
    }

    inline optional<std::string>
    get_attribute(const rapidxml::xml_node<>& node, const std::string& name)
    {
        for (auto attr = node.first_attribute(); attr != nullptr;
             attr = attr->next_attribute())
        {
            const auto qname = std::string(attr->name(), attr->name_size());
            if (name_matches(qname, name))
            {
                return std::string(attr->value(), attr->value_size());
            }
        }
        return optional<std::string>();
    }

    // Resolves the namespace URI of an element by walking up the tree and
    // looking at xmlns and xmlns:prefix declarations
    inline optional<std::string>
    namespace_uri(const rapidxml::xml_node<>& node)
    {
        const auto pfx = prefix(node);
        const auto decl = pfx.empty() ? std::string("xmlns") : "xmlns:" + pfx;
        for (auto n = &node;
             n != nullptr && n->type() == rapidxml::node_element;
             n = n->parent())
        {
            for (auto attr = n->first_attribute(); attr != nullptr;
                 attr = attr->next_attribute())
            {
                if (std::string(attr->name(), attr->name_size()) == decl)
                {
                    return std::string(attr->value(), attr->value_size());
                }
            }
        }
        return optional<std::string>();
    }
} // namespace internal
} // namespace eas
