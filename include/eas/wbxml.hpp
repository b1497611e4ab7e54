
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

#include <stddef.h>
#include <stdint.h>
#include <strings.h>
#include <string>
#include <vector>

#include <rapidxml/rapidxml.hpp>

#include "errors.hpp"
#include "xml.hpp"

// Codec for the WAP Binary XML dialect used on the wire by Exchange
// ActiveSync (MS-ASWBXML). Requests are built as XML text and encoded right
// before they are sent; responses are decoded back into XML text.
namespace eas
{
namespace internal
{
    namespace wbxml
    {
        enum token : unsigned char
        {
            switch_page = 0x00,
            end = 0x01,
            entity = 0x02,
            str_i = 0x03,
            literal = 0x04,
            str_t = 0x83,
            opaque = 0xC3,
            with_content = 0x40,
            with_attributes = 0x80
        };

        struct tag
        {
            unsigned char token;
            const char* name;
        };

        struct code_page
        {
            unsigned char index;
            const char* xml_namespace;
            const tag* tags;
            size_t tag_count;
        };

        inline const std::vector<code_page>& code_pages()
        {
            static const tag airsync[] = {
                {0x05, "Sync"},           {0x06, "Responses"},
                {0x07, "Add"},            {0x08, "Change"},
                {0x09, "Delete"},         {0x0A, "Fetch"},
                {0x0B, "SyncKey"},        {0x0C, "ClientId"},
                {0x0D, "ServerId"},       {0x0E, "Status"},
                {0x0F, "Collection"},     {0x10, "Class"},
                {0x12, "CollectionId"},   {0x13, "GetChanges"},
                {0x14, "MoreAvailable"},  {0x15, "WindowSize"},
                {0x16, "Commands"},       {0x17, "Options"},
                {0x18, "FilterType"},     {0x1B, "Conflict"},
                {0x1C, "Collections"},    {0x1D, "ApplicationData"},
                {0x1E, "DeletesAsMoves"}, {0x20, "Supported"},
                {0x21, "SoftDelete"},     {0x22, "MIMESupport"},
                {0x23, "MIMETruncation"}, {0x24, "Wait"},
                {0x25, "Limit"},          {0x26, "Partial"},
                {0x27, "ConversationMode"}, {0x28, "MaxItems"},
                {0x29, "HeartbeatInterval"}};

            static const tag email[] = {
                {0x0F, "DateReceived"}, {0x11, "DisplayTo"},
                {0x12, "Importance"},   {0x13, "MessageClass"},
                {0x14, "Subject"},      {0x15, "Read"},
                {0x16, "To"},           {0x17, "Cc"},
                {0x18, "From"},         {0x19, "ReplyTo"},
                {0x1A, "AllDayEvent"},  {0x1B, "Categories"},
                {0x1C, "Category"},     {0x1D, "DtStamp"},
                {0x1E, "EndTime"},      {0x1F, "InstanceType"},
                {0x20, "BusyStatus"},   {0x21, "Location"},
                {0x22, "MeetingRequest"}, {0x23, "Organizer"},
                {0x24, "RecurrenceId"}, {0x25, "Reminder"},
                {0x26, "ResponseRequested"}, {0x31, "StartTime"},
                {0x32, "Sensitivity"},  {0x33, "TimeZone"},
                {0x34, "GlobalObjId"},  {0x35, "ThreadTopic"},
                {0x39, "InternetCPID"}, {0x3A, "Flag"},
                {0x3B, "FlagStatus"},   {0x3C, "ContentClass"},
                {0x3D, "FlagType"},     {0x3E, "CompleteTime"}};

            static const tag move[] = {
                {0x05, "MoveItems"}, {0x06, "Move"},     {0x07, "SrcMsgId"},
                {0x08, "SrcFldId"},  {0x09, "DstFldId"}, {0x0A, "Response"},
                {0x0B, "Status"},    {0x0C, "DstMsgId"}};

            static const tag folder_hierarchy[] = {
                {0x05, "Folders"},      {0x06, "Folder"},
                {0x07, "DisplayName"},  {0x08, "ServerId"},
                {0x09, "ParentId"},     {0x0A, "Type"},
                {0x0C, "Status"},       {0x0E, "Changes"},
                {0x0F, "Add"},          {0x10, "Delete"},
                {0x11, "Update"},       {0x12, "SyncKey"},
                {0x13, "FolderCreate"}, {0x14, "FolderDelete"},
                {0x15, "FolderUpdate"}, {0x16, "FolderSync"},
                {0x17, "Count"}};

            static const tag tasks[] = {
                {0x05, "Body"},          {0x06, "BodySize"},
                {0x07, "BodyTruncated"}, {0x08, "Categories"},
                {0x09, "Category"},      {0x0A, "Complete"},
                {0x0B, "DateCompleted"}, {0x0C, "DueDate"},
                {0x0D, "UtcDueDate"},    {0x0E, "Importance"},
                {0x0F, "Recurrence"},    {0x1B, "ReminderSet"},
                {0x1C, "ReminderTime"},  {0x1D, "Sensitivity"},
                {0x1E, "StartDate"},     {0x1F, "UtcStartDate"},
                {0x20, "Subject"}};

            static const tag provision[] = {
                {0x05, "Provision"},
                {0x06, "Policies"},
                {0x07, "Policy"},
                {0x08, "PolicyType"},
                {0x09, "PolicyKey"},
                {0x0A, "Data"},
                {0x0B, "Status"},
                {0x0C, "RemoteWipe"},
                {0x0D, "EASProvisionDoc"},
                {0x0E, "DevicePasswordEnabled"},
                {0x0F, "AlphanumericDevicePasswordRequired"},
                {0x10, "RequireStorageCardEncryption"},
                {0x11, "PasswordRecoveryEnabled"},
                {0x13, "AttachmentsEnabled"},
                {0x14, "MinDevicePasswordLength"},
                {0x15, "MaxInactivityTimeDeviceLock"},
                {0x16, "MaxDevicePasswordFailedAttempts"},
                {0x17, "MaxAttachmentSize"},
                {0x18, "AllowSimpleDevicePassword"},
                {0x19, "DevicePasswordExpiration"},
                {0x1A, "DevicePasswordHistory"}};

            static const tag search[] = {
                {0x05, "Search"},         {0x07, "Store"},
                {0x08, "Name"},           {0x09, "Query"},
                {0x0A, "Options"},        {0x0B, "Range"},
                {0x0C, "Status"},         {0x0D, "Response"},
                {0x0E, "Result"},         {0x0F, "Properties"},
                {0x10, "Total"},          {0x11, "EqualTo"},
                {0x12, "Value"},          {0x13, "And"},
                {0x14, "Or"},             {0x15, "FreeText"},
                {0x17, "DeepTraversal"},  {0x18, "LongId"},
                {0x19, "RebuildResults"}, {0x1A, "LessThan"},
                {0x1B, "GreaterThan"},    {0x1E, "UserName"},
                {0x1F, "Password"},       {0x20, "ConversationId"}};

            static const tag gal[] = {
                {0x05, "DisplayName"}, {0x06, "Phone"},
                {0x07, "Office"},      {0x08, "Title"},
                {0x09, "Company"},     {0x0A, "Alias"},
                {0x0B, "FirstName"},   {0x0C, "LastName"},
                {0x0D, "HomePhone"},   {0x0E, "MobilePhone"},
                {0x0F, "EmailAddress"}};

            static const tag airsyncbase[] = {
                {0x05, "BodyPreference"},    {0x06, "Type"},
                {0x07, "TruncationSize"},    {0x08, "AllOrNone"},
                {0x0A, "Body"},              {0x0B, "Data"},
                {0x0C, "EstimatedDataSize"}, {0x0D, "Truncated"},
                {0x0E, "Attachments"},       {0x0F, "Attachment"},
                {0x10, "DisplayName"},       {0x11, "FileReference"},
                {0x12, "Method"},            {0x13, "ContentId"},
                {0x14, "ContentLocation"},   {0x15, "IsInline"},
                {0x16, "NativeBodyType"},    {0x17, "ContentType"},
                {0x18, "Preview"},           {0x19, "BodyPartPreference"},
                {0x1A, "BodyPart"},          {0x1B, "Status"}};

            static const tag settings[] = {
                {0x05, "Settings"},          {0x06, "Status"},
                {0x07, "Get"},               {0x08, "Set"},
                {0x16, "DeviceInformation"}, {0x17, "Model"},
                {0x18, "IMEI"},              {0x19, "FriendlyName"},
                {0x1A, "OS"},                {0x1B, "OSLanguage"},
                {0x1C, "PhoneNumber"},       {0x20, "UserAgent"}};

            static const tag notes[] = {{0x05, "Subject"},
                                        {0x06, "MessageClass"},
                                        {0x07, "LastModifiedDate"},
                                        {0x08, "Categories"},
                                        {0x09, "Category"}};

#define EAS_WBXML_PAGE(index, ns, table)                                       \
    code_page { index, ns, table, sizeof(table) / sizeof(table[0]) }

            static const std::vector<code_page> pages = {
                EAS_WBXML_PAGE(0, "AirSync", airsync),
                code_page{1, "Contacts", nullptr, 0},
                EAS_WBXML_PAGE(2, "Email", email),
                code_page{3, "AirNotify", nullptr, 0},
                code_page{4, "Calendar", nullptr, 0},
                EAS_WBXML_PAGE(5, "Move", move),
                code_page{6, "GetItemEstimate", nullptr, 0},
                EAS_WBXML_PAGE(7, "FolderHierarchy", folder_hierarchy),
                code_page{8, "MeetingResponse", nullptr, 0},
                EAS_WBXML_PAGE(9, "Tasks", tasks),
                code_page{10, "ResolveRecipients", nullptr, 0},
                code_page{11, "ValidateCert", nullptr, 0},
                code_page{12, "Contacts2", nullptr, 0},
                code_page{13, "Ping", nullptr, 0},
                EAS_WBXML_PAGE(14, "Provision", provision),
                EAS_WBXML_PAGE(15, "Search", search),
                EAS_WBXML_PAGE(16, "GAL", gal),
                EAS_WBXML_PAGE(17, "AirSyncBase", airsyncbase),
                EAS_WBXML_PAGE(18, "Settings", settings),
                code_page{19, "DocumentLibrary", nullptr, 0},
                code_page{20, "ItemOperations", nullptr, 0},
                code_page{21, "ComposeMail", nullptr, 0},
                code_page{22, "Email2", nullptr, 0},
                EAS_WBXML_PAGE(23, "Notes", notes),
                code_page{24, "RightsManagement", nullptr, 0}};

#undef EAS_WBXML_PAGE

            return pages;
        }

        inline const code_page* find_page(unsigned char index)
        {
            const auto& pages = code_pages();
            return index < pages.size() ? &pages[index] : nullptr;
        }

        // Namespaces are compared case-insensitively and with an optional
        // trailing colon ("AirSync:" is seen in the wild)
        inline const code_page* find_page(const std::string& xml_namespace)
        {
            auto ns = xml_namespace;
            if (!ns.empty() && ns.back() == ':')
            {
                ns.pop_back();
            }
            for (const auto& page : code_pages())
            {
                if (strcasecmp(page.xml_namespace, ns.c_str()) == 0)
                {
                    return &page;
                }
            }
            return nullptr;
        }

        inline const char* tag_name(const code_page& page, unsigned char tok)
        {
            for (size_t i = 0; i < page.tag_count; ++i)
            {
                if (page.tags[i].token == tok)
                {
                    return page.tags[i].name;
                }
            }
            return nullptr;
        }

        inline int tag_token(const code_page& page, const std::string& name)
        {
            for (size_t i = 0; i < page.tag_count; ++i)
            {
                if (name == page.tags[i].name)
                {
                    return page.tags[i].token;
                }
            }
            return -1;
        }

        inline void write_multibyte_uint(std::string& out, uint32_t value)
        {
            unsigned char buf[5];
            int i = 4;
            buf[i] = static_cast<unsigned char>(value & 0x7F);
            value >>= 7;
            while (value != 0 && i > 0)
            {
                buf[--i] = static_cast<unsigned char>(0x80 | (value & 0x7F));
                value >>= 7;
            }
            out.append(reinterpret_cast<const char*>(buf + i), 5 - i);
        }

        class reader final
        {
        public:
            explicit reader(const std::string& data) : data_(data), pos_(0)
            {
            }

            bool at_end() const EAS_NOEXCEPT { return pos_ >= data_.size(); }

            unsigned char next()
            {
                check<wbxml_error>(!at_end(), "Unexpected end of WBXML data");
                return static_cast<unsigned char>(data_[pos_++]);
            }

            uint32_t next_multibyte_uint()
            {
                uint32_t value = 0;
                for (int i = 0; i < 5; ++i)
                {
                    const auto byte = next();
                    value = (value << 7) | (byte & 0x7F);
                    if ((byte & 0x80) == 0)
                    {
                        return value;
                    }
                }
                throw wbxml_error("Multi-byte integer too long");
            }

            std::string next_inline_string()
            {
                const auto terminator = data_.find('\0', pos_);
                check<wbxml_error>(terminator != std::string::npos,
                                   "Unterminated inline string");
                auto str = data_.substr(pos_, terminator - pos_);
                pos_ = terminator + 1;
                return str;
            }

            std::string next_bytes(uint32_t count)
            {
                check<wbxml_error>(count <= data_.size() - pos_,
                                   "Opaque data exceeds document");
                auto str = data_.substr(pos_, count);
                pos_ += count;
                return str;
            }

        private:
            const std::string& data_;
            std::string::size_type pos_;
        };

        inline void encode_element(const rapidxml::xml_node<>& node,
                                   std::string& out,
                                   unsigned char& current_page)
        {
            const auto ns = namespace_uri(node);
            if (!ns.has_value())
            {
                throw wbxml_error("No namespace declared for element <" +
                                  node_name(node) + ">");
            }
            const auto page = find_page(ns.value());
            if (page == nullptr)
            {
                throw wbxml_error("Unknown namespace: " + ns.value());
            }
            const auto name = local_name(node);
            const auto tok = tag_token(*page, name);
            if (tok < 0)
            {
                throw wbxml_error("Unknown element <" + name +
                                  "> in code page " + page->xml_namespace);
            }

            if (page->index != current_page)
            {
                out += static_cast<char>(switch_page);
                out += static_cast<char>(page->index);
                current_page = page->index;
            }

            bool has_content = false;
            for (auto child = node.first_node(); child != nullptr;
                 child = child->next_sibling())
            {
                if (child->type() == rapidxml::node_element ||
                    ((child->type() == rapidxml::node_data ||
                      child->type() == rapidxml::node_cdata) &&
                     child->value_size() != 0))
                {
                    has_content = true;
                    break;
                }
            }

            if (!has_content)
            {
                out += static_cast<char>(tok);
                return;
            }

            out += static_cast<char>(tok | with_content);
            for (auto child = node.first_node(); child != nullptr;
                 child = child->next_sibling())
            {
                switch (child->type())
                {
                case rapidxml::node_element:
                    encode_element(*child, out, current_page);
                    break;

                case rapidxml::node_data:
                case rapidxml::node_cdata:
                    out += static_cast<char>(str_i);
                    out.append(child->value(), child->value_size());
                    out += '\0';
                    break;

                default:
                    break;
                }
            }
            out += static_cast<char>(end);
        }
    } // namespace wbxml

    //! Encodes an XML document into ActiveSync WBXML
    inline std::string wbxml_encode(const std::string& xml)
    {
        xml_document doc(xml);
        const auto root = doc.root();
        check<wbxml_error>(root != nullptr, "Document has no root element");

        // Version 1.3, unknown public identifier, UTF-8, empty string table
        std::string out("\x03\x01\x6A\x00", 4);
        unsigned char current_page = 0;
        wbxml::encode_element(*root, out, current_page);
        return out;
    }

    //! \brief Decodes ActiveSync WBXML into XML text.
    //!
    //! Each element whose code page differs from its parent's carries an
    //! xmlns declaration so the text can be fed to any XML parser.
    inline std::string wbxml_decode(const std::string& data)
    {
        using namespace wbxml;

        if (data.empty())
        {
            return std::string();
        }

        reader in(data);
        in.next(); // version
        in.next_multibyte_uint(); // public identifier
        const auto charset = in.next_multibyte_uint();
        check<wbxml_error>(charset == 0x6A || charset == 0,
                           "Only UTF-8 encoded WBXML is supported");
        const auto string_table = in.next_bytes(in.next_multibyte_uint());

        std::string out("<?xml version=\"1.0\" encoding=\"utf-8\"?>");
        std::vector<std::pair<std::string, unsigned char>> open_elements;
        unsigned char page = 0;

        while (!in.at_end())
        {
            const auto tok = in.next();
            switch (tok)
            {
            case switch_page:
                page = in.next();
                break;

            case end:
                check<wbxml_error>(!open_elements.empty(),
                                   "END token without open element");
                out += "</" + open_elements.back().first + ">";
                open_elements.pop_back();
                break;

            case str_i:
                out += escape(in.next_inline_string());
                break;

            case opaque:
                out += escape(in.next_bytes(in.next_multibyte_uint()));
                break;

            case entity:
            {
                std::string ch;
                append_utf8(ch, in.next_multibyte_uint());
                out += escape(ch);
                break;
            }

            case str_t:
            {
                const auto offset = in.next_multibyte_uint();
                check<wbxml_error>(offset < string_table.size(),
                                   "String table reference out of range");
                out += escape(string_table.substr(
                    offset, string_table.find('\0', offset) - offset));
                break;
            }

            default:
            {
                check<wbxml_error>((tok & with_attributes) == 0,
                                   "WBXML attributes are not supported");
                const unsigned char identity = tok & 0x3F;
                check<wbxml_error>(identity != literal,
                                   "WBXML literal tags are not supported");

                const auto cp = find_page(page);
                const char* known = cp ? tag_name(*cp, identity) : nullptr;
                std::string name;
                if (known != nullptr)
                {
                    name = known;
                }
                else
                {
                    static const char* const hex = "0123456789ABCDEF";
                    name = "Unknown_";
                    name += hex[identity >> 4];
                    name += hex[identity & 0x0F];
                }

                out += "<" + name;
                const bool new_namespace = open_elements.empty() ||
                                           open_elements.back().second != page;
                if (new_namespace)
                {
                    out += " xmlns=\"";
                    out += cp ? cp->xml_namespace
                              : "Page" + std::to_string(page);
                    out += "\"";
                }

                if (tok & with_content)
                {
                    out += ">";
                    open_elements.emplace_back(name, page);
                }
                else
                {
                    out += "/>";
                }
            }
            }
        }

        check<wbxml_error>(open_elements.empty(),
                           "Truncated WBXML document");
        return out;
    }
} // namespace internal
} // namespace eas
