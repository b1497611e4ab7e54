
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

#include <sstream>
#include <string>
#include <vector>

#include "eas_fwd.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "xml.hpp"

namespace eas
{
//! Options of an incremental Sync request
struct sync_options final
{
    //! Maximum number of changes the server may return at once
    int window_size;

    //! Whether the server should report its changes
    bool get_changes;

    //! Whether deletions move items into Deleted Items
    bool deletes_as_moves;

    //! Requested body format: 1 = plain text, 2 = HTML
    int body_type;
    int truncation_size;

    sync_options()
        : window_size(100), get_changes(true), deletes_as_moves(true),
          body_type(1), truncation_size(200000)
    {
    }
};

//! How an EWS DeleteItem disposes of the item
enum class delete_type
{
    //! Permanently removes the item
    hard_delete,

    //! Moves the item to the dumpster
    soft_delete,

    //! Moves the item to the Deleted Items folder
    move_to_deleted_items
};

//! The EWS schema version announced in the SOAP header
enum class ews_schema
{
    exchange_2007_sp1,
    exchange_2010
};

namespace internal
{
    inline std::string enum_to_str(delete_type d)
    {
        switch (d)
        {
        case delete_type::hard_delete:
            return "HardDelete";
        case delete_type::soft_delete:
            return "SoftDelete";
        case delete_type::move_to_deleted_items:
            return "MoveToDeletedItems";
        default:
            throw exception("Unexpected <delete_type>");
        }
    }

    inline std::string enum_to_str(ews_schema schema)
    {
        switch (schema)
        {
        case ews_schema::exchange_2007_sp1:
            return "Exchange2007_SP1";
        case ews_schema::exchange_2010:
            return "Exchange2010";
        default:
            throw exception("Unexpected <ews_schema>");
        }
    }

    inline const char* xml_declaration() EAS_NOEXCEPT
    {
        return "<?xml version=\"1.0\" encoding=\"utf-8\"?>";
    }

    // ActiveSync request bodies. Every function here is free of side effects
    // and passes each caller-supplied value through escape().

    inline std::string folder_sync_request(const std::string& sync_key)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<FolderSync xmlns=\"FolderHierarchy\">"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "</FolderSync>";
        return sstr.str();
    }

    inline std::string folder_create_request(const std::string& sync_key,
                                             const std::string& parent_id,
                                             const std::string& display_name,
                                             folder_type type)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<FolderCreate xmlns=\"FolderHierarchy\">"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "<ParentId>" << escape(parent_id) << "</ParentId>"
             << "<DisplayName>" << escape(display_name) << "</DisplayName>"
             << "<Type>" << static_cast<int>(type) << "</Type>"
             << "</FolderCreate>";
        return sstr.str();
    }

    inline std::string folder_update_request(const std::string& sync_key,
                                             const std::string& server_id,
                                             const std::string& parent_id,
                                             const std::string& display_name)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<FolderUpdate xmlns=\"FolderHierarchy\">"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "<ServerId>" << escape(server_id) << "</ServerId>"
             << "<ParentId>" << escape(parent_id) << "</ParentId>"
             << "<DisplayName>" << escape(display_name) << "</DisplayName>"
             << "</FolderUpdate>";
        return sstr.str();
    }

    inline std::string folder_delete_request(const std::string& sync_key,
                                             const std::string& server_id)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<FolderDelete xmlns=\"FolderHierarchy\">"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "<ServerId>" << escape(server_id) << "</ServerId>"
             << "</FolderDelete>";
        return sstr.str();
    }

    //! The handshake that turns sync key 0 into the collection's first key
    inline std::string initial_sync_request(const std::string& collection_id)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<Sync xmlns=\"AirSync\">"
             << "<Collections><Collection>"
             << "<SyncKey>0</SyncKey>"
             << "<CollectionId>" << escape(collection_id) << "</CollectionId>"
             << "</Collection></Collections></Sync>";
        return sstr.str();
    }

    inline std::string sync_request(const std::string& sync_key,
                                    const std::string& collection_id,
                                    const sync_options& options)
    {
        std::stringstream sstr;
        sstr << xml_declaration()
             << "<Sync xmlns=\"AirSync\" xmlns:airsyncbase=\"AirSyncBase\">"
             << "<Collections><Collection>"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "<CollectionId>" << escape(collection_id) << "</CollectionId>"
             << "<DeletesAsMoves>" << (options.deletes_as_moves ? "1" : "0")
             << "</DeletesAsMoves>"
             << "<GetChanges>" << (options.get_changes ? "1" : "0")
             << "</GetChanges>"
             << "<WindowSize>" << options.window_size << "</WindowSize>"
             << "<Options><airsyncbase:BodyPreference>"
             << "<airsyncbase:Type>" << options.body_type
             << "</airsyncbase:Type>"
             << "<airsyncbase:TruncationSize>" << options.truncation_size
             << "</airsyncbase:TruncationSize>"
             << "</airsyncbase:BodyPreference></Options>"
             << "</Collection></Collections></Sync>";
        return sstr.str();
    }

    // Wraps one or more <Commands> children into a Sync request. The server
    // is asked not to piggy-back its own changes on the response so that
    // the collection's sync key can be advanced without losing any.
    inline std::string sync_commands_request(const std::string& sync_key,
                                             const std::string& collection_id,
                                             const std::string& namespaces,
                                             const std::string& commands,
                                             const char* deletes_as_moves)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<Sync xmlns=\"AirSync\"" << namespaces
             << ">"
             << "<Collections><Collection>"
             << "<SyncKey>" << escape(sync_key) << "</SyncKey>"
             << "<CollectionId>" << escape(collection_id) << "</CollectionId>";
        if (deletes_as_moves != nullptr)
        {
            sstr << "<DeletesAsMoves>" << deletes_as_moves
                 << "</DeletesAsMoves>";
        }
        sstr << "<GetChanges>0</GetChanges>"
             << "<Commands>" << commands << "</Commands>"
             << "</Collection></Collections></Sync>";
        return sstr.str();
    }

    //! \brief Deletes items from a collection.
    //!
    //! With deletes_as_moves the server moves the items to Deleted Items;
    //! without, they are removed for good.
    inline std::string
    delete_request(const std::string& sync_key,
                   const std::string& collection_id,
                   const std::vector<std::string>& server_ids,
                   bool deletes_as_moves)
    {
        std::stringstream commands;
        for (const auto& id : server_ids)
        {
            commands << "<Delete><ServerId>" << escape(id)
                     << "</ServerId></Delete>";
        }
        return sync_commands_request(sync_key, collection_id, "",
                                     commands.str(),
                                     deletes_as_moves ? "1" : "0");
    }

    inline std::string delete_request(const std::string& sync_key,
                                      const std::string& collection_id,
                                      const std::string& server_id,
                                      bool deletes_as_moves)
    {
        return delete_request(sync_key, collection_id,
                              std::vector<std::string>{server_id},
                              deletes_as_moves);
    }

    // Categories are left out entirely when there are none
    inline std::string categories_element(const std::string& prefix,
                                          const category_set& categories)
    {
        if (categories.empty())
        {
            return std::string();
        }
        std::stringstream sstr;
        sstr << "<" << prefix << ":Categories>";
        for (const auto& cat : categories)
        {
            sstr << "<" << prefix << ":Category>" << escape(cat) << "</"
                 << prefix << ":Category>";
        }
        sstr << "</" << prefix << ":Categories>";
        return sstr.str();
    }

    inline std::string plain_text_body(const std::string& body)
    {
        return "<airsyncbase:Body><airsyncbase:Type>1</airsyncbase:Type>"
               "<airsyncbase:Data>" +
               escape(body) + "</airsyncbase:Data></airsyncbase:Body>";
    }

    inline const char* notes_namespaces() EAS_NOEXCEPT
    {
        return " xmlns:airsyncbase=\"AirSyncBase\" xmlns:notes=\"Notes\"";
    }

    inline std::string note_application_data(const std::string& subject,
                                             const std::string& body,
                                             const category_set& categories)
    {
        return "<ApplicationData><notes:Subject>" + escape(subject) +
               "</notes:Subject>" + plain_text_body(body) +
               "<notes:MessageClass>IPM.StickyNote</notes:MessageClass>" +
               categories_element("notes", categories) + "</ApplicationData>";
    }

    //! Adds a note. client_id correlates the server's Add response.
    inline std::string note_create_request(const std::string& sync_key,
                                           const std::string& collection_id,
                                           const std::string& client_id,
                                           const std::string& subject,
                                           const std::string& body,
                                           const category_set& categories)
    {
        const auto command = "<Add><ClientId>" + escape(client_id) +
                             "</ClientId>" +
                             note_application_data(subject, body, categories) +
                             "</Add>";
        return sync_commands_request(sync_key, collection_id,
                                     notes_namespaces(), command, nullptr);
    }

    inline std::string note_update_request(const std::string& sync_key,
                                           const std::string& collection_id,
                                           const std::string& server_id,
                                           const std::string& subject,
                                           const std::string& body,
                                           const category_set& categories)
    {
        const auto command = "<Change><ServerId>" + escape(server_id) +
                             "</ServerId>" +
                             note_application_data(subject, body, categories) +
                             "</Change>";
        return sync_commands_request(sync_key, collection_id,
                                     notes_namespaces(), command, nullptr);
    }

    inline const char* tasks_namespaces() EAS_NOEXCEPT
    {
        return " xmlns:airsyncbase=\"AirSyncBase\" xmlns:tasks=\"Tasks\"";
    }

    // Dates are optional; an unset date produces no element at all
    inline std::string task_application_data(const task& t)
    {
        std::stringstream sstr;
        sstr << "<ApplicationData>" << plain_text_body(t.body)
             << "<tasks:Subject>" << escape(t.subject) << "</tasks:Subject>"
             << "<tasks:Importance>" << static_cast<int>(t.priority)
             << "</tasks:Importance>";
        if (t.start_date.is_set())
        {
            const auto start = t.start_date.to_activesync_string();
            sstr << "<tasks:UtcStartDate>" << start << "</tasks:UtcStartDate>"
                 << "<tasks:StartDate>" << start << "</tasks:StartDate>";
        }
        if (t.due_date.is_set())
        {
            const auto due = t.due_date.to_activesync_string();
            sstr << "<tasks:UtcDueDate>" << due << "</tasks:UtcDueDate>"
                 << "<tasks:DueDate>" << due << "</tasks:DueDate>";
        }
        sstr << categories_element("tasks", t.categories) << "<tasks:Complete>"
             << (t.complete ? "1" : "0") << "</tasks:Complete>"
             << "</ApplicationData>";
        return sstr.str();
    }

    inline std::string task_create_request(const std::string& sync_key,
                                           const std::string& collection_id,
                                           const std::string& client_id,
                                           const task& t)
    {
        const auto command = "<Add><ClientId>" + escape(client_id) +
                             "</ClientId>" + task_application_data(t) +
                             "</Add>";
        return sync_commands_request(sync_key, collection_id,
                                     tasks_namespaces(), command, nullptr);
    }

    inline std::string task_update_request(const std::string& sync_key,
                                           const std::string& collection_id,
                                           const std::string& server_id,
                                           const task& t)
    {
        const auto command = "<Change><ServerId>" + escape(server_id) +
                             "</ServerId>" + task_application_data(t) +
                             "</Change>";
        return sync_commands_request(sync_key, collection_id,
                                     tasks_namespaces(), command, nullptr);
    }

    //! Sets or clears the read flag of messages in one collection
    inline std::string mark_read_request(const std::string& sync_key,
                                         const std::string& collection_id,
                                         const std::vector<std::string>& ids,
                                         bool read)
    {
        std::stringstream commands;
        for (const auto& id : ids)
        {
            commands << "<Change><ServerId>" << escape(id) << "</ServerId>"
                     << "<ApplicationData><email:Read>" << (read ? "1" : "0")
                     << "</email:Read></ApplicationData></Change>";
        }
        return sync_commands_request(sync_key, collection_id,
                                     " xmlns:email=\"Email\"", commands.str(),
                                     nullptr);
    }

    //! Moves many items, possibly from different folders, into one folder
    inline std::string
    move_items_request(const std::vector<move_request>& items,
                       const std::string& destination_id)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<MoveItems xmlns=\"Move\">";
        for (const auto& item : items)
        {
            sstr << "<Move>"
                 << "<SrcMsgId>" << escape(item.item_id) << "</SrcMsgId>"
                 << "<SrcFldId>" << escape(item.source_folder_id)
                 << "</SrcFldId>"
                 << "<DstFldId>" << escape(destination_id) << "</DstFldId>"
                 << "</Move>";
        }
        sstr << "</MoveItems>";
        return sstr.str();
    }

    //! Searches the global address list; returns at most max_results hits
    inline std::string gal_search_request(const std::string& query,
                                          int max_results)
    {
        check<exception>(max_results > 0, "max_results must be positive");

        std::stringstream sstr;
        sstr << xml_declaration()
             << "<Search xmlns=\"Search\" xmlns:gal=\"Gal\">"
             << "<Store><Name>GAL</Name>"
             << "<Query>" << escape(query) << "</Query>"
             << "<Options><Range>0-" << (max_results - 1)
             << "</Range></Options>"
             << "</Store></Search>";
        return sstr.str();
    }

    //! Full-text search in one mailbox collection over the given result range
    inline std::string mailbox_search_request(const std::string& collection_id,
                                              const std::string& query,
                                              int range_start, int range_end)
    {
        check<exception>(range_start >= 0 && range_end >= range_start,
                         "Invalid search range");

        std::stringstream sstr;
        sstr << xml_declaration()
             << "<Search xmlns=\"Search\" xmlns:airsync=\"AirSync\" "
                "xmlns:airsyncbase=\"AirSyncBase\">"
             << "<Store><Name>Mailbox</Name>"
             << "<Query><And>"
             << "<airsync:CollectionId>" << escape(collection_id)
             << "</airsync:CollectionId>"
             << "<FreeText>" << escape(query) << "</FreeText>"
             << "</And></Query>"
             << "<Options><Range>" << range_start << "-" << range_end
             << "</Range>"
             << "<airsyncbase:BodyPreference><airsyncbase:Type>1"
                "</airsyncbase:Type><airsyncbase:TruncationSize>200000"
                "</airsyncbase:TruncationSize></airsyncbase:BodyPreference>"
             << "</Options></Store></Search>";
        return sstr.str();
    }

    //! First phase of provisioning: asks for the policy
    inline std::string provision_request()
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<Provision xmlns=\"Provision\">"
             << "<Policies><Policy>"
             << "<PolicyType>MS-EAS-Provisioning-WBXML</PolicyType>"
             << "</Policy></Policies></Provision>";
        return sstr.str();
    }

    //! Second phase: acknowledges the temporary policy key
    inline std::string provision_ack_request(const std::string& policy_key)
    {
        std::stringstream sstr;
        sstr << xml_declaration() << "<Provision xmlns=\"Provision\">"
             << "<Policies><Policy>"
             << "<PolicyType>MS-EAS-Provisioning-WBXML</PolicyType>"
             << "<PolicyKey>" << escape(policy_key) << "</PolicyKey>"
             << "<Status>1</Status>"
             << "</Policy></Policies></Provision>";
        return sstr.str();
    }

    // EWS request bodies

    inline const char* ews_messages_uri() EAS_NOEXCEPT
    {
        return "http://schemas.microsoft.com/exchange/services/2006/messages";
    }

    inline const char* ews_types_uri() EAS_NOEXCEPT
    {
        return "http://schemas.microsoft.com/exchange/services/2006/types";
    }

    //! \brief Wraps an EWS operation element in a SOAP envelope.
    //!
    //! The body may use the m: (messages) and t: (types) prefixes.
    inline std::string soap_envelope(const std::string& body,
                                     ews_schema schema)
    {
        std::stringstream sstr;
        sstr << xml_declaration()
             << "<soap:Envelope "
                "xmlns:soap=\"http://schemas.xmlsoap.org/soap/envelope/\" "
             << "xmlns:m=\"" << ews_messages_uri() << "\" "
             << "xmlns:t=\"" << ews_types_uri() << "\">"
             << "<soap:Header><t:RequestServerVersion Version=\""
             << enum_to_str(schema) << "\"/></soap:Header>"
             << "<soap:Body>" << body << "</soap:Body>"
             << "</soap:Envelope>";
        return sstr.str();
    }

    inline std::string ews_item_ids(const std::vector<std::string>& item_ids)
    {
        std::string res;
        for (const auto& id : item_ids)
        {
            res += "<t:ItemId Id=\"" + escape(id) + "\"/>";
        }
        return res;
    }

    inline std::string ews_categories(const category_set& categories)
    {
        if (categories.empty())
        {
            return std::string();
        }
        std::string res = "<t:Categories>";
        for (const auto& cat : categories)
        {
            res += "<t:String>" + escape(cat) + "</t:String>";
        }
        return res + "</t:Categories>";
    }

    inline std::string ews_text_body(const std::string& body)
    {
        return "<t:Body BodyType=\"Text\">" + escape(body) + "</t:Body>";
    }

    //! Creates a sticky note in the distinguished notes folder
    inline std::string ews_create_note_request(const std::string& subject,
                                               const std::string& body,
                                               const category_set& categories)
    {
        std::stringstream sstr;
        sstr << "<m:CreateItem MessageDisposition=\"SaveOnly\">"
             << "<m:SavedItemFolderId>"
             << "<t:DistinguishedFolderId Id=\"notes\"/>"
             << "</m:SavedItemFolderId>"
             << "<m:Items><t:Message>"
             << "<t:ItemClass>IPM.StickyNote</t:ItemClass>"
             << "<t:Subject>" << escape(subject) << "</t:Subject>"
             << ews_text_body(body) << ews_categories(categories)
             << "</t:Message></m:Items>"
             << "</m:CreateItem>";
        return sstr.str();
    }

    //! Fetches the current ChangeKey of an item
    inline std::string ews_get_item_id_request(const std::string& item_id)
    {
        return "<m:GetItem><m:ItemShape><t:BaseShape>IdOnly</t:BaseShape>"
               "</m:ItemShape><m:ItemIds>" +
               ews_item_ids(std::vector<std::string>{item_id}) +
               "</m:ItemIds></m:GetItem>";
    }

    inline std::string
    ews_get_items_request(const std::vector<std::string>& ids)
    {
        return "<m:GetItem><m:ItemShape>"
               "<t:BaseShape>AllProperties</t:BaseShape>"
               "<t:BodyType>Text</t:BodyType>"
               "</m:ItemShape><m:ItemIds>" +
               ews_item_ids(ids) + "</m:ItemIds></m:GetItem>";
    }

    // One SetItemField per property. An empty category set clears the
    // property instead of writing an empty list.
    inline std::string ews_set_field(const std::string& field_uri,
                                     const std::string& item_element,
                                     const std::string& value_xml)
    {
        return "<t:SetItemField><t:FieldURI FieldURI=\"" + field_uri +
               "\"/><t:" + item_element + ">" + value_xml + "</t:" +
               item_element + "></t:SetItemField>";
    }

    inline std::string ews_delete_field(const std::string& field_uri)
    {
        return "<t:DeleteItemField><t:FieldURI FieldURI=\"" + field_uri +
               "\"/></t:DeleteItemField>";
    }

    inline std::string ews_update_item_request(const std::string& item_id,
                                               const std::string& change_key,
                                               const std::string& updates,
                                               bool save_only)
    {
        std::stringstream sstr;
        sstr << "<m:UpdateItem ";
        if (save_only)
        {
            sstr << "MessageDisposition=\"SaveOnly\" ";
        }
        sstr << "ConflictResolution=\"AlwaysOverwrite\">"
             << "<m:ItemChanges><t:ItemChange>"
             << "<t:ItemId Id=\"" << escape(item_id) << "\" ChangeKey=\""
             << escape(change_key) << "\"/>"
             << "<t:Updates>" << updates << "</t:Updates>"
             << "</t:ItemChange></m:ItemChanges></m:UpdateItem>";
        return sstr.str();
    }

    inline std::string ews_update_note_request(const std::string& item_id,
                                               const std::string& change_key,
                                               const std::string& subject,
                                               const std::string& body,
                                               const category_set& categories)
    {
        auto updates =
            ews_set_field("item:Subject", "Message",
                          "<t:Subject>" + escape(subject) + "</t:Subject>") +
            ews_set_field("item:Body", "Message", ews_text_body(body));
        updates += categories.empty()
                       ? ews_delete_field("item:Categories")
                       : ews_set_field("item:Categories", "Message",
                                       ews_categories(categories));
        return ews_update_item_request(item_id, change_key, updates, true);
    }

    //! Deletes items; tasks additionally need AffectedTaskOccurrences
    inline std::string
    ews_delete_item_request(const std::vector<std::string>& ids,
                            delete_type del, bool is_task)
    {
        std::stringstream sstr;
        sstr << "<m:DeleteItem DeleteType=\"" << enum_to_str(del) << "\"";
        if (is_task)
        {
            sstr << " AffectedTaskOccurrences=\"AllOccurrences\"";
        }
        sstr << "><m:ItemIds>" << ews_item_ids(ids) << "</m:ItemIds>"
             << "</m:DeleteItem>";
        return sstr.str();
    }

    //! Moves items into a distinguished folder, e.g. "notes"
    inline std::string
    ews_move_item_request(const std::vector<std::string>& ids,
                          const std::string& distinguished_folder)
    {
        std::stringstream sstr;
        sstr << "<m:MoveItem><m:ToFolderId>"
             << "<t:DistinguishedFolderId Id=\"" << escape(distinguished_folder)
             << "\"/></m:ToFolderId>"
             << "<m:ItemIds>" << ews_item_ids(ids) << "</m:ItemIds>"
             << "</m:MoveItem>";
        return sstr.str();
    }

    //! Lists the ids of all items in a distinguished folder
    inline std::string
    ews_find_item_request(const std::string& distinguished_folder,
                          int max_entries)
    {
        std::stringstream sstr;
        sstr << "<m:FindItem Traversal=\"Shallow\">"
             << "<m:ItemShape><t:BaseShape>IdOnly</t:BaseShape>"
             << "<t:AdditionalProperties>"
             << "<t:FieldURI FieldURI=\"item:ItemClass\"/>"
             << "</t:AdditionalProperties></m:ItemShape>"
             << "<m:IndexedPageItemView MaxEntriesReturned=\"" << max_entries
             << "\" Offset=\"0\" BasePoint=\"Beginning\"/>"
             << "<m:ParentFolderIds>"
             << "<t:DistinguishedFolderId Id=\"" << escape(distinguished_folder)
             << "\"/></m:ParentFolderIds>"
             << "</m:FindItem>";
        return sstr.str();
    }

    //! SyncFolderItems for a distinguished folder; an empty sync_state
    //! starts from scratch
    inline std::string
    ews_sync_folder_items_request(const std::string& distinguished_folder,
                                  const std::string& sync_state,
                                  int max_changes)
    {
        std::stringstream sstr;
        sstr << "<m:SyncFolderItems>"
             << "<m:ItemShape><t:BaseShape>IdOnly</t:BaseShape></m:ItemShape>"
             << "<m:SyncFolderId>"
             << "<t:DistinguishedFolderId Id=\"" << escape(distinguished_folder)
             << "\"/></m:SyncFolderId>";
        if (!sync_state.empty())
        {
            sstr << "<m:SyncState>" << escape(sync_state) << "</m:SyncState>";
        }
        sstr << "<m:MaxChangesReturned>" << max_changes
             << "</m:MaxChangesReturned>"
             << "</m:SyncFolderItems>";
        return sstr.str();
    }

    // Element order follows the EWS schema: item properties (Subject, Body,
    // Categories, Importance) first, then task properties.
    inline std::string ews_task_properties(const task& t)
    {
        std::stringstream sstr;
        sstr << "<t:Subject>" << escape(t.subject) << "</t:Subject>";
        if (!t.body.empty())
        {
            sstr << ews_text_body(t.body);
        }
        sstr << ews_categories(t.categories) << "<t:Importance>"
             << enum_to_str(t.priority) << "</t:Importance>";
        if (t.due_date.is_set())
        {
            sstr << "<t:DueDate>" << escape(t.due_date.to_string())
                 << "</t:DueDate>";
        }
        if (t.start_date.is_set())
        {
            sstr << "<t:StartDate>" << escape(t.start_date.to_string())
                 << "</t:StartDate>";
        }
        sstr << "<t:Status>" << (t.complete ? "Completed" : "NotStarted")
             << "</t:Status>";
        return sstr.str();
    }

    //! Creates a task. Unlike messages, tasks take no MessageDisposition.
    inline std::string ews_create_task_request(const task& t)
    {
        return "<m:CreateItem><m:SavedItemFolderId>"
               "<t:DistinguishedFolderId Id=\"tasks\"/>"
               "</m:SavedItemFolderId><m:Items><t:Task>" +
               ews_task_properties(t) + "</t:Task></m:Items></m:CreateItem>";
    }

    inline std::string ews_update_task_request(const std::string& item_id,
                                               const std::string& change_key,
                                               const task& t)
    {
        auto updates =
            ews_set_field("item:Subject", "Task",
                          "<t:Subject>" + escape(t.subject) + "</t:Subject>") +
            ews_set_field("item:Body", "Task", ews_text_body(t.body)) +
            ews_set_field("item:Importance", "Task",
                          "<t:Importance>" + enum_to_str(t.priority) +
                              "</t:Importance>");
        updates += t.categories.empty()
                       ? ews_delete_field("item:Categories")
                       : ews_set_field("item:Categories", "Task",
                                       ews_categories(t.categories));
        updates += t.due_date.is_set()
                       ? ews_set_field("task:DueDate", "Task",
                                       "<t:DueDate>" +
                                           escape(t.due_date.to_string()) +
                                           "</t:DueDate>")
                       : ews_delete_field("task:DueDate");
        updates += t.start_date.is_set()
                       ? ews_set_field("task:StartDate", "Task",
                                       "<t:StartDate>" +
                                           escape(t.start_date.to_string()) +
                                           "</t:StartDate>")
                       : ews_delete_field("task:StartDate");
        updates += ews_set_field(
            "task:Status", "Task",
            std::string("<t:Status>") +
                (t.complete ? "Completed" : "NotStarted") + "</t:Status>");
        return ews_update_item_request(item_id, change_key, updates, false);
    }

    //! Looks up directory entries by (partial) name
    inline std::string ews_resolve_names_request(const std::string& query)
    {
        return "<m:ResolveNames ReturnFullContactData=\"true\">"
               "<m:UnresolvedEntry>" +
               escape(query) + "</m:UnresolvedEntry></m:ResolveNames>";
    }
} // namespace internal
} // namespace eas
