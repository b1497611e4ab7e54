
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

#include <string>
#include <utility>
#include <vector>

#include "eas_fwd.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "xml.hpp"

namespace eas
{
//! An item the server added or changed: its id and its raw properties
struct sync_item final
{
    std::string server_id;

    //! Inner markup of the item's ApplicationData element
    std::string application_data;

    sync_item() = default;
    sync_item(std::string id, std::string data)
        : server_id(std::move(id)), application_data(std::move(data))
    {
    }
};

//! The server's answer to one command we sent in a Sync request
struct sync_reply final
{
    enum class kind
    {
        add,
        change,
        remove,
        fetch
    };

    kind type;
    std::string client_id;
    std::string server_id;
    int status;

    sync_reply() : type(kind::add), status(0) {}
};

//! \brief Everything one Sync response reported for one collection.
//!
//! The server does not order changes across categories; apply deleted
//! first, then added and changed (see apply_batch).
struct sync_batch final
{
    std::string collection_id;

    //! The key to use for the next request; empty if the server did not
    //! send one
    std::string sync_key;
    int status;
    bool more_available;
    std::vector<sync_item> added;
    std::vector<sync_item> changed;
    std::vector<std::string> deleted;
    std::vector<sync_reply> replies;

    sync_batch() : status(1), more_available(false) {}

    bool empty() const EAS_NOEXCEPT
    {
        return added.empty() && changed.empty() && deleted.empty();
    }

    //! Whether the server piggy-backed changes of its own
    bool has_server_changes() const EAS_NOEXCEPT { return !empty(); }
};

//! Result of a FolderSync round trip
struct folder_hierarchy final
{
    std::string sync_key;
    int status;
    std::vector<folder> added;
    std::vector<folder> updated;
    std::vector<std::string> deleted;

    folder_hierarchy() : status(1) {}
};

namespace internal
{
    // Status codes 140 to 144 are shared by all commands (MS-ASCMD common
    // status codes) and ask for a (re-)provisioning of the device
    inline bool is_provisioning_status(int status) EAS_NOEXCEPT
    {
        return status >= 140 && status <= 144;
    }

    //! Throws status_error if status is not 1 (Sync)
    inline void check_sync_status(int status, const std::string& what)
    {
        if (status == 1)
        {
            return;
        }
        if (is_provisioning_status(status))
        {
            throw status_error(error_code::provisioning_required,
                               what + ": device must be provisioned", status);
        }
        switch (status)
        {
        case 3:
            throw status_error(error_code::invalid_sync_key,
                               what + ": invalid sync key", status);
        case 8:
            throw status_error(error_code::item_not_found,
                               what + ": object not found", status);
        case 9:
            throw status_error(error_code::quota_exceeded,
                               what + ": mailbox quota exceeded", status);
        case 12:
            throw status_error(error_code::folder_not_found,
                               what + ": folder hierarchy has changed",
                               status);
        default:
            throw status_error(error_code::server_status,
                               what + ": server returned status " +
                                   std::to_string(status),
                               status);
        }
    }

    //! Throws status_error if status is not 1 (FolderSync, FolderCreate,
    //! FolderUpdate, FolderDelete)
    inline void check_folder_status(int status, const std::string& what)
    {
        if (status == 1)
        {
            return;
        }
        if (is_provisioning_status(status))
        {
            throw status_error(error_code::provisioning_required,
                               what + ": device must be provisioned", status);
        }
        switch (status)
        {
        case 4:
        case 5:
            throw status_error(error_code::folder_not_found,
                               what + ": folder not found", status);
        case 9:
            throw status_error(error_code::invalid_sync_key,
                               what + ": invalid folder sync key", status);
        default:
            throw status_error(error_code::server_status,
                               what + ": server returned status " +
                                   std::to_string(status),
                               status);
        }
    }

    // Raised for a response that lacks something we cannot do without
    inline xml_parse_error missing_field(const std::string& field)
    {
        return xml_parse_error("Response is missing expected field <" +
                               field + ">");
    }

    // Top-level status of a response (the first Status outside any item
    // block); absent status means success
    inline int response_status(const std::string& xml)
    {
        return extract_int(xml, "Status").value_or(1);
    }

    inline folder parse_folder(const std::string& block)
    {
        folder f;
        f.server_id = extract(block, "ServerId").value_or("");
        f.parent_id = extract(block, "ParentId").value_or("");
        f.display_name = extract(block, "DisplayName").value_or("");
        f.type = folder_type_from_int(extract_int(block, "Type").value_or(18));
        return f;
    }

    //! Parses a FolderSync response
    inline folder_hierarchy parse_folder_sync_response(const std::string& xml)
    {
        folder_hierarchy res;
        const auto changes = extract_block(xml, "Changes").value_or("");
        res.status = response_status(remove_blocks(xml, "Changes"));
        res.sync_key = extract(xml, "SyncKey").value_or("");

        for (const auto& block : extract_all_blocks(changes, "Add"))
        {
            res.added.emplace_back(parse_folder(block));
        }
        for (const auto& block : extract_all_blocks(changes, "Update"))
        {
            res.updated.emplace_back(parse_folder(block));
        }
        for (const auto& block : extract_all_blocks(changes, "Delete"))
        {
            const auto id = extract(block, "ServerId");
            if (id.has_value())
            {
                res.deleted.push_back(id.value());
            }
        }
        return res;
    }

    //! Parses the response to FolderCreate, FolderUpdate or FolderDelete:
    //! the new hierarchy sync key and, for FolderCreate, the new id
    struct folder_change_response
    {
        int status;
        std::string sync_key;
        std::string server_id;
    };

    inline folder_change_response
    parse_folder_change_response(const std::string& xml)
    {
        folder_change_response res;
        res.status = response_status(xml);
        res.sync_key = extract(xml, "SyncKey").value_or("");
        res.server_id = extract(xml, "ServerId").value_or("");
        return res;
    }

    inline std::vector<sync_item> parse_sync_items(const std::string& commands,
                                                   const std::string& tag)
    {
        std::vector<sync_item> items;
        for (const auto& block : extract_all_blocks(commands, tag))
        {
            items.emplace_back(
                extract(block, "ServerId").value_or(""),
                extract_block(block, "ApplicationData").value_or(""));
        }
        return items;
    }

    inline std::vector<sync_reply>
    parse_sync_replies(const std::string& responses)
    {
        static const std::pair<const char*, sync_reply::kind> kinds[] = {
            {"Add", sync_reply::kind::add},
            {"Change", sync_reply::kind::change},
            {"Delete", sync_reply::kind::remove},
            {"Fetch", sync_reply::kind::fetch}};

        std::vector<sync_reply> replies;
        for (const auto& k : kinds)
        {
            for (const auto& block : extract_all_blocks(responses, k.first))
            {
                sync_reply reply;
                reply.type = k.second;
                reply.client_id = extract(block, "ClientId").value_or("");
                reply.server_id = extract(block, "ServerId").value_or("");
                reply.status = extract_int(block, "Status").value_or(1);
                replies.emplace_back(std::move(reply));
            }
        }
        return replies;
    }

    //! \brief Parses a Sync response for one collection.
    //!
    //! An empty body is how the server says "nothing changed"; it yields a
    //! successful, empty batch without a new sync key. Does not throw on a
    //! non-success status; callers check batch.status.
    inline sync_batch parse_sync_response(const std::string& xml,
                                          const std::string& collection_id)
    {
        sync_batch batch;
        batch.collection_id = collection_id;
        if (trim(xml).empty())
        {
            return batch;
        }

        std::string collection;
        bool found = false;
        for (const auto& block : extract_all_blocks(xml, "Collection"))
        {
            const auto id = extract(block, "CollectionId");
            if (!id.has_value() || id.value() == collection_id)
            {
                collection = block;
                found = true;
                break;
            }
        }
        if (!found)
        {
            // Errors such as a malformed request are reported without any
            // collection
            batch.status = response_status(remove_blocks(xml, "Collections"));
            return batch;
        }

        const auto commands =
            extract_block(collection, "Commands").value_or("");
        const auto responses =
            extract_block(collection, "Responses").value_or("");
        const auto head =
            remove_blocks(remove_blocks(collection, "Commands"), "Responses");

        batch.status = response_status(head);
        batch.sync_key = extract(head, "SyncKey").value_or("");
        batch.more_available = extract_block(head, "MoreAvailable").has_value();

        batch.added = parse_sync_items(commands, "Add");
        batch.changed = parse_sync_items(commands, "Change");
        for (const auto& tag : {"Delete", "SoftDelete"})
        {
            for (const auto& block : extract_all_blocks(commands, tag))
            {
                const auto id = extract(block, "ServerId");
                if (id.has_value())
                {
                    batch.deleted.push_back(id.value());
                }
            }
        }
        batch.replies = parse_sync_replies(responses);
        return batch;
    }

    inline category_set parse_categories(const std::string& data)
    {
        const auto block = extract_block(data, "Categories");
        if (!block.has_value())
        {
            return category_set();
        }
        const auto values = extract_all(block.value(), "Category");
        return category_set(values.begin(), values.end());
    }

    // Text of airsyncbase:Body/airsyncbase:Data
    inline std::string parse_body(const std::string& data)
    {
        const auto body = extract_block(data, "Body");
        if (!body.has_value())
        {
            return std::string();
        }
        return extract(body.value(), "Data").value_or("");
    }

    inline note parse_note(const sync_item& item,
                           const std::string& collection_id)
    {
        const auto& data = item.application_data;
        note n;
        n.server_id = item.server_id;
        n.folder_id = collection_id;
        n.subject = extract(data, "Subject").value_or("");
        n.body = parse_body(data);
        n.categories = parse_categories(data);
        n.last_modified = extract(data, "LastModifiedDate").value_or("");
        return n;
    }

    inline std::string parse_message_class(const sync_item& item)
    {
        return extract(item.application_data, "MessageClass").value_or("");
    }

    inline task parse_task(const sync_item& item,
                           const std::string& collection_id)
    {
        const auto& data = item.application_data;
        task t;
        t.server_id = item.server_id;
        t.folder_id = collection_id;
        t.subject = extract(data, "Subject").value_or("");
        t.body = parse_body(data);
        t.categories = parse_categories(data);
        t.priority =
            importance_from_int(extract_int(data, "Importance").value_or(1));
        t.complete = extract_int(data, "Complete").value_or(0) == 1;
        t.due_date = extract(data, "UtcDueDate")
                         .value_or(extract(data, "DueDate").value_or(""));
        t.start_date = extract(data, "UtcStartDate")
                           .value_or(extract(data, "StartDate").value_or(""));
        return t;
    }

    inline mail_message parse_mail_message(const sync_item& item,
                                           const std::string& collection_id)
    {
        const auto& data = item.application_data;
        mail_message msg;
        msg.server_id = item.server_id;
        msg.folder_id = collection_id;
        msg.subject = extract(data, "Subject").value_or("");
        msg.from = extract(data, "From").value_or("");
        msg.to = extract(data, "To").value_or("");
        msg.cc = extract(data, "Cc").value_or("");
        msg.date_received = extract(data, "DateReceived").value_or("");
        msg.body = parse_body(data);
        msg.message_class = extract(data, "MessageClass").value_or("");
        msg.read = extract_int(data, "Read").value_or(0) == 1;
        msg.priority =
            importance_from_int(extract_int(data, "Importance").value_or(1));
        return msg;
    }

    //! Parses a MoveItems response, one result per Response element
    inline std::vector<move_result> parse_move_response(const std::string& xml)
    {
        std::vector<move_result> results;
        for (const auto& block : extract_all_blocks(xml, "Response"))
        {
            move_result res;
            res.source_id = extract(block, "SrcMsgId").value_or("");
            res.destination_id = extract(block, "DstMsgId").value_or("");
            res.status = extract_int(block, "Status").value_or(0);
            results.emplace_back(std::move(res));
        }
        return results;
    }

    //! Throws status_error unless the move succeeded (status 3)
    inline void check_move_status(const move_result& res)
    {
        switch (res.status)
        {
        case 3:
            return;
        case 1:
            throw status_error(error_code::item_not_found,
                               "MoveItems: invalid source item " +
                                   res.source_id,
                               res.status);
        case 2:
            throw status_error(error_code::folder_not_found,
                               "MoveItems: invalid destination folder",
                               res.status);
        case 4:
            throw status_error(error_code::server_status,
                               "MoveItems: source and destination are the "
                               "same folder",
                               res.status);
        default:
            throw status_error(error_code::server_status,
                               "MoveItems: server returned status " +
                                   std::to_string(res.status),
                               res.status);
        }
    }

    //! Status of the Search command and of its Store
    inline void check_search_status(const std::string& xml)
    {
        const auto store = extract_block(xml, "Store").value_or("");
        const auto outer = response_status(remove_blocks(xml, "Response"));
        const auto inner = response_status(remove_blocks(store, "Result"));
        for (const auto status : {outer, inner})
        {
            if (status == 1)
            {
                continue;
            }
            if (is_provisioning_status(status))
            {
                throw status_error(error_code::provisioning_required,
                                   "Search: device must be provisioned",
                                   status);
            }
            throw status_error(error_code::server_status,
                               "Search: server returned status " +
                                   std::to_string(status),
                               status);
        }
    }

    inline std::vector<gal_entry>
    parse_gal_search_response(const std::string& xml)
    {
        check_search_status(xml);

        std::vector<gal_entry> entries;
        for (const auto& block : extract_all_blocks(xml, "Result"))
        {
            const auto props = extract_block(block, "Properties");
            if (!props.has_value())
            {
                continue;
            }
            const auto& p = props.value();
            gal_entry entry;
            entry.display_name = extract(p, "DisplayName").value_or("");
            entry.email_address = extract(p, "EmailAddress").value_or("");
            entry.first_name = extract(p, "FirstName").value_or("");
            entry.last_name = extract(p, "LastName").value_or("");
            entry.company = extract(p, "Company").value_or("");
            entry.title = extract(p, "Title").value_or("");
            entry.phone = extract(p, "Phone").value_or("");
            entry.office = extract(p, "Office").value_or("");
            entries.emplace_back(std::move(entry));
        }
        return entries;
    }

    inline std::vector<search_hit>
    parse_mailbox_search_response(const std::string& xml)
    {
        check_search_status(xml);

        std::vector<search_hit> hits;
        for (const auto& block : extract_all_blocks(xml, "Result"))
        {
            const auto props = extract_block(block, "Properties");
            if (!props.has_value())
            {
                continue;
            }
            search_hit hit;
            hit.long_id = extract(block, "LongId").value_or("");
            hit.collection_id = extract(block, "CollectionId").value_or("");
            hit.subject = extract(props.value(), "Subject").value_or("");
            hit.from = extract(props.value(), "From").value_or("");
            hit.date_received =
                extract(props.value(), "DateReceived").value_or("");
            hit.preview = parse_body(props.value());
            hits.emplace_back(std::move(hit));
        }
        return hits;
    }

    //! Parsed Provision response
    struct provision_response
    {
        int status;
        int policy_status;
        std::string policy_key;
    };

    inline provision_response parse_provision_response(const std::string& xml)
    {
        const auto policy = extract_block(xml, "Policy").value_or("");
        provision_response res;
        res.status = response_status(remove_blocks(xml, "Policies"));
        res.policy_status = response_status(remove_blocks(policy, "Data"));
        res.policy_key = extract(policy, "PolicyKey").value_or("");
        return res;
    }

    // EWS responses. These are well-formed SOAP documents, parsed with
    // RapidXml.

    //! One m:*ResponseMessage element
    struct ews_response_message
    {
        std::string response_class;
        std::string response_code;
        std::string message_text;
        const rapidxml::xml_node<>* node;

        bool success() const { return response_class == "Success"; }
    };

    //! Throws soap_fault if the document is a SOAP fault
    inline void check_soap_fault(const xml_document& doc)
    {
        const auto root = doc.root();
        check<xml_parse_error>(root != nullptr, "Empty SOAP response");
        const auto fault = get_element_by_local_name(*root, "Fault");
        if (fault == nullptr)
        {
            return;
        }
        const auto faultstring =
            get_element_by_local_name(*fault, "faultstring");
        throw soap_fault(faultstring ? node_value(*faultstring)
                                     : std::string("SOAP fault"));
    }

    inline std::vector<ews_response_message>
    parse_ews_response_messages(const xml_document& doc)
    {
        check_soap_fault(doc);

        const auto messages =
            get_element_by_local_name(*doc.root(), "ResponseMessages");
        if (messages == nullptr)
        {
            throw missing_field("ResponseMessages");
        }

        std::vector<ews_response_message> res;
        for (auto child = messages->first_node(); child != nullptr;
             child = child->next_sibling())
        {
            if (child->type() != rapidxml::node_element)
            {
                continue;
            }
            ews_response_message msg;
            msg.response_class =
                get_attribute(*child, "ResponseClass").value_or("");
            const auto code = get_child(*child, "ResponseCode");
            msg.response_code = code ? node_value(*code) : std::string();
            const auto text = get_child(*child, "MessageText");
            msg.message_text = text ? node_value(*text) : std::string();
            msg.node = child;
            res.emplace_back(std::move(msg));
        }
        return res;
    }

    // Maps an unsuccessful EWS response message to a status_error
    inline status_error ews_error(const ews_response_message& msg)
    {
        const auto& code = msg.response_code;
        auto what = code;
        if (!msg.message_text.empty())
        {
            what += ": " + msg.message_text;
        }
        if (code == "ErrorItemNotFound")
        {
            return status_error(error_code::item_not_found, what);
        }
        if (code == "ErrorFolderNotFound")
        {
            return status_error(error_code::folder_not_found, what);
        }
        if (code == "ErrorQuotaExceeded" || code == "ErrorMessageSizeExceeded")
        {
            return status_error(error_code::quota_exceeded, what);
        }
        if (code == "ErrorInvalidSyncStateData")
        {
            return status_error(error_code::invalid_sync_key, what);
        }
        if (code == "ErrorInvalidServerVersion" ||
            code == "ErrorInvalidRequest")
        {
            return status_error(error_code::not_supported, what);
        }
        return status_error(error_code::server_status, what);
    }

    //! Id and change key of an item as returned by EWS
    struct ews_item_id
    {
        std::string id;
        std::string change_key;
    };

    // All t:ItemId elements below node, in document order
    inline std::vector<ews_item_id>
    ews_item_ids_in(const rapidxml::xml_node<>& node)
    {
        std::vector<ews_item_id> ids;
        for (const auto elem : get_elements_by_local_name(node, "ItemId"))
        {
            ews_item_id item;
            item.id = get_attribute(*elem, "Id").value_or("");
            item.change_key = get_attribute(*elem, "ChangeKey").value_or("");
            if (!item.id.empty())
            {
                ids.emplace_back(std::move(item));
            }
        }
        return ids;
    }

    // Text of the first descendant with given local name, or empty
    inline std::string ews_text(const rapidxml::xml_node<>& node,
                                const std::string& name)
    {
        const auto elem = get_element_by_local_name(node, name);
        return elem ? node_value(*elem) : std::string();
    }

    inline category_set ews_categories_in(const rapidxml::xml_node<>& item)
    {
        category_set res;
        const auto cats = get_child(item, "Categories");
        if (cats != nullptr)
        {
            for (const auto str : get_elements_by_local_name(*cats, "String"))
            {
                res.insert(node_value(*str));
            }
        }
        return res;
    }

    //! An item listed by FindItem: its id and item class
    struct ews_found_item
    {
        std::string id;
        std::string item_class;
    };

    //! The items of a FindItem response
    inline std::vector<ews_found_item>
    parse_ews_find_item_response(const xml_document& doc)
    {
        std::vector<ews_found_item> found;
        for (const auto& msg : parse_ews_response_messages(doc))
        {
            if (!msg.success())
            {
                throw ews_error(msg);
            }
            const auto items = get_element_by_local_name(*msg.node, "Items");
            if (items == nullptr)
            {
                continue;
            }
            for (auto item = items->first_node(); item != nullptr;
                 item = item->next_sibling())
            {
                if (item->type() != rapidxml::node_element)
                {
                    continue;
                }
                const auto ids = ews_item_ids_in(*item);
                if (ids.empty())
                {
                    continue;
                }
                ews_found_item f;
                f.id = ids.front().id;
                f.item_class = ews_text(*item, "ItemClass");
                found.emplace_back(std::move(f));
            }
        }
        return found;
    }

    // The first item element of each successful GetItem response message;
    // items that vanished in the meantime are skipped
    inline std::vector<const rapidxml::xml_node<>*>
    ews_items_of(const std::vector<ews_response_message>& messages)
    {
        std::vector<const rapidxml::xml_node<>*> res;
        for (const auto& msg : messages)
        {
            if (!msg.success())
            {
                if (msg.response_code == "ErrorItemNotFound")
                {
                    continue;
                }
                throw ews_error(msg);
            }
            const auto items = get_child(*msg.node, "Items");
            if (items == nullptr)
            {
                continue;
            }
            for (auto item = items->first_node(); item != nullptr;
                 item = item->next_sibling())
            {
                if (item->type() == rapidxml::node_element)
                {
                    res.push_back(item);
                    break;
                }
            }
        }
        return res;
    }

    //! One batch of a SyncFolderItems response
    struct ews_sync_changes
    {
        std::string sync_state;
        bool includes_last_item;

        //! Ids of created or updated items
        std::vector<std::string> upserted;
        std::vector<std::string> deleted;

        ews_sync_changes() : includes_last_item(true) {}
    };

    inline ews_sync_changes
    parse_ews_sync_folder_items_response(const xml_document& doc)
    {
        const auto messages = parse_ews_response_messages(doc);
        if (messages.empty())
        {
            throw missing_field("SyncFolderItemsResponseMessage");
        }
        const auto& msg = messages.front();
        if (!msg.success())
        {
            throw ews_error(msg);
        }

        ews_sync_changes res;
        const auto state = get_child(*msg.node, "SyncState");
        if (state == nullptr)
        {
            throw missing_field("SyncState");
        }
        res.sync_state = node_value(*state);
        const auto last = get_child(*msg.node, "IncludesLastItemInRange");
        res.includes_last_item =
            last == nullptr || node_value(*last) != "false";

        const auto changes = get_child(*msg.node, "Changes");
        if (changes == nullptr)
        {
            return res;
        }
        for (auto change = changes->first_node(); change != nullptr;
             change = change->next_sibling())
        {
            if (change->type() != rapidxml::node_element)
            {
                continue;
            }
            const auto kind = local_name(*change);
            const auto ids = ews_item_ids_in(*change);
            if (ids.empty())
            {
                continue;
            }
            if (kind == "Create" || kind == "Update")
            {
                res.upserted.push_back(ids.front().id);
            }
            else if (kind == "Delete")
            {
                res.deleted.push_back(ids.front().id);
            }
            // ReadFlagChange does not concern notes
        }
        return res;
    }

    inline note parse_ews_note(const rapidxml::xml_node<>& item,
                               const std::string& folder_id)
    {
        note n;
        const auto ids = ews_item_ids_in(item);
        n.server_id = ids.empty() ? std::string() : ids.front().id;
        n.folder_id = folder_id;
        n.subject = ews_text(item, "Subject");
        n.body = ews_text(item, "Body");
        n.categories = ews_categories_in(item);
        n.last_modified = ews_text(item, "LastModifiedTime");
        return n;
    }

    inline task parse_ews_task(const rapidxml::xml_node<>& item,
                               const std::string& folder_id)
    {
        task t;
        const auto ids = ews_item_ids_in(item);
        t.server_id = ids.empty() ? std::string() : ids.front().id;
        t.folder_id = folder_id;
        t.subject = ews_text(item, "Subject");
        t.body = ews_text(item, "Body");
        t.categories = ews_categories_in(item);
        t.priority = importance_from_str(ews_text(item, "Importance"));
        t.due_date = ews_text(item, "DueDate");
        t.start_date = ews_text(item, "StartDate");
        t.complete = ews_text(item, "Status") == "Completed";
        return t;
    }

    inline gal_entry
    parse_ews_resolution(const rapidxml::xml_node<>& resolution)
    {
        gal_entry entry;
        const auto mailbox = get_child(resolution, "Mailbox");
        if (mailbox != nullptr)
        {
            entry.display_name = ews_text(*mailbox, "Name");
            entry.email_address = ews_text(*mailbox, "EmailAddress");
        }
        const auto contact = get_child(resolution, "Contact");
        if (contact != nullptr)
        {
            if (entry.display_name.empty())
            {
                entry.display_name = ews_text(*contact, "DisplayName");
            }
            entry.first_name = ews_text(*contact, "GivenName");
            entry.last_name = ews_text(*contact, "Surname");
            entry.company = ews_text(*contact, "CompanyName");
            entry.title = ews_text(*contact, "JobTitle");
            entry.office = ews_text(*contact, "OfficeLocation");
            const auto phone =
                get_element_by_local_name(*contact, "PhoneNumbers");
            if (phone != nullptr)
            {
                entry.phone = ews_text(*phone, "Entry");
            }
        }
        return entry;
    }
} // namespace internal
} // namespace eas
