
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

#include <functional>
#include <string>
#include <vector>

#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "folders.hpp"
#include "logging.hpp"
#include "move.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "sync.hpp"
#include "types.hpp"
#include "xml.hpp"

namespace eas
{
//! Notes that changed on the server since the last sync
struct note_changes final
{
    //! Added or changed notes
    std::vector<note> upserted;
    std::vector<std::string> deleted;
    bool more_available;

    note_changes() : more_available(false) {}
};

//! \brief One protocol's implementation of the note operations.
//!
//! All functions throw on failure; notes_service turns exceptions into
//! results.
class notes_backend
{
public:
    virtual ~notes_backend() = default;

    //! Returns the server id of the new note
    virtual std::string create_note(const std::string& subject,
                                    const std::string& body,
                                    const category_set& categories) = 0;

    virtual void update_note(const std::string& server_id,
                             const std::string& subject,
                             const std::string& body,
                             const category_set& categories) = 0;

    //! Moves the note to Deleted Items
    virtual void delete_note(const std::string& server_id) = 0;

    //! Removes a note from Deleted Items for good
    virtual void delete_note_permanently(const std::string& server_id) = 0;

    //! Moves a note from Deleted Items back; returns its new server id
    virtual std::string restore_note(const std::string& server_id) = 0;

    //! All notes, including those in Deleted Items
    virtual std::vector<note> sync_notes() = 0;

    //! Incremental sync of the Notes folder
    virtual void sync_note_changes(
        const std::function<void(const note_changes&)>& apply) = 0;
};

namespace internal
{
    inline bool is_note_class(const std::string& message_class)
    {
        return message_class.empty() ||
               message_class.compare(0, 14, "IPM.StickyNote") == 0;
    }

    inline void check_item_id(const std::string& server_id)
    {
        if (server_id.empty())
        {
            throw status_error(error_code::item_not_found,
                               "Item has no server id");
        }
    }

    // Status of the replies of given kind; the server only sends replies
    // for Change and Delete if they failed
    inline void check_replies(const sync_batch& batch, sync_reply::kind type,
                              const std::string& what)
    {
        for (const auto& reply : batch.replies)
        {
            if (reply.type == type)
            {
                check_sync_status(reply.status, what);
            }
        }
    }

    //! Server id assigned to the item added with given client id
    inline std::string added_server_id(const sync_batch& batch,
                                       const std::string& client_id,
                                       const std::string& what)
    {
        for (const auto& reply : batch.replies)
        {
            if (reply.type != sync_reply::kind::add ||
                (!reply.client_id.empty() && reply.client_id != client_id))
            {
                continue;
            }
            check_sync_status(reply.status, what);
            if (reply.server_id.empty())
            {
                throw missing_field("ServerId");
            }
            return reply.server_id;
        }
        throw missing_field("Responses/Add");
    }

    // Upper bound of Sync round trips per collection and full sync
    inline int max_sync_rounds() EAS_NOEXCEPT { return 50; }
} // namespace internal

//! Notes over ActiveSync (protocol version 14.0 and later)
class native_notes_backend final : public notes_backend
{
public:
    native_notes_backend(command_executor& executor, folder_lookup& folders,
                         sync_key_provider& keys)
        : executor_(executor), folders_(folders), keys_(keys)
    {
    }

    std::string create_note(const std::string& subject,
                            const std::string& body,
                            const category_set& categories) override
    {
        const auto collection = folders_.find_folder_id(folder_type::notes);
        const auto client_id = internal::make_client_id();
        const auto batch = internal::send_changes(
            executor_, keys_, collection, [&](const std::string& key) {
                return internal::note_create_request(
                    key, collection, client_id, subject, body, categories);
            });
        return internal::added_server_id(batch, client_id, "Creating note");
    }

    void update_note(const std::string& server_id, const std::string& subject,
                     const std::string& body,
                     const category_set& categories) override
    {
        internal::check_item_id(server_id);
        const auto collection = folders_.find_folder_id(folder_type::notes);
        const auto batch = internal::send_changes(
            executor_, keys_, collection, [&](const std::string& key) {
                return internal::note_update_request(
                    key, collection, server_id, subject, body, categories);
            });
        internal::check_replies(batch, sync_reply::kind::change,
                                "Updating note " + server_id);
    }

    void delete_note(const std::string& server_id) override
    {
        remove(server_id, folder_type::notes, true);
    }

    void delete_note_permanently(const std::string& server_id) override
    {
        remove(server_id, folder_type::deleted_items, false);
    }

    std::string restore_note(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        const auto deleted =
            folders_.find_folder_id(folder_type::deleted_items);
        const auto notes = folders_.find_folder_id(folder_type::notes);
        return internal::move_item(executor_, server_id, deleted, notes);
    }

    std::vector<note> sync_notes() override
    {
        folders_.refresh_folders();
        const auto notes = folders_.find_folder_id(folder_type::notes);

        auto res = fetch_all(notes, false);

        std::string deleted;
        try
        {
            deleted = folders_.find_folder_id(folder_type::deleted_items);
        }
        catch (status_error& exc)
        {
            if (exc.code() != error_code::folder_not_found)
            {
                throw;
            }
            internal::logger()->debug("No Deleted Items folder: {}",
                                      exc.what());
        }
        if (!deleted.empty())
        {
            const auto trash = fetch_all(deleted, true);
            res.insert(res.end(), trash.begin(), trash.end());
        }
        return res;
    }

    void sync_note_changes(
        const std::function<void(const note_changes&)>& apply) override
    {
        const auto collection = folders_.find_folder_id(folder_type::notes);
        const auto batch = internal::fetch_batch(executor_, keys_, collection,
                                                 sync_options());
        note_changes changes;
        for (const auto* items : {&batch.added, &batch.changed})
        {
            for (const auto& item : *items)
            {
                changes.upserted.emplace_back(
                    internal::parse_note(item, collection));
            }
        }
        changes.deleted = batch.deleted;
        changes.more_available = batch.more_available;

        apply(changes);
        if (!batch.sync_key.empty())
        {
            keys_.advance(collection, batch.sync_key);
        }
    }

private:
    void remove(const std::string& server_id, folder_type type,
                bool deletes_as_moves)
    {
        internal::check_item_id(server_id);
        const auto collection = folders_.find_folder_id(type);
        const auto batch = internal::send_changes(
            executor_, keys_, collection, [&](const std::string& key) {
                return internal::delete_request(key, collection, server_id,
                                                deletes_as_moves);
            });
        internal::check_replies(batch, sync_reply::kind::remove,
                                "Deleting note " + server_id);
    }

    // Syncs a collection from scratch. Items in Deleted Items are kept only
    // if they are notes and are flagged as deleted.
    std::vector<note> fetch_all(const std::string& collection, bool trash)
    {
        keys_.reset(collection);

        std::vector<note> res;
        for (int round = 0; round < internal::max_sync_rounds(); ++round)
        {
            const auto batch = internal::fetch_batch(
                executor_, keys_, collection, sync_options());
            for (const auto& item : batch.added)
            {
                if (trash && !internal::is_note_class(
                                 internal::parse_message_class(item)))
                {
                    continue;
                }
                auto n = internal::parse_note(item, collection);
                n.is_deleted = trash;
                res.emplace_back(std::move(n));
            }
            if (!batch.sync_key.empty())
            {
                keys_.advance(collection, batch.sync_key);
            }
            if (!batch.more_available)
            {
                break;
            }
        }
        return res;
    }

    command_executor& executor_;
    folder_lookup& folders_;
    sync_key_provider& keys_;
};

namespace internal
{
    // Sends an EWS request and returns the parsed response document
    inline std::unique_ptr<xml_document> send_ews(soap_executor& executor,
                                                  version_source& versions,
                                                  const std::string& action,
                                                  const std::string& body)
    {
        const auto envelope = soap_envelope(
            body, ews_schema_for(versions.protocol_version()));
        return std::unique_ptr<xml_document>(
            new xml_document(executor.send_soap(action, envelope)));
    }

    // The single response message of a request about one item
    inline ews_response_message single_message(const xml_document& doc)
    {
        const auto messages = parse_ews_response_messages(doc);
        if (messages.empty())
        {
            throw missing_field("ResponseMessage");
        }
        if (!messages.front().success())
        {
            throw ews_error(messages.front());
        }
        return messages.front();
    }

    inline ews_item_id ews_created_item(const xml_document& doc)
    {
        const auto msg = single_message(doc);
        const auto ids = ews_item_ids_in(*msg.node);
        if (ids.empty())
        {
            throw missing_field("ItemId");
        }
        return ids.front();
    }

    //! Current change key of an item
    inline std::string ews_change_key(soap_executor& executor,
                                      version_source& versions,
                                      const std::string& item_id)
    {
        const auto doc = send_ews(executor, versions, "GetItem",
                                  ews_get_item_id_request(item_id));
        const auto id = ews_created_item(*doc);
        return id.change_key;
    }

    //! Deletes an item; an item that is already gone counts as deleted
    inline void ews_delete(soap_executor& executor, version_source& versions,
                           const std::string& item_id, delete_type del,
                           bool is_task)
    {
        const auto doc = send_ews(
            executor, versions, "DeleteItem",
            ews_delete_item_request(std::vector<std::string>{item_id}, del,
                                    is_task));
        for (const auto& msg : parse_ews_response_messages(*doc))
        {
            if (msg.success())
            {
                continue;
            }
            if (msg.response_code == "ErrorItemNotFound")
            {
                logger()->debug("Item {} was already deleted", item_id);
                continue;
            }
            throw ews_error(msg);
        }
    }

    //! Ids of the items FindItem lists in a distinguished folder
    inline std::vector<ews_found_item>
    ews_find(soap_executor& executor, version_source& versions,
             const std::string& distinguished_folder)
    {
        const auto doc =
            send_ews(executor, versions, "FindItem",
                     ews_find_item_request(distinguished_folder, 1000));
        return parse_ews_find_item_response(*doc);
    }
} // namespace internal

//! Notes over EWS, for servers whose ActiveSync lacks the Notes class
class ews_notes_backend final : public notes_backend
{
public:
    //! The SyncFolderItems state is kept in store under sync_state_id()
    ews_notes_backend(soap_executor& executor, version_source& versions,
                      sync_key_store& store)
        : executor_(executor), versions_(versions), store_(store)
    {
    }

    static const std::string& sync_state_id()
    {
        static const std::string id("ews:notes");
        return id;
    }

    std::string create_note(const std::string& subject,
                            const std::string& body,
                            const category_set& categories) override
    {
        const auto doc = internal::send_ews(
            executor_, versions_, "CreateItem",
            internal::ews_create_note_request(subject, body, categories));
        return internal::ews_created_item(*doc).id;
    }

    void update_note(const std::string& server_id, const std::string& subject,
                     const std::string& body,
                     const category_set& categories) override
    {
        internal::check_item_id(server_id);
        const auto change_key =
            internal::ews_change_key(executor_, versions_, server_id);
        const auto doc = internal::send_ews(
            executor_, versions_, "UpdateItem",
            internal::ews_update_note_request(server_id, change_key, subject,
                                              body, categories));
        internal::single_message(*doc);
    }

    void delete_note(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        internal::ews_delete(executor_, versions_, server_id,
                             delete_type::move_to_deleted_items, false);
    }

    void delete_note_permanently(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        internal::ews_delete(executor_, versions_, server_id,
                             delete_type::hard_delete, false);
    }

    std::string restore_note(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        const auto doc = internal::send_ews(
            executor_, versions_, "MoveItem",
            internal::ews_move_item_request(std::vector<std::string>{server_id},
                                            "notes"));
        return internal::ews_created_item(*doc).id;
    }

    std::vector<note> sync_notes() override
    {
        auto res = fetch("notes", false);
        const auto trash = fetch("deleteditems", true);
        res.insert(res.end(), trash.begin(), trash.end());
        return res;
    }

    void sync_note_changes(
        const std::function<void(const note_changes&)>& apply) override
    {
        const auto key = store_.key(sync_state_id());
        const auto state = key == initial_sync_key() ? std::string() : key;

        internal::ews_sync_changes batch;
        try
        {
            const auto doc = internal::send_ews(
                executor_, versions_, "SyncFolderItems",
                internal::ews_sync_folder_items_request("notes", state, 512));
            batch = internal::parse_ews_sync_folder_items_response(*doc);
        }
        catch (status_error& exc)
        {
            if (exc.code() == error_code::invalid_sync_key)
            {
                internal::logger()->warn("Notes sync state was rejected, "
                                         "notes must be synced from scratch");
                store_.reset(sync_state_id());
            }
            throw;
        }

        note_changes changes;
        changes.upserted = get_notes(batch.upserted, "notes");
        changes.deleted = batch.deleted;
        changes.more_available = !batch.includes_last_item;

        apply(changes);
        if (!batch.sync_state.empty())
        {
            store_.advance(sync_state_id(), batch.sync_state);
        }
    }

private:
    std::vector<note> fetch(const std::string& folder, bool trash)
    {
        std::vector<std::string> ids;
        for (const auto& item :
             internal::ews_find(executor_, versions_, folder))
        {
            if (!trash || internal::is_note_class(item.item_class))
            {
                ids.push_back(item.id);
            }
        }

        auto res = get_notes(ids, folder);
        for (auto& n : res)
        {
            n.is_deleted = trash;
        }
        return res;
    }

    // Notes that vanished since they were listed are skipped
    std::vector<note> get_notes(const std::vector<std::string>& ids,
                                const std::string& folder)
    {
        std::vector<note> res;
        if (ids.empty())
        {
            return res;
        }
        const auto doc =
            internal::send_ews(executor_, versions_, "GetItem",
                               internal::ews_get_items_request(ids));
        const auto messages = internal::parse_ews_response_messages(*doc);
        for (const auto item : internal::ews_items_of(messages))
        {
            res.emplace_back(internal::parse_ews_note(*item, folder));
        }
        return res;
    }

    soap_executor& executor_;
    version_source& versions_;
    sync_key_store& store_;
};

//! \brief Sticky notes.
//!
//! Each operation runs over ActiveSync if the server's protocol version
//! supports notes natively and over EWS otherwise. Inputs, outputs and
//! errors are the same on both paths.
class notes_service final
{
public:
    notes_service(capability_resolver& caps, notes_backend& native,
                  notes_backend& soap)
        : caps_(caps), native_(native), soap_(soap)
    {
    }

    //! Creates a note in the Notes folder and returns its server id
    result<std::string>
    create_note(const std::string& subject, const std::string& body,
                const category_set& categories = category_set())
    {
        return run<std::string>([&](notes_backend& backend) {
            return backend.create_note(subject, body, categories);
        });
    }

    result<bool> update_note(const std::string& server_id,
                             const std::string& subject,
                             const std::string& body,
                             const category_set& categories = category_set())
    {
        return run<bool>([&](notes_backend& backend) {
            backend.update_note(server_id, subject, body, categories);
            return true;
        });
    }

    //! Moves the note to Deleted Items; restore_note() brings it back
    result<bool> delete_note(const std::string& server_id)
    {
        return run<bool>([&](notes_backend& backend) {
            backend.delete_note(server_id);
            return true;
        });
    }

    //! Deletes a note that is in Deleted Items; this cannot be undone
    result<bool> delete_note_permanently(const std::string& server_id)
    {
        return run<bool>([&](notes_backend& backend) {
            backend.delete_note_permanently(server_id);
            return true;
        });
    }

    //! \brief Moves a note from Deleted Items back to Notes.
    //!
    //! The server assigns a new id; the old one must not be used anymore.
    result<std::string> restore_note(const std::string& server_id)
    {
        return run<std::string>([&](notes_backend& backend) {
            return backend.restore_note(server_id);
        });
    }

    //! All notes. Notes found in Deleted Items have is_deleted set.
    result<std::vector<note>> sync_notes()
    {
        return run<std::vector<note>>(
            [&](notes_backend& backend) { return backend.sync_notes(); });
    }

    //! \brief Fetches the changes of the Notes folder and hands them to
    //! apply.
    //!
    //! The sync key advances only after apply returned. Returns whether
    //! more changes are waiting.
    result<bool>
    sync_note_changes(const std::function<void(const note_changes&)>& apply)
    {
        return run<bool>([&](notes_backend& backend) {
            bool more = false;
            backend.sync_note_changes([&](const note_changes& changes) {
                more = changes.more_available;
                apply(changes);
            });
            return more;
        });
    }

private:
    template <typename T, typename Function> result<T> run(Function func)
    {
        return internal::capture<T>([&]() {
            return internal::dispatch<T>(caps_, capability::notes, native_,
                                         soap_, func);
        });
    }

    capability_resolver& caps_;
    notes_backend& native_;
    notes_backend& soap_;
};
} // namespace eas
