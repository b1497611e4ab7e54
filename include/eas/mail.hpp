
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
#include "notes.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "sync.hpp"
#include "types.hpp"

namespace eas
{
//! Messages that changed in one mail folder since the last sync
struct mail_changes final
{
    std::string collection_id;
    std::vector<mail_message> upserted;
    std::vector<std::string> deleted;
    bool more_available;

    mail_changes() : more_available(false) {}
};

//! Mail folders over ActiveSync
class mail_service final
{
public:
    mail_service(command_executor& executor, sync_key_provider& keys)
        : executor_(executor), keys_(keys)
    {
    }

    //! \brief Fetches the next batch of changes of a mail folder and hands
    //! it to apply.
    //!
    //! The folder's sync key advances only after apply returned; if apply
    //! throws, the same changes are delivered again. Returns whether more
    //! changes are waiting.
    result<bool>
    sync_messages(const std::string& collection_id,
                  const std::function<void(const mail_changes&)>& apply,
                  const sync_options& options = sync_options())
    {
        return internal::capture<bool>([&]() {
            const auto batch = internal::fetch_batch(executor_, keys_,
                                                     collection_id, options);
            mail_changes changes;
            changes.collection_id = collection_id;
            for (const auto* items : {&batch.added, &batch.changed})
            {
                for (const auto& item : *items)
                {
                    changes.upserted.emplace_back(
                        internal::parse_mail_message(item, collection_id));
                }
            }
            changes.deleted = batch.deleted;
            changes.more_available = batch.more_available;

            apply(changes);
            if (!batch.sync_key.empty())
            {
                keys_.advance(collection_id, batch.sync_key);
            }
            return batch.more_available;
        });
    }

    //! Sets or clears the read flag of messages in one folder
    result<bool> mark_read(const std::string& collection_id,
                           const std::vector<std::string>& server_ids,
                           bool read)
    {
        return internal::capture<bool>([&]() {
            if (server_ids.empty())
            {
                return true;
            }
            const auto batch = internal::send_changes(
                executor_, keys_, collection_id, [&](const std::string& key) {
                    return internal::mark_read_request(key, collection_id,
                                                       server_ids, read);
                });
            internal::check_replies(batch, sync_reply::kind::change,
                                    "Changing read flag");
            return true;
        });
    }

    //! Moves messages to Deleted Items
    result<bool> delete_messages(const std::string& collection_id,
                                 const std::vector<std::string>& server_ids)
    {
        return remove(collection_id, server_ids, true);
    }

    //! Deletes messages for good
    result<bool>
    delete_messages_permanently(const std::string& collection_id,
                                const std::vector<std::string>& server_ids)
    {
        return remove(collection_id, server_ids, false);
    }

private:
    result<bool> remove(const std::string& collection_id,
                        const std::vector<std::string>& server_ids,
                        bool deletes_as_moves)
    {
        return internal::capture<bool>([&]() {
            if (server_ids.empty())
            {
                return true;
            }
            const auto batch = internal::send_changes(
                executor_, keys_, collection_id, [&](const std::string& key) {
                    return internal::delete_request(key, collection_id,
                                                    server_ids,
                                                    deletes_as_moves);
                });
            internal::check_replies(batch, sync_reply::kind::remove,
                                    "Deleting messages");
            return true;
        });
    }

    command_executor& executor_;
    sync_key_provider& keys_;
};
} // namespace eas
