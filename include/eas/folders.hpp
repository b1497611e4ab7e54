
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

#include <map>
#include <string>
#include <vector>

#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "sync.hpp"
#include "types.hpp"

namespace eas
{
//! Resolves well-known folders to collection ids
class folder_lookup
{
public:
    virtual ~folder_lookup() = default;

    //! \brief Returns the id of the first folder of given type.
    //!
    //! Throws status_error with error_code::folder_not_found if there is
    //! none.
    virtual std::string find_folder_id(folder_type type) = 0;

    //! Synchronizes the folder hierarchy with the server
    virtual void refresh_folders() = 0;
};

//! \brief The folder hierarchy of a mailbox.
//!
//! Keeps a copy of the hierarchy that is updated incrementally by
//! FolderSync. The hierarchy sync key is stored in the connection context.
class folder_service final : public folder_lookup
{
public:
    folder_service(connection_context& ctx, command_executor& executor)
        : ctx_(ctx), executor_(executor)
    {
    }

    std::string find_folder_id(folder_type type) override
    {
        if (ctx_.folder_sync_key() == initial_sync_key())
        {
            refresh_folders();
        }
        for (const auto& entry : folders_)
        {
            if (entry.second.type == type)
            {
                return entry.first;
            }
        }
        throw status_error(error_code::folder_not_found,
                           "No folder of type " + internal::enum_to_str(type) +
                               " found");
    }

    void refresh_folders() override { apply(sync_hierarchy()); }

    //! \brief Synchronizes and returns the complete hierarchy.
    //!
    //! With full set the hierarchy is fetched from scratch.
    result<std::vector<folder>> sync_folders(bool full = false)
    {
        return internal::capture<std::vector<folder>>([&]() {
            if (full)
            {
                ctx_.set_folder_sync_key(initial_sync_key());
                folders_.clear();
            }
            refresh_folders();
            return cached_folders();
        });
    }

    //! The hierarchy as of the last synchronization
    std::vector<folder> cached_folders() const
    {
        std::vector<folder> res;
        for (const auto& entry : folders_)
        {
            res.push_back(entry.second);
        }
        return res;
    }

    //! Returns the id of the first folder of given type
    result<std::string> find_folder(folder_type type)
    {
        return internal::capture<std::string>(
            [&]() { return find_folder_id(type); });
    }

    //! Creates a folder below parent_id ("0" for the top level)
    result<folder> create_folder(const std::string& parent_id,
                                 const std::string& display_name,
                                 folder_type type)
    {
        return internal::capture<folder>([&]() {
            const auto res = change(
                "FolderCreate", [&](const std::string& key) {
                    return internal::folder_create_request(key, parent_id,
                                                           display_name, type);
                });
            if (res.server_id.empty())
            {
                throw internal::missing_field("ServerId");
            }
            folder f(res.server_id, parent_id, display_name, type);
            folders_[f.server_id] = f;
            return f;
        });
    }

    //! Renames and/or moves a folder
    result<bool> update_folder(const std::string& server_id,
                               const std::string& parent_id,
                               const std::string& display_name)
    {
        return internal::capture<bool>([&]() {
            change("FolderUpdate", [&](const std::string& key) {
                return internal::folder_update_request(key, server_id,
                                                       parent_id, display_name);
            });
            auto it = folders_.find(server_id);
            if (it != folders_.end())
            {
                it->second.parent_id = parent_id;
                it->second.display_name = display_name;
            }
            return true;
        });
    }

    result<bool> delete_folder(const std::string& server_id)
    {
        return internal::capture<bool>([&]() {
            change("FolderDelete", [&](const std::string& key) {
                return internal::folder_delete_request(key, server_id);
            });
            folders_.erase(server_id);
            return true;
        });
    }

private:
    folder_hierarchy sync_hierarchy()
    {
        const auto key = ctx_.folder_sync_key();
        auto res = internal::parse_folder_sync_response(executor_.send_command(
            "FolderSync", internal::folder_sync_request(key)));
        if (res.status == 9)
        {
            ctx_.set_folder_sync_key(initial_sync_key());
            folders_.clear();
        }
        internal::check_folder_status(res.status, "FolderSync");
        if (key == initial_sync_key())
        {
            folders_.clear();
        }
        return res;
    }

    void apply(const folder_hierarchy& changes)
    {
        for (const auto& id : changes.deleted)
        {
            folders_.erase(id);
        }
        for (const auto& f : changes.added)
        {
            folders_[f.server_id] = f;
        }
        for (const auto& f : changes.updated)
        {
            folders_[f.server_id] = f;
        }
        if (!changes.sync_key.empty())
        {
            ctx_.set_folder_sync_key(changes.sync_key);
        }
        internal::logger()->debug("Folder hierarchy has {} folders",
                                  folders_.size());
    }

    // Sends a hierarchy change. Requires a current hierarchy sync key.
    template <typename Builder>
    internal::folder_change_response change(const std::string& command,
                                            Builder build)
    {
        if (ctx_.folder_sync_key() == initial_sync_key())
        {
            refresh_folders();
        }
        const auto res = internal::parse_folder_change_response(
            executor_.send_command(command, build(ctx_.folder_sync_key())));
        if (res.status == 9)
        {
            ctx_.set_folder_sync_key(initial_sync_key());
        }
        internal::check_folder_status(res.status, command);
        if (!res.sync_key.empty())
        {
            ctx_.set_folder_sync_key(res.sync_key);
        }
        return res;
    }

    connection_context& ctx_;
    command_executor& executor_;
    std::map<std::string, folder> folders_;
};
} // namespace eas
