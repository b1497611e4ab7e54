
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
#include <vector>

#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "folders.hpp"
#include "notes.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "sync.hpp"
#include "types.hpp"

namespace eas
{
//! One protocol's implementation of the task operations; see tasks_service
class tasks_backend
{
public:
    virtual ~tasks_backend() = default;

    virtual std::string create_task(const task& t) = 0;
    virtual void update_task(const task& t) = 0;
    virtual void delete_task(const std::string& server_id) = 0;
    virtual void delete_task_permanently(const std::string& server_id) = 0;
    virtual std::vector<task> sync_tasks() = 0;
};

//! Tasks over ActiveSync (protocol version 14.0 and later)
class native_tasks_backend final : public tasks_backend
{
public:
    native_tasks_backend(command_executor& executor, folder_lookup& folders,
                         sync_key_provider& keys)
        : executor_(executor), folders_(folders), keys_(keys)
    {
    }

    std::string create_task(const task& t) override
    {
        const auto collection = folders_.find_folder_id(folder_type::tasks);
        const auto client_id = internal::make_client_id();
        const auto batch = internal::send_changes(
            executor_, keys_, collection, [&](const std::string& key) {
                return internal::task_create_request(key, collection,
                                                     client_id, t);
            });
        return internal::added_server_id(batch, client_id, "Creating task");
    }

    void update_task(const task& t) override
    {
        internal::check_item_id(t.server_id);
        const auto collection = folders_.find_folder_id(folder_type::tasks);
        const auto batch = internal::send_changes(
            executor_, keys_, collection, [&](const std::string& key) {
                return internal::task_update_request(key, collection,
                                                     t.server_id, t);
            });
        internal::check_replies(batch, sync_reply::kind::change,
                                "Updating task " + t.server_id);
    }

    void delete_task(const std::string& server_id) override
    {
        remove(server_id, folder_type::tasks, true);
    }

    void delete_task_permanently(const std::string& server_id) override
    {
        remove(server_id, folder_type::deleted_items, false);
    }

    std::vector<task> sync_tasks() override
    {
        folders_.refresh_folders();
        const auto collection = folders_.find_folder_id(folder_type::tasks);
        keys_.reset(collection);

        std::vector<task> res;
        for (int round = 0; round < internal::max_sync_rounds(); ++round)
        {
            const auto batch = internal::fetch_batch(
                executor_, keys_, collection, sync_options());
            for (const auto& item : batch.added)
            {
                res.emplace_back(internal::parse_task(item, collection));
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
                                "Deleting task " + server_id);
    }

    command_executor& executor_;
    folder_lookup& folders_;
    sync_key_provider& keys_;
};

//! Tasks over EWS
class ews_tasks_backend final : public tasks_backend
{
public:
    ews_tasks_backend(soap_executor& executor, version_source& versions)
        : executor_(executor), versions_(versions)
    {
    }

    std::string create_task(const task& t) override
    {
        const auto doc =
            internal::send_ews(executor_, versions_, "CreateItem",
                               internal::ews_create_task_request(t));
        return internal::ews_created_item(*doc).id;
    }

    void update_task(const task& t) override
    {
        internal::check_item_id(t.server_id);
        const auto change_key =
            internal::ews_change_key(executor_, versions_, t.server_id);
        const auto doc = internal::send_ews(
            executor_, versions_, "UpdateItem",
            internal::ews_update_task_request(t.server_id, change_key, t));
        internal::single_message(*doc);
    }

    void delete_task(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        internal::ews_delete(executor_, versions_, server_id,
                             delete_type::move_to_deleted_items, true);
    }

    void delete_task_permanently(const std::string& server_id) override
    {
        internal::check_item_id(server_id);
        internal::ews_delete(executor_, versions_, server_id,
                             delete_type::hard_delete, true);
    }

    std::vector<task> sync_tasks() override
    {
        std::vector<std::string> ids;
        for (const auto& item :
             internal::ews_find(executor_, versions_, "tasks"))
        {
            ids.push_back(item.id);
        }

        std::vector<task> res;
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
            res.emplace_back(internal::parse_ews_task(*item, "tasks"));
        }
        return res;
    }

private:
    soap_executor& executor_;
    version_source& versions_;
};

//! \brief Tasks.
//!
//! Like notes_service, every operation picks ActiveSync or EWS by the
//! server's protocol version.
class tasks_service final
{
public:
    tasks_service(capability_resolver& caps, tasks_backend& native,
                  tasks_backend& soap)
        : caps_(caps), native_(native), soap_(soap)
    {
    }

    //! Creates a task and returns its server id. A task without due date
    //! is sent without any due date element.
    result<std::string> create_task(const task& t)
    {
        return run<std::string>(
            [&](tasks_backend& backend) { return backend.create_task(t); });
    }

    //! Overwrites the task with the server id t.server_id
    result<bool> update_task(const task& t)
    {
        return run<bool>([&](tasks_backend& backend) {
            backend.update_task(t);
            return true;
        });
    }

    result<bool> delete_task(const std::string& server_id)
    {
        return run<bool>([&](tasks_backend& backend) {
            backend.delete_task(server_id);
            return true;
        });
    }

    result<bool> delete_task_permanently(const std::string& server_id)
    {
        return run<bool>([&](tasks_backend& backend) {
            backend.delete_task_permanently(server_id);
            return true;
        });
    }

    result<std::vector<task>> sync_tasks()
    {
        return run<std::vector<task>>(
            [&](tasks_backend& backend) { return backend.sync_tasks(); });
    }

private:
    template <typename T, typename Function> result<T> run(Function func)
    {
        return internal::capture<T>([&]() {
            return internal::dispatch<T>(caps_, capability::tasks, native_,
                                         soap_, func);
        });
    }

    capability_resolver& caps_;
    tasks_backend& native_;
    tasks_backend& soap_;
};
} // namespace eas
