
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

#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "folders.hpp"
#include "http.hpp"
#include "mail.hpp"
#include "move.hpp"
#include "notes.hpp"
#include "search.hpp"
#include "sync.hpp"
#include "tasks.hpp"

namespace eas
{
//! \brief A mailbox on an Exchange server.
//!
//! Owns one connection and everything bound to it: the sync keys, the
//! folder cache and the entity services. Operations are blocking and a
//! client must not be used from several threads at once; cancel() is the
//! exception and may be called from any thread.
template <typename RequestHandler = internal::http_request>
class basic_client final
{
public:
    explicit basic_client(connection_settings settings)
        : ctx_(std::move(settings)), executor_(ctx_),
          versions_(ctx_, executor_),
          caps_(versions_), engine_(executor_, keys_),
          folders_(ctx_, executor_),
          native_notes_(executor_, folders_, engine_),
          ews_notes_(executor_, versions_, keys_),
          native_tasks_(executor_, folders_, engine_),
          ews_tasks_(executor_, versions_), native_gal_(executor_),
          ews_gal_(executor_, versions_),
          notes_(caps_, native_notes_, ews_notes_),
          tasks_(caps_, native_tasks_, ews_tasks_), mail_(executor_, engine_),
          moves_(executor_), search_(caps_, executor_, native_gal_, ews_gal_)
    {
    }

    basic_client(const basic_client&) = delete;
    basic_client& operator=(const basic_client&) = delete;

    notes_service& notes() EAS_NOEXCEPT { return notes_; }
    tasks_service& tasks() EAS_NOEXCEPT { return tasks_; }
    mail_service& mail() EAS_NOEXCEPT { return mail_; }
    folder_service& folders() EAS_NOEXCEPT { return folders_; }
    move_service& moves() EAS_NOEXCEPT { return moves_; }
    search_service& search() EAS_NOEXCEPT { return search_; }
    sync_engine& sync() EAS_NOEXCEPT { return engine_; }
    sync_key_store& keys() EAS_NOEXCEPT { return keys_; }
    connection_context& context() EAS_NOEXCEPT { return ctx_; }

    basic_command_executor<RequestHandler>& executor() EAS_NOEXCEPT
    {
        return executor_;
    }

    //! The protocol version used for this connection, detected on first use
    result<std::string> detect_version()
    {
        return internal::capture<std::string>(
            [&]() { return versions_.protocol_version(); });
    }

    //! Runs the Provision exchange and returns the new policy key
    result<std::string> provision()
    {
        return internal::capture<std::string>([&]() {
            provisioner p(ctx_, executor_);
            return p.provision();
        });
    }

    //! Aborts the running operation with error_code::cancelled
    void cancel() EAS_NOEXCEPT { ctx_.cancel(); }

    //! Allows new operations after cancel()
    void resume() EAS_NOEXCEPT { ctx_.reset_cancellation(); }

private:
    connection_context ctx_;
    basic_command_executor<RequestHandler> executor_;
    version_detector versions_;
    capability_resolver caps_;
    sync_key_store keys_;
    sync_engine engine_;
    folder_service folders_;
    native_notes_backend native_notes_;
    ews_notes_backend ews_notes_;
    native_tasks_backend native_tasks_;
    ews_tasks_backend ews_tasks_;
    native_gal_backend native_gal_;
    ews_gal_backend ews_gal_;
    notes_service notes_;
    tasks_service tasks_;
    mail_service mail_;
    move_service moves_;
    search_service search_;
};

typedef basic_client<> client;
} // namespace eas
