
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
#include <map>
#include <string>
#include <utility>

#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "requests.hpp"
#include "responses.hpp"

namespace eas
{
//! The sync key every collection starts with
inline const char* initial_sync_key() EAS_NOEXCEPT { return "0"; }

enum class sync_state
{
    //! The collection's key is "0"; the next sync starts from scratch
    unsynced,

    synced
};

//! \brief The sync keys of all collections of one connection.
//!
//! Keys only move forward through advance() and back to "0" through
//! reset(). Both notify the checkpoint callback so the caller can persist
//! the key right away.
class sync_key_store final
{
public:
    typedef std::function<void(const std::string& collection_id,
                               const std::string& sync_key)>
        checkpoint_callback;

    sync_key_store() = default;

    //! The current key of a collection, "0" if it was never synced
    std::string key(const std::string& collection_id) const
    {
        const auto it = keys_.find(collection_id);
        return it == keys_.end() ? initial_sync_key() : it->second;
    }

    sync_state state(const std::string& collection_id) const
    {
        return key(collection_id) == initial_sync_key() ? sync_state::unsynced
                                                        : sync_state::synced;
    }

    void advance(const std::string& collection_id, const std::string& sync_key)
    {
        check<exception>(!sync_key.empty(), "Cannot advance to an empty key");
        if (sync_key == initial_sync_key())
        {
            reset(collection_id);
            return;
        }
        keys_[collection_id] = sync_key;
        notify(collection_id, sync_key);
    }

    //! Forgets the key; idempotent
    void reset(const std::string& collection_id)
    {
        keys_.erase(collection_id);
        notify(collection_id, initial_sync_key());
    }

    //! Loads a key saved by a checkpoint callback; does not notify
    void restore(const std::string& collection_id, const std::string& sync_key)
    {
        if (sync_key.empty() || sync_key == initial_sync_key())
        {
            keys_.erase(collection_id);
            return;
        }
        keys_[collection_id] = sync_key;
    }

    void set_checkpoint_callback(checkpoint_callback callback)
    {
        checkpoint_ = std::move(callback);
    }

    //! Every collection that has a key other than "0"
    const std::map<std::string, std::string>& keys() const EAS_NOEXCEPT
    {
        return keys_;
    }

private:
    void notify(const std::string& collection_id, const std::string& sync_key)
    {
        if (checkpoint_)
        {
            checkpoint_(collection_id, sync_key);
        }
    }

    std::map<std::string, std::string> keys_;
    checkpoint_callback checkpoint_;
};

//! Hands out sync keys to the code that sends Sync commands
class sync_key_provider
{
public:
    virtual ~sync_key_provider() = default;

    //! The cached key; no network access
    virtual std::string current(const std::string& collection_id) = 0;

    //! A key that is valid right now; contacts the server if needed
    virtual std::string refresh(const std::string& collection_id) = 0;

    virtual void advance(const std::string& collection_id,
                         const std::string& sync_key) = 0;

    virtual void reset(const std::string& collection_id) = 0;
};

namespace internal
{
    // Resets the collection on an invalid sync key and throws on every
    // non-success status
    inline void check_batch(sync_key_provider& keys, const sync_batch& batch)
    {
        if (batch.status == 3)
        {
            logger()->warn("Sync key of collection {} was rejected, "
                           "collection must be synced from scratch",
                           batch.collection_id);
            keys.reset(batch.collection_id);
        }
        check_sync_status(batch.status, "Sync of collection " +
                                            batch.collection_id);
    }

    //! \brief Fetches the next batch of server changes.
    //!
    //! Does not advance the key; that is the caller's business once the
    //! changes were applied.
    inline sync_batch fetch_batch(command_executor& executor,
                                  sync_key_provider& keys,
                                  const std::string& collection_id,
                                  const sync_options& options)
    {
        auto key = keys.current(collection_id);
        if (key == initial_sync_key())
        {
            key = keys.refresh(collection_id);
        }
        const auto response = executor.send_command(
            "Sync", sync_request(key, collection_id, options));
        auto batch = parse_sync_response(response, collection_id);
        check_batch(keys, batch);
        return batch;
    }

    //! \brief Sends client changes built by build(sync_key).
    //!
    //! The request asks the server not to send its own changes. Should it
    //! send some anyway, the collection is reset instead of advanced so
    //! that they are not lost.
    template <typename Builder>
    inline sync_batch send_changes(command_executor& executor,
                                   sync_key_provider& keys,
                                   const std::string& collection_id,
                                   Builder build)
    {
        const auto key = keys.refresh(collection_id);
        const auto response = executor.send_command("Sync", build(key));
        auto batch = parse_sync_response(response, collection_id);
        check_batch(keys, batch);

        if (batch.has_server_changes())
        {
            logger()->info("Server sent unrequested changes for collection "
                           "{}, resetting it",
                           collection_id);
            keys.reset(collection_id);
        }
        else if (!batch.sync_key.empty())
        {
            keys.advance(collection_id, batch.sync_key);
        }
        return batch;
    }
} // namespace internal

//! \brief Drives the sync key state machine of each collection.
//!
//! A collection is either unsynced (key "0") or synced. The key is replaced
//! only after a successful response: by refresh() and commit(), or by sync()
//! once the caller's apply function returned. A response with status 3
//! (invalid sync key) resets the collection and is reported as
//! error_code::invalid_sync_key.
class sync_engine final : public sync_key_provider
{
public:
    sync_engine(command_executor& executor, sync_key_store& store)
        : executor_(executor), store_(store)
    {
    }

    std::string current(const std::string& collection_id) override
    {
        return store_.key(collection_id);
    }

    std::string refresh(const std::string& collection_id) override
    {
        return refresh(collection_id, store_.key(collection_id));
    }

    //! \brief Obtains a current key for the collection, starting from
    //! base_key.
    //!
    //! From "0" this is the initial handshake; otherwise a round trip that
    //! asks for no changes. Either way no item changes are consumed.
    std::string refresh(const std::string& collection_id,
                        const std::string& base_key)
    {
        std::string request;
        if (base_key == initial_sync_key())
        {
            request = internal::initial_sync_request(collection_id);
        }
        else
        {
            sync_options options;
            options.get_changes = false;
            request = internal::sync_request(base_key, collection_id, options);
        }

        const auto response = executor_.send_command("Sync", request);
        const auto batch =
            internal::parse_sync_response(response, collection_id);
        internal::check_batch(*this, batch);

        auto key = batch.sync_key;
        if (key.empty())
        {
            if (base_key == initial_sync_key())
            {
                throw internal::missing_field("SyncKey");
            }
            key = base_key;
        }
        store_.advance(collection_id, key);
        return key;
    }

    void advance(const std::string& collection_id,
                 const std::string& sync_key) override
    {
        store_.advance(collection_id, sync_key);
    }

    void reset(const std::string& collection_id) override
    {
        store_.reset(collection_id);
    }

    sync_state state(const std::string& collection_id) const
    {
        return store_.state(collection_id);
    }

    //! Fetches the next batch without advancing the key; see commit()
    sync_batch fetch(const std::string& collection_id,
                     const sync_options& options = sync_options())
    {
        return internal::fetch_batch(executor_, *this, collection_id, options);
    }

    //! Advances the collection to the key of a batch whose changes have
    //! been applied
    void commit(const sync_batch& batch)
    {
        if (!batch.sync_key.empty())
        {
            store_.advance(batch.collection_id, batch.sync_key);
        }
    }

    //! \brief Fetches one batch, hands it to apply and commits it.
    //!
    //! If apply throws the key stays where it was and the same changes are
    //! delivered again by the next sync.
    template <typename Apply>
    sync_batch sync(const std::string& collection_id,
                    const sync_options& options, Apply apply)
    {
        auto batch = fetch(collection_id, options);
        apply(static_cast<const sync_batch&>(batch));
        commit(batch);
        return batch;
    }

private:
    command_executor& executor_;
    sync_key_store& store_;
};

//! \brief Applies a batch to a map of items keyed by server id.
//!
//! Deletions are applied first, then additions and changes are upserted.
//! convert turns a sync_item into the mapped type.
template <typename T, typename Convert>
inline void apply_batch(const sync_batch& batch,
                        std::map<std::string, T>& items, Convert convert)
{
    for (const auto& id : batch.deleted)
    {
        items.erase(id);
    }
    for (const auto& item : batch.added)
    {
        items[item.server_id] = convert(item);
    }
    for (const auto& item : batch.changed)
    {
        items[item.server_id] = convert(item);
    }
}
} // namespace eas
