
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
#include "notes.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "types.hpp"

namespace eas
{
//! One protocol's way to search the global address list
class gal_backend
{
public:
    virtual ~gal_backend() = default;

    virtual std::vector<gal_entry> search_gal(const std::string& query,
                                              int max_results) = 0;
};

//! GAL search with the ActiveSync Search command
class native_gal_backend final : public gal_backend
{
public:
    explicit native_gal_backend(command_executor& executor)
        : executor_(executor)
    {
    }

    std::vector<gal_entry> search_gal(const std::string& query,
                                      int max_results) override
    {
        return internal::parse_gal_search_response(executor_.send_command(
            "Search", internal::gal_search_request(query, max_results)));
    }

private:
    command_executor& executor_;
};

//! GAL search with EWS ResolveNames
class ews_gal_backend final : public gal_backend
{
public:
    ews_gal_backend(soap_executor& executor, version_source& versions)
        : executor_(executor), versions_(versions)
    {
    }

    std::vector<gal_entry> search_gal(const std::string& query,
                                      int max_results) override
    {
        const auto doc =
            internal::send_ews(executor_, versions_, "ResolveNames",
                               internal::ews_resolve_names_request(query));

        std::vector<gal_entry> entries;
        for (const auto& msg : internal::parse_ews_response_messages(*doc))
        {
            // Several matches come back as a warning
            if (msg.response_code == "ErrorNameResolutionNoResults")
            {
                continue;
            }
            if (!msg.success() &&
                msg.response_code != "ErrorNameResolutionMultipleResults")
            {
                throw internal::ews_error(msg);
            }
            for (const auto resolution :
                 internal::get_elements_by_local_name(*msg.node, "Resolution"))
            {
                if (static_cast<int>(entries.size()) >= max_results)
                {
                    break;
                }
                entries.emplace_back(
                    internal::parse_ews_resolution(*resolution));
            }
        }
        return entries;
    }

private:
    soap_executor& executor_;
    version_source& versions_;
};

//! Searches of the global address list and of mailbox folders
class search_service final
{
public:
    search_service(capability_resolver& caps, command_executor& executor,
                   gal_backend& native, gal_backend& soap)
        : caps_(caps), executor_(executor), native_(native), soap_(soap)
    {
    }

    //! Returns at most max_results directory entries matching query
    result<std::vector<gal_entry>> search_gal(const std::string& query,
                                              int max_results = 100)
    {
        return internal::capture<std::vector<gal_entry>>([&]() {
            return internal::dispatch<std::vector<gal_entry>>(
                caps_, capability::gal_search, native_, soap_,
                [&](gal_backend& backend) {
                    return backend.search_gal(query, max_results);
                });
        });
    }

    //! Full-text search in one folder; returns the hits in the range
    //! [range_start, range_end]
    result<std::vector<search_hit>>
    search_mailbox(const std::string& collection_id, const std::string& query,
                   int range_start = 0, int range_end = 99)
    {
        return internal::capture<std::vector<search_hit>>([&]() {
            return internal::parse_mailbox_search_response(
                executor_.send_command(
                    "Search", internal::mailbox_search_request(
                                  collection_id, query, range_start,
                                  range_end)));
        });
    }

private:
    capability_resolver& caps_;
    command_executor& executor_;
    gal_backend& native_;
    gal_backend& soap_;
};
} // namespace eas
