
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
#include "logging.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "types.hpp"

namespace eas
{
namespace internal
{
    //! Moves one item and returns its new id
    inline std::string move_item(command_executor& executor,
                                 const std::string& item_id,
                                 const std::string& source_folder_id,
                                 const std::string& destination_id)
    {
        const auto results = parse_move_response(executor.send_command(
            "MoveItems",
            move_items_request(std::vector<move_request>{move_request(
                                   item_id, source_folder_id)},
                               destination_id)));
        if (results.empty())
        {
            throw missing_field("Response");
        }
        check_move_status(results.front());
        if (results.front().destination_id.empty())
        {
            throw missing_field("DstMsgId");
        }
        return results.front().destination_id;
    }
} // namespace internal

//! \brief Moves items between folders with MoveItems.
//!
//! A moved item gets a new server id in its destination folder.
class move_service final
{
public:
    explicit move_service(command_executor& executor) : executor_(executor) {}

    //! \brief Moves many items, possibly from different folders, into one
    //! folder with a single request.
    //!
    //! The per-item outcome is reported in each move_result; only a failed
    //! request as a whole is an error.
    result<std::vector<move_result>>
    move_items(const std::vector<move_request>& items,
               const std::string& destination_id)
    {
        return internal::capture<std::vector<move_result>>([&]() {
            if (items.empty())
            {
                return std::vector<move_result>();
            }
            const auto request =
                internal::move_items_request(items, destination_id);
            auto results = internal::parse_move_response(
                executor_.send_command("MoveItems", request));
            if (results.size() != items.size())
            {
                internal::logger()->warn("MoveItems: {} items sent, {} results",
                                         items.size(), results.size());
            }
            return results;
        });
    }

    //! Moves one item and returns its new server id
    result<std::string> move_item(const std::string& item_id,
                                  const std::string& source_folder_id,
                                  const std::string& destination_id)
    {
        return internal::capture<std::string>([&]() {
            return internal::move_item(executor_, item_id, source_folder_id,
                                       destination_id);
        });
    }

private:
    command_executor& executor_;
};
} // namespace eas
