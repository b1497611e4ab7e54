
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

#include <set>
#include <stdio.h>
#include <string.h>
#include <string>
#include <time.h>
#include <vector>

#include "eas_fwd.hpp"
#include "errors.hpp"

namespace eas
{
//! \brief Semantic type of a folder as reported by FolderSync.
//!
//! The numeric values are the ones used on the wire.
enum class folder_type
{
    generic = 1,
    inbox = 2,
    drafts = 3,
    deleted_items = 4,
    sent_items = 5,
    outbox = 6,
    tasks = 7,
    calendar = 8,
    contacts = 9,
    notes = 10,
    journal = 11,
    user_mail = 12,
    user_calendar = 13,
    user_contacts = 14,
    user_tasks = 15,
    user_journal = 16,
    user_notes = 17,
    unknown = 18,
    recipient_cache = 19
};

namespace internal
{
    inline std::string enum_to_str(folder_type type)
    {
        switch (type)
        {
        case folder_type::generic:
            return "generic";
        case folder_type::inbox:
            return "inbox";
        case folder_type::drafts:
            return "drafts";
        case folder_type::deleted_items:
            return "deleted_items";
        case folder_type::sent_items:
            return "sent_items";
        case folder_type::outbox:
            return "outbox";
        case folder_type::tasks:
            return "tasks";
        case folder_type::calendar:
            return "calendar";
        case folder_type::contacts:
            return "contacts";
        case folder_type::notes:
            return "notes";
        case folder_type::journal:
            return "journal";
        case folder_type::user_mail:
            return "user_mail";
        case folder_type::user_calendar:
            return "user_calendar";
        case folder_type::user_contacts:
            return "user_contacts";
        case folder_type::user_tasks:
            return "user_tasks";
        case folder_type::user_journal:
            return "user_journal";
        case folder_type::user_notes:
            return "user_notes";
        case folder_type::unknown:
            return "unknown";
        case folder_type::recipient_cache:
            return "recipient_cache";
        default:
            throw exception("Unexpected <folder_type>");
        }
    }

    inline folder_type folder_type_from_int(int value)
    {
        if (value < static_cast<int>(folder_type::generic) ||
            value > static_cast<int>(folder_type::recipient_cache))
        {
            return folder_type::unknown;
        }
        return static_cast<folder_type>(value);
    }
} // namespace internal

//! The EAS mailbox folder hierarchy is a forest; top-level folders have
//! this parent id
inline const char* root_folder_id() EAS_NOEXCEPT { return "0"; }

//! A collection on the server as announced by FolderSync
struct folder final
{
    std::string server_id;
    std::string parent_id;
    std::string display_name;
    folder_type type;

    folder() : type(folder_type::unknown) {}

    folder(std::string id, std::string parent, std::string name,
           folder_type t)
        : server_id(std::move(id)), parent_id(std::move(parent)),
          display_name(std::move(name)), type(t)
    {
    }

    bool is_root() const
    {
        return parent_id.empty() || parent_id == root_folder_id();
    }
};

inline bool operator==(const folder& lhs, const folder& rhs)
{
    return lhs.server_id == rhs.server_id && lhs.parent_id == rhs.parent_id &&
           lhs.display_name == rhs.display_name && lhs.type == rhs.type;
}

//! \brief A xs:dateTime value.
//!
//! Stored as the string the server sent; converted on demand.
class date_time final
{
public:
    date_time() = default;

    date_time(std::string str) // intentionally not explicit
        : val_(std::move(str))
    {
    }

    const std::string& to_string() const EAS_NOEXCEPT { return val_; }

    bool is_set() const EAS_NOEXCEPT { return !val_.empty(); }

    //! \brief Converts this xs:dateTime to seconds since the Epoch.
    //!
    //! A value without zone designator is taken as UTC. Throws
    //! eas::exception if the string cannot be parsed.
    time_t to_epoch() const
    {
        if (!is_set())
        {
            throw exception("to_epoch called on empty date_time");
        }

        int y, M, d, h, m, tzh, tzm;
        tzh = tzm = 0;
        float s;
        char tzo = 'Z';
        const auto res = sscanf(val_.c_str(), "%d-%d-%dT%d:%d:%f%c%d:%d", &y,
                                &M, &d, &h, &m, &s, &tzo, &tzh, &tzm);
        if (res == EOF || res < 6)
        {
            throw exception("to_epoch: could not parse string");
        }

        time_t offset = 0;
        if (res == 9)
        {
            offset = (tzh * 60 * 60) + (tzm * 60);
            if (tzo == '+')
            {
                offset = -offset;
            }
            else if (tzo != '-')
            {
                throw exception("to_epoch: unexpected zone designator");
            }
        }
        else if (res == 7 && tzo != 'Z')
        {
            throw exception("to_epoch: unexpected zone designator");
        }

        tm t;
        memset(&t, 0, sizeof(struct tm));
        t.tm_year = y - 1900;
        t.tm_mon = M - 1;
        t.tm_mday = d;
        t.tm_hour = h;
        t.tm_min = m;
        t.tm_sec = static_cast<int>(s);

        const auto epoch = timegm(&t);
        if (epoch == -1L)
        {
            throw exception(
                "timegm: time cannot be represented as calendar time");
        }
        return epoch + offset;
    }

    //! \brief Constructs a xs:dateTime from given time value.
    //!
    //! The result is formatted as yyyy-MM-ddThh:mm:ssZ.
    static date_time from_epoch(time_t epoch)
    {
        tm result;
        auto t = gmtime_r(&epoch, &result);
        char buf[21];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", t);
        return date_time(buf);
    }

    //! The same point in time in the format ActiveSync expects,
    //! yyyy-MM-ddThh:mm:ss.000Z
    std::string to_activesync_string() const
    {
        const auto epoch = to_epoch();
        tm result;
        auto t = gmtime_r(&epoch, &result);
        char buf[25];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S.000Z", t);
        return buf;
    }

private:
    friend bool operator==(const date_time&, const date_time&);

    std::string val_;
};

inline bool operator==(const date_time& lhs, const date_time& rhs)
{
    return lhs.val_ == rhs.val_;
}

//! Categories of an item: an unordered set of labels
typedef std::set<std::string> category_set;

//! A sticky note (IPM.StickyNote)
struct note final
{
    //! Assigned by the server; empty until the note was created
    std::string server_id;

    //! The collection this note was read from
    std::string folder_id;

    std::string subject;
    std::string body;
    category_set categories;
    date_time last_modified;

    //! True if the note was found in Deleted Items
    bool is_deleted;

    note() : is_deleted(false) {}
};

enum class importance
{
    low = 0,
    normal = 1,
    high = 2
};

namespace internal
{
    inline std::string enum_to_str(importance imp)
    {
        switch (imp)
        {
        case importance::low:
            return "Low";
        case importance::normal:
            return "Normal";
        case importance::high:
            return "High";
        default:
            throw exception("Unexpected <importance>");
        }
    }

    inline importance importance_from_int(int value)
    {
        switch (value)
        {
        case 0:
            return importance::low;
        case 2:
            return importance::high;
        default:
            return importance::normal;
        }
    }

    inline importance importance_from_str(const std::string& str)
    {
        if (str == "Low")
        {
            return importance::low;
        }
        if (str == "High")
        {
            return importance::high;
        }
        return importance::normal;
    }
} // namespace internal

struct task final
{
    std::string server_id;
    std::string folder_id;
    std::string subject;
    std::string body;
    category_set categories;

    //! Optional; an unset due date is left out of requests entirely
    date_time due_date;
    date_time start_date;
    importance priority;
    bool complete;
    bool is_deleted;

    task() : priority(importance::normal), complete(false), is_deleted(false)
    {
    }
};

//! A mail item as delivered by Sync on an email collection
struct mail_message final
{
    std::string server_id;
    std::string folder_id;
    std::string subject;
    std::string from;
    std::string to;
    std::string cc;
    date_time date_received;
    std::string body;
    std::string message_class;
    bool read;
    importance priority;

    mail_message() : read(false), priority(importance::normal) {}
};

//! A result of a global address list search
struct gal_entry final
{
    std::string display_name;
    std::string email_address;
    std::string first_name;
    std::string last_name;
    std::string company;
    std::string title;
    std::string phone;
    std::string office;
};

//! A hit of a mailbox full-text search
struct search_hit final
{
    std::string long_id;
    std::string collection_id;
    std::string subject;
    std::string from;
    date_time date_received;
    std::string preview;
};

//! Outcome of moving a single item
struct move_result final
{
    std::string source_id;

    //! The item's identity in the destination folder; a move always yields
    //! a new id
    std::string destination_id;
    int status;

    move_result() : status(0) {}

    bool ok() const EAS_NOEXCEPT { return status == 3; }
};

//! An item to move: its server id and the collection it currently lives in
struct move_request final
{
    std::string item_id;
    std::string source_folder_id;

    move_request() = default;
    move_request(std::string item, std::string source)
        : item_id(std::move(item)), source_folder_id(std::move(source))
    {
    }
};
} // namespace eas
