
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

#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "eas_fwd.hpp"

namespace eas
{
namespace internal
{
    inline const char* logger_name() EAS_NOEXCEPT { return "eas"; }

    // Returns the library-wide logger, creating a colored stderr logger on
    // first use if the application did not register one named "eas".
    inline std::shared_ptr<spdlog::logger> logger()
    {
        auto log = spdlog::get(logger_name());
        if (log)
        {
            return log;
        }
        try
        {
            log = spdlog::stderr_color_mt(logger_name());
            log->set_level(spdlog::level::warn);
        }
        catch (spdlog::spdlog_ex&)
        {
            // Another thread registered it in the meantime
            log = spdlog::get(logger_name());
        }
        return log;
    }
} // namespace internal

//! \brief Use the given logger for all diagnostics of this library.
//!
//! Replaces a previously registered logger. The logger is registered in
//! spdlog's registry under the name "eas".
inline void set_logger(std::shared_ptr<spdlog::logger> log)
{
    spdlog::drop(internal::logger_name());
    auto renamed = std::make_shared<spdlog::logger>(
        internal::logger_name(), log->sinks().begin(), log->sinks().end());
    renamed->set_level(log->level());
    spdlog::register_logger(renamed);
}

//! Sets the verbosity of this library's logger
inline void set_log_level(spdlog::level::level_enum level)
{
    internal::logger()->set_level(level);
}
} // namespace eas
