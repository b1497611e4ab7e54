
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

#include "client.hpp"
#include "connection.hpp"
#include "eas_fwd.hpp"
#include "errors.hpp"
#include "folders.hpp"
#include "http.hpp"
#include "logging.hpp"
#include "mail.hpp"
#include "move.hpp"
#include "notes.hpp"
#include "ntlm.hpp"
#include "search.hpp"
#include "sync.hpp"
#include "tasks.hpp"
#include "types.hpp"

#define EAS_VERSION_MAJOR 1
#define EAS_VERSION_MINOR 0
#define EAS_VERSION_PATCH 0

namespace eas
{
//! Version of this library as "major.minor.patch"
inline std::string version()
{
    return std::to_string(EAS_VERSION_MAJOR) + "." +
           std::to_string(EAS_VERSION_MINOR) + "." +
           std::to_string(EAS_VERSION_PATCH);
}
} // namespace eas
