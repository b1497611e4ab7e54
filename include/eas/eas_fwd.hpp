
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

#define EAS_NOEXCEPT noexcept

// Forward declarations
namespace eas
{
class assertion_error;
class authentication_error;
class cancelled_error;
class capability_error;
class command_executor;
class connection_context;
class date_time;
class error;
class exception;
class folder_lookup;
class folder_service;
class http_error;
class mail_service;
class move_service;
class notes_service;
class options_query;
class search_service;
class soap_executor;
class soap_fault;
class status_error;
class sync_engine;
class sync_key_provider;
class sync_key_store;
class tasks_service;
class version_detector;
class version_source;
class wbxml_error;
class xml_parse_error;
struct connection_settings;
struct folder;
struct gal_entry;
struct mail_message;
struct note;
struct sync_batch;
struct sync_options;
struct task;
template <typename T> class basic_client;
template <typename T> class result;
void set_up() EAS_NOEXCEPT;
void tear_down() EAS_NOEXCEPT;
std::string version();
} // namespace eas
