
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

// Global data used in tests and examples; initialized at program-start
#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "connection.hpp"

namespace eas
{
namespace test
{
    class environment final
    {
    public:
        std::string server_uri;
        std::string username;
        std::string password;
        std::string domain;
        std::string device_id;

        environment()
            : server_uri(getenv_or_throw("EAS_TEST_URI")),
              username(getenv_or_throw("EAS_TEST_USERNAME")),
              password(getenv_or_throw("EAS_TEST_PASSWORD")),
              domain(getenv_or_empty_string("EAS_TEST_DOMAIN")),
              device_id(getenv_or_empty_string("EAS_TEST_DEVICE_ID"))
        {
        }

        connection_settings settings() const
        {
            connection_settings s;
            s.server_url = server_uri;
            s.username = username;
            s.password = password;
            s.domain = domain;
            s.device_id = device_id;
            return s;
        }

    private:
        static std::string getenv_or_throw(const char* name)
        {
            const char* const val = getenv(name);
            if (val == nullptr)
            {
                const auto msg =
                    std::string("Missing environment variable ") + name;
                throw std::runtime_error(msg);
            }
            return std::string(val);
        }

        static std::string getenv_or_empty_string(const char* name)
        {
            const char* const val = getenv(name);
            return val == nullptr ? "" : std::string(val);
        }
    };
} // namespace test
} // namespace eas
