
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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctype.h>
#include <iterator>
#include <map>
#include <memory>
#include <new>
#include <string>
#include <strings.h>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <openssl/evp.h>

#include "errors.hpp"
#include "logging.hpp"
#include "xml.hpp"

namespace eas
{
namespace internal
{
    //! Raised when a libcurl call failed
    class curl_error final : public transport_error
    {
    public:
        explicit curl_error(const std::string& what) : transport_error(what)
        {
        }
        explicit curl_error(const char* what) : transport_error(what) {}
    };

    inline curl_error make_curl_error(const std::string& msg, CURLcode rescode)
    {
        auto reason = std::string(curl_easy_strerror(rescode));
#ifdef NDEBUG
        (void)msg;
        return curl_error(reason);
#else
        return curl_error(msg + ": \'" + reason + "\'");
#endif
    }

    // RAII helper class for CURL* handles.
    class curl_ptr final
    {
    public:
        curl_ptr() : handle_(curl_easy_init())
        {
            if (!handle_)
            {
                throw curl_error("Could not start libcurl session");
            }
        }

        ~curl_ptr() { curl_easy_cleanup(handle_); }

        // Could use curl_easy_duphandle for copying
        curl_ptr(const curl_ptr&) = delete;
        curl_ptr& operator=(const curl_ptr&) = delete;

        curl_ptr(curl_ptr&& other) : handle_(other.handle_)
        {
            other.handle_ = nullptr;
        }

        curl_ptr& operator=(curl_ptr&& rhs)
        {
            if (&rhs != this)
            {
                curl_easy_cleanup(handle_);
                handle_ = rhs.handle_;
                rhs.handle_ = nullptr;
            }
            return *this;
        }

        CURL* get() const EAS_NOEXCEPT { return handle_; }

    private:
        CURL* handle_;
    };

    // RAII wrapper class around cURLs slist construct.
    class curl_string_list final
    {
    public:
        curl_string_list() EAS_NOEXCEPT : slist_(nullptr) {}

        ~curl_string_list() { curl_slist_free_all(slist_); }

        curl_string_list(const curl_string_list&) = delete;
        curl_string_list& operator=(const curl_string_list&) = delete;

        curl_string_list(curl_string_list&& other) : slist_(other.slist_)
        {
            other.slist_ = nullptr;
        }

        curl_string_list& operator=(curl_string_list&& rhs)
        {
            if (&rhs != this)
            {
                curl_slist_free_all(slist_);
                slist_ = rhs.slist_;
                rhs.slist_ = nullptr;
            }
            return *this;
        }

        void append(const char* str)
        {
            auto list = curl_slist_append(slist_, str);
            if (list == nullptr)
            {
                throw std::bad_alloc();
            }
            slist_ = list;
        }

        curl_slist* get() const EAS_NOEXCEPT { return slist_; }

    private:
        curl_slist* slist_;
    };

    namespace base64
    {
        inline std::string encode(const unsigned char* buf, size_t len)
        {
            if (len == 0)
            {
                return std::string();
            }
            std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
            const auto written =
                EVP_EncodeBlock(&out[0], buf, static_cast<int>(len));
            return std::string(reinterpret_cast<const char*>(&out[0]),
                               static_cast<size_t>(written));
        }

        inline std::string encode(const std::vector<unsigned char>& buf)
        {
            return buf.empty() ? std::string() : encode(&buf[0], buf.size());
        }

        inline std::string encode(const std::string& str)
        {
            return encode(reinterpret_cast<const unsigned char*>(str.data()),
                          str.size());
        }

        // Throws eas::exception if the input is not valid base64
        inline std::vector<unsigned char> decode(const std::string& encoded)
        {
            std::string input;
            std::copy_if(begin(encoded), end(encoded),
                         std::back_inserter(input), [](char c) {
                             return !isspace(static_cast<unsigned char>(c));
                         });
            if (input.empty())
            {
                return std::vector<unsigned char>();
            }
            check<exception>(input.size() % 4 == 0,
                             "Invalid base64 input length");

            std::vector<unsigned char> out(input.size() / 4 * 3);
            const auto len = EVP_DecodeBlock(
                &out[0], reinterpret_cast<const unsigned char*>(input.data()),
                static_cast<int>(input.size()));
            check<exception>(len >= 0, "Invalid base64 input");

            // EVP_DecodeBlock counts padding as decoded zero bytes
            size_t padding = 0;
            if (input[input.size() - 1] == '=')
            {
                ++padding;
                if (input[input.size() - 2] == '=')
                {
                    ++padding;
                }
            }
            out.resize(static_cast<size_t>(len) - padding);
            return out;
        }
    } // namespace base64

    // RAII wrapper around a string allocated by libcurl
    class curl_string final
    {
    public:
        explicit curl_string(char* str) : str_(str) {}

        ~curl_string() { curl_free(str_); }

        curl_string(const curl_string&) = delete;
        curl_string& operator=(const curl_string&) = delete;

        const char* get() const EAS_NOEXCEPT { return str_; }

    private:
        char* str_;
    };

    // Percent-encodes str with curl_easy_escape(3)
    inline std::string curl_escape(const curl_ptr& curl, const std::string& str)
    {
        curl_string escaped(curl_easy_escape(curl.get(), str.data(),
                                             static_cast<int>(str.size())));
        if (escaped.get() == nullptr)
        {
            throw curl_error("Could not escape URL component");
        }
        return std::string(escaped.get());
    }

    class http_response final
    {
    public:
        typedef std::vector<std::pair<std::string, std::string>> header_list;

        http_response(long code, std::string content,
                      header_list headers = header_list())
            : content_(std::move(content)), headers_(std::move(headers)),
              code_(code)
        {
        }

        http_response(const http_response&) = delete;
        http_response& operator=(const http_response&) = delete;

        http_response(http_response&& other)
            : content_(std::move(other.content_)),
              headers_(std::move(other.headers_)), code_(other.code_)
        {
            other.code_ = 0L;
        }

        http_response& operator=(http_response&& rhs)
        {
            if (&rhs != this)
            {
                content_ = std::move(rhs.content_);
                headers_ = std::move(rhs.headers_);
                code_ = rhs.code_;
            }
            return *this;
        }

        // Returns the raw byte content of this HTTP response.
        const std::string& content() const EAS_NOEXCEPT { return content_; }

        // Returns the response code of the HTTP request.
        long code() const EAS_NOEXCEPT { return code_; }

        const header_list& headers() const EAS_NOEXCEPT { return headers_; }

        // Returns the value of the first header with given name; names are
        // compared case-insensitively
        optional<std::string> header(const std::string& name) const
        {
            for (const auto& h : headers_)
            {
                if (strcasecmp(h.first.c_str(), name.c_str()) == 0)
                {
                    return h.second;
                }
            }
            return optional<std::string>();
        }

        // Returns the values of all headers with given name, e.g. multiple
        // WWW-Authenticate challenges
        std::vector<std::string> header_values(const std::string& name) const
        {
            std::vector<std::string> values;
            for (const auto& h : headers_)
            {
                if (strcasecmp(h.first.c_str(), name.c_str()) == 0)
                {
                    values.push_back(h.second);
                }
            }
            return values;
        }

        // Returns whether the response is a SOAP fault.
        //
        // This means the server responded with status code 500 and
        // indicates that the entire request failed (not just a normal EWS
        // error). This can happen e.g. when the request we sent was not
        // schema compliant.
        bool is_soap_fault() const EAS_NOEXCEPT { return code() == 500L; }

        // Returns whether the HTTP response code is 2xx.
        bool ok() const EAS_NOEXCEPT { return code() >= 200L && code() < 300L; }

    private:
        std::string content_;
        header_list headers_;
        long code_;
    };

    class http_request final
    {
    public:
        enum class method
        {
            POST,
            OPTIONS
        };

        // Create a new HTTP request to the given URL.
        explicit http_request(const std::string& url) : method_(method::POST)
        {
            set_option(CURLOPT_URL, url.c_str());
        }

        void set_method(method m) { method_ = m; }

        // Set this HTTP request's content type.
        void set_content_type(const std::string& content_type)
        {
            set_header("Content-Type", content_type);
        }

        // Sets or replaces a request header. Headers are kept across
        // subsequent send() calls on the same request object.
        void set_header(const std::string& name, const std::string& value)
        {
            headers_[name] = value;
        }

        void set_timeout(std::chrono::seconds timeout)
        {
            set_option(CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
            set_option(CURLOPT_CONNECTTIMEOUT,
                       static_cast<long>(timeout.count()));
        }

        void set_tls_verification(bool verify)
        {
            if (!verify)
            {
                internal::logger()->warn(
                    "TLS verification of the server's authenticity is "
                    "disabled");
            }
            set_option(CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
            set_option(CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
        }

        // The transfer is aborted as soon as *flag becomes true. The flag
        // must outlive this request.
        void set_cancellation_flag(const std::atomic<bool>* flag)
        {
            auto callback = [](void* clientp, curl_off_t, curl_off_t,
                               curl_off_t, curl_off_t) -> int {
                const auto cancelled =
                    reinterpret_cast<const std::atomic<bool>*>(clientp);
                return cancelled->load() ? 1 : 0;
            };
            set_option(CURLOPT_XFERINFOFUNCTION,
                       static_cast<int (*)(void*, curl_off_t, curl_off_t,
                                           curl_off_t, curl_off_t)>(callback));
            set_option(CURLOPT_XFERINFODATA,
                       const_cast<std::atomic<bool>*>(flag));
            set_option(CURLOPT_NOPROGRESS, 0L);
        }

        // Small wrapper around curl_easy_setopt(3).
        //
        // Converts return codes to exceptions of type curl_error.
        template <typename... Args>
        void set_option(CURLoption option, Args... args)
        {
            auto retcode = curl_easy_setopt(handle_.get(), option,
                                            std::forward<Args>(args)...);
            switch (retcode)
            {
            case CURLE_OK:
                return;

            case CURLE_FAILED_INIT:
            {
                throw make_curl_error("curl_easy_setopt: unsupported option",
                                      retcode);
            }

            default:
            {
                throw make_curl_error("curl_easy_setopt: failed setting option",
                                      retcode);
            }
            };
        }

        // Perform the HTTP request and returns the response. This function
        // blocks until the complete response is received or a timeout is
        // reached. Throws curl_error if operation could not be completed.
        //
        // request: The complete request body; may contain binary data.
        http_response send(const std::string& request)
        {
            auto write_callback = [](char* ptr, size_t size, size_t nmemb,
                                     void* userdata) -> size_t {
                auto buf = reinterpret_cast<std::string*>(userdata);
                const auto realsize = size * nmemb;
                try
                {
                    buf->append(ptr, realsize);
                }
                catch (std::bad_alloc&)
                {
                    // Out of memory, indicate error to libcurl
                    return 0U;
                }
                return realsize;
            };

            auto header_callback = [](char* buffer, size_t size, size_t nitems,
                                      void* userdata) -> size_t {
                auto headers =
                    reinterpret_cast<http_response::header_list*>(userdata);
                const auto realsize = size * nitems;
                try
                {
                    const auto line = std::string(buffer, realsize);
                    if (line.compare(0, 5, "HTTP/") == 0)
                    {
                        // Status line of a new response (after a 100
                        // Continue or an authentication round-trip)
                        headers->clear();
                        return realsize;
                    }
                    const auto colon = line.find(':');
                    if (colon != std::string::npos)
                    {
                        headers->emplace_back(trim(line.substr(0, colon)),
                                              trim(line.substr(colon + 1)));
                    }
                }
                catch (std::bad_alloc&)
                {
                    return 0U;
                }
                return realsize;
            };

            // Do not install (directly or indirectly) signal handlers nor
            // call any functions that cause signals to be sent to the
            // process
            set_option(CURLOPT_NOSIGNAL, 1L);

            switch (method_)
            {
            case method::OPTIONS:
                set_option(CURLOPT_CUSTOMREQUEST, "OPTIONS");
                set_option(CURLOPT_NOBODY, 1L);
                break;

            case method::POST:
            default:
                set_option(CURLOPT_CUSTOMREQUEST,
                           static_cast<const char*>(nullptr));
                set_option(CURLOPT_NOBODY, 0L);
                set_option(CURLOPT_POST, 1L);
                // Set complete request string for HTTP POST method; note: no
                // encoding here
                set_option(CURLOPT_POSTFIELDS, request.data());
                set_option(CURLOPT_POSTFIELDSIZE,
                           static_cast<long>(request.size()));
                break;
            }

            // Finally, set HTTP headers. We do this as last action here
            // because we want to overwrite implicitly set header lines due
            // to the options set above with our own header lines
            curl_string_list header_lines;
            for (const auto& h : headers_)
            {
                header_lines.append((h.first + ": " + h.second).c_str());
            }
            header_lines_ = std::move(header_lines);
            set_option(CURLOPT_HTTPHEADER, header_lines_.get());

            std::string response_data;
            http_response::header_list response_headers;
            set_option(CURLOPT_WRITEFUNCTION,
                       static_cast<size_t (*)(char*, size_t, size_t, void*)>(
                           write_callback));
            set_option(CURLOPT_WRITEDATA, std::addressof(response_data));
            set_option(CURLOPT_HEADERFUNCTION,
                       static_cast<size_t (*)(char*, size_t, size_t, void*)>(
                           header_callback));
            set_option(CURLOPT_HEADERDATA, std::addressof(response_headers));

            auto retcode = curl_easy_perform(handle_.get());
            if (retcode == CURLE_ABORTED_BY_CALLBACK)
            {
                throw cancelled_error();
            }
            if (retcode != CURLE_OK)
            {
                throw make_curl_error("curl_easy_perform", retcode);
            }
            long response_code = 0L;
            curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE,
                              &response_code);
            return http_response(response_code, std::move(response_data),
                                 std::move(response_headers));
        }

    private:
        curl_ptr handle_;
        std::map<std::string, std::string> headers_;
        curl_string_list header_lines_;
        method method_;
    };
} // namespace internal

//! \brief Set-up the library.
//!
//! Call this once before any other function of this library and before
//! creating a thread.
inline void set_up() EAS_NOEXCEPT { curl_global_init(CURL_GLOBAL_DEFAULT); }

//! Clean-up the library.
inline void tear_down() EAS_NOEXCEPT { curl_global_cleanup(); }
} // namespace eas
