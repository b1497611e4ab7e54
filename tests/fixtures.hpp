
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
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <eas/eas.hpp>

#include <gtest/gtest.h>

namespace tests
{
// Check if cont contains the element val
template <typename ContainerType, typename ValueType>
inline bool contains(const ContainerType& cont, const ValueType& val)
{
    return std::find(begin(cont), end(cont), val) != end(cont);
}

// Check if cont contains an element for which pred evaluates to true
template <typename ContainerType, typename Predicate>
inline bool contains_if(const ContainerType& cont, Predicate pred)
{
    return std::find_if(begin(cont), end(cont), pred) != end(cont);
}

inline bool contains_str(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

// Allows you to test requests w/o sending anything to the server. Every
// request is recorded; responses are served from a queue, an empty queue
// answers with 200 and no body.
struct http_request_mock final
{
    struct recorded_request
    {
        std::string url;
        bool is_options;
        std::map<std::string, std::string> headers;
        std::string body;

        std::string header(const std::string& name) const
        {
            const auto it = headers.find(name);
            return it == headers.end() ? std::string() : it->second;
        }
    };

    struct fake_response
    {
        long code;
        std::string content;
        eas::internal::http_response::header_list headers;

        // Thrown from send() instead of answering, if set
        std::function<void()> raise;
    };

    struct storage
    {
        static storage& instance()
        {
            static storage inst;
            return inst;
        }

        void clear()
        {
            requests.clear();
            responses.clear();
        }

        std::vector<recorded_request> requests;
        std::deque<fake_response> responses;
    };

    static void
    enqueue(long code, std::string content = std::string(),
            eas::internal::http_response::header_list headers =
                eas::internal::http_response::header_list())
    {
        fake_response res;
        res.code = code;
        res.content = std::move(content);
        res.headers = std::move(headers);
        storage::instance().responses.emplace_back(std::move(res));
    }

    // The next send() throws exc, as a cancelled or failed transfer does
    template <typename ExceptionType>
    static void enqueue_failure(ExceptionType exc)
    {
        fake_response res;
        res.code = 0;
        res.raise = [exc]() { throw exc; };
        storage::instance().responses.emplace_back(std::move(res));
    }

    static const std::vector<recorded_request>& requests()
    {
        return storage::instance().requests;
    }

    // Below same public interface as eas::internal::http_request class
    enum class method
    {
        POST,
        OPTIONS
    };

    explicit http_request_mock(const std::string& url)
        : url_(url), method_(method::POST)
    {
    }

    void set_method(method m) { method_ = m; }

    void set_content_type(const std::string& content_type)
    {
        set_header("Content-Type", content_type);
    }

    void set_header(const std::string& name, const std::string& value)
    {
        headers_[name] = value;
    }

    void set_timeout(std::chrono::seconds) {}

    void set_tls_verification(bool) {}

    void set_cancellation_flag(const std::atomic<bool>*) {}

    eas::internal::http_response send(const std::string& request)
    {
        auto& s = storage::instance();
        recorded_request rec;
        rec.url = url_;
        rec.is_options = method_ == method::OPTIONS;
        rec.headers = headers_;
        rec.body = request;
        s.requests.emplace_back(std::move(rec));

        if (s.responses.empty())
        {
            return eas::internal::http_response(200, std::string());
        }
        auto res = std::move(s.responses.front());
        s.responses.pop_front();
        if (res.raise)
        {
            res.raise();
        }
        return eas::internal::http_response(res.code, std::move(res.content),
                                            std::move(res.headers));
    }

private:
    std::string url_;
    std::map<std::string, std::string> headers_;
    method method_;
};

// A command executor that answers from a queue of canned responses
class fake_command_executor final : public eas::command_executor
{
public:
    struct call
    {
        std::string command;
        std::string body;
    };

    void respond(std::string xml)
    {
        responses_.push_back([xml]() { return xml; });
    }

    template <typename ExceptionType> void fail_with(ExceptionType exc)
    {
        responses_.push_back([exc]() -> std::string { throw exc; });
    }

    std::string send_command(const std::string& command,
                             const std::string& xml) override
    {
        calls_.push_back(call{command, xml});
        if (responses_.empty())
        {
            ADD_FAILURE() << "Unexpected command " << command;
            return std::string();
        }
        auto next = responses_.front();
        responses_.pop_front();
        return next();
    }

    const std::vector<call>& calls() const { return calls_; }

    const call& last_call() const { return calls_.back(); }

private:
    std::deque<std::function<std::string()>> responses_;
    std::vector<call> calls_;
};

// A SOAP executor that answers from a queue of canned envelopes
class fake_soap_executor final : public eas::soap_executor
{
public:
    struct call
    {
        std::string action;
        std::string envelope;
    };

    void respond(std::string envelope)
    {
        responses_.push_back([envelope]() { return envelope; });
    }

    template <typename ExceptionType> void fail_with(ExceptionType exc)
    {
        responses_.push_back([exc]() -> std::string { throw exc; });
    }

    std::string send_soap(const std::string& action,
                          const std::string& envelope) override
    {
        calls_.push_back(call{action, envelope});
        if (responses_.empty())
        {
            ADD_FAILURE() << "Unexpected EWS request " << action;
            return std::string();
        }
        auto next = responses_.front();
        responses_.pop_front();
        return next();
    }

    const std::vector<call>& calls() const { return calls_; }

private:
    std::deque<std::function<std::string()>> responses_;
    std::vector<call> calls_;
};

class fake_version_source final : public eas::version_source
{
public:
    explicit fake_version_source(std::string version)
        : version_(std::move(version)), queries_(0)
    {
    }

    std::string protocol_version() override
    {
        ++queries_;
        return version_;
    }

    bool is_version_detected() const override { return true; }

    void set_version(std::string version) { version_ = std::move(version); }

    int queries() const { return queries_; }

private:
    std::string version_;
    int queries_;
};

class fake_options_query final : public eas::options_query
{
public:
    fake_options_query() : calls_(0) {}

    void offer(std::vector<std::string> versions)
    {
        versions_ = std::move(versions);
        failure_ = nullptr;
    }

    template <typename ExceptionType> void fail_with(ExceptionType exc)
    {
        failure_ = [exc]() { throw exc; };
    }

    std::vector<std::string> supported_protocol_versions() override
    {
        ++calls_;
        if (failure_)
        {
            failure_();
        }
        return versions_;
    }

    int calls() const { return calls_; }

private:
    std::vector<std::string> versions_;
    std::function<void()> failure_;
    int calls_;
};

class fake_folder_lookup final : public eas::folder_lookup
{
public:
    fake_folder_lookup() : refreshes_(0) {}

    void add(eas::folder_type type, std::string id)
    {
        ids_[type] = std::move(id);
    }

    std::string find_folder_id(eas::folder_type type) override
    {
        const auto it = ids_.find(type);
        if (it == ids_.end())
        {
            throw eas::status_error(eas::error_code::folder_not_found,
                                    "No folder of type " +
                                        eas::internal::enum_to_str(type) +
                                        " found");
        }
        return it->second;
    }

    void refresh_folders() override { ++refreshes_; }

    int refreshes() const { return refreshes_; }

private:
    std::map<eas::folder_type, std::string> ids_;
    int refreshes_;
};

// Hands out a fixed key on refresh and records what happens to it
class fake_sync_key_provider final : public eas::sync_key_provider
{
public:
    explicit fake_sync_key_provider(std::string refreshed_key)
        : refreshed_key_(std::move(refreshed_key)), refreshes_(0)
    {
    }

    std::string current(const std::string& collection_id) override
    {
        const auto it = keys_.find(collection_id);
        return it == keys_.end() ? eas::initial_sync_key() : it->second;
    }

    std::string refresh(const std::string& collection_id) override
    {
        ++refreshes_;
        keys_[collection_id] = refreshed_key_;
        return refreshed_key_;
    }

    void advance(const std::string& collection_id,
                 const std::string& sync_key) override
    {
        keys_[collection_id] = sync_key;
    }

    void reset(const std::string& collection_id) override
    {
        keys_.erase(collection_id);
        resets_.push_back(collection_id);
    }

    int refreshes() const { return refreshes_; }

    const std::vector<std::string>& resets() const { return resets_; }

private:
    std::string refreshed_key_;
    std::map<std::string, std::string> keys_;
    std::vector<std::string> resets_;
    int refreshes_;
};

// Canned responses

inline std::string sync_response(const std::string& collection_id,
                                 const std::string& sync_key,
                                 const std::string& inner = std::string(),
                                 int status = 1)
{
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
           "<Sync xmlns=\"AirSync\"><Collections><Collection>"
           "<SyncKey>" +
           sync_key + "</SyncKey><CollectionId>" + collection_id +
           "</CollectionId><Status>" + std::to_string(status) + "</Status>" +
           inner + "</Collection></Collections></Sync>";
}

inline std::string soap_response(const std::string& operation,
                                 const std::string& messages)
{
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
           "<s:Envelope "
           "xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\">"
           "<s:Body><m:" +
           operation +
           "Response "
           "xmlns:m=\"http://schemas.microsoft.com/exchange/services/2006/"
           "messages\" "
           "xmlns:t=\"http://schemas.microsoft.com/exchange/services/2006/"
           "types\"><m:ResponseMessages>" +
           messages + "</m:ResponseMessages></m:" + operation +
           "Response></s:Body></s:Envelope>";
}

inline std::string soap_success(const std::string& operation,
                                const std::string& items = std::string())
{
    return soap_response(operation,
                         "<m:" + operation +
                             "ResponseMessage ResponseClass=\"Success\">"
                             "<m:ResponseCode>NoError</m:ResponseCode>" +
                             items + "</m:" + operation + "ResponseMessage>");
}

inline std::string soap_error(const std::string& operation,
                              const std::string& code)
{
    return soap_response(operation,
                         "<m:" + operation +
                             "ResponseMessage ResponseClass=\"Error\">"
                             "<m:MessageText>Failed</m:MessageText>"
                             "<m:ResponseCode>" +
                             code + "</m:ResponseCode></m:" + operation +
                             "ResponseMessage>");
}

// A Type 2 (challenge) message as sent by the server
inline std::vector<unsigned char>
ntlm_challenge(const std::vector<unsigned char>& server_challenge,
               const std::vector<unsigned char>& target_info =
                   std::vector<unsigned char>())
{
    using namespace eas::internal::ntlm;

    std::vector<unsigned char> msg;
    put_signature(msg, 2);
    put_field(msg, 0, 48); // target name
    put_uint32(msg, negotiate_unicode | negotiate_ntlm | negotiate_target_info);
    msg.insert(msg.end(), server_challenge.begin(), server_challenge.end());
    put_uint32(msg, 0); // reserved
    put_uint32(msg, 0);
    put_field(msg, target_info.size(), 48);
    msg.insert(msg.end(), target_info.begin(), target_info.end());
    return msg;
}

// Per-test-case set-up and tear-down
class BaseFixture : public testing::Test
{
protected:
    static void SetUpTestCase() { eas::set_up(); }

    static void TearDownTestCase() { eas::tear_down(); }
};

// Services wired to fake executors, a fake folder lookup and a fake sync
// key provider
class FakeServiceFixture : public BaseFixture
{
public:
    FakeServiceFixture()
        : versions_("14.1"), keys_("key456"), caps_(versions_),
          native_notes_(executor_, folders_, keys_),
          ews_notes_(soap_, versions_, ews_states_),
          notes_(caps_, native_notes_, ews_notes_),
          native_tasks_(executor_, folders_, keys_),
          ews_tasks_(soap_, versions_), tasks_(caps_, native_tasks_, ews_tasks_)
    {
        folders_.add(eas::folder_type::notes, "notes123");
        folders_.add(eas::folder_type::deleted_items, "deleted4");
        folders_.add(eas::folder_type::tasks, "tasks7");
    }

    fake_command_executor& executor() { return executor_; }
    fake_soap_executor& soap() { return soap_; }
    fake_version_source& versions() { return versions_; }
    fake_folder_lookup& folders() { return folders_; }
    fake_sync_key_provider& keys() { return keys_; }
    eas::sync_key_store& ews_states() { return ews_states_; }
    eas::notes_service& notes() { return notes_; }
    eas::tasks_service& tasks() { return tasks_; }

private:
    fake_command_executor executor_;
    fake_soap_executor soap_;
    fake_version_source versions_;
    fake_folder_lookup folders_;
    fake_sync_key_provider keys_;
    eas::sync_key_store ews_states_;
    eas::capability_resolver caps_;
    eas::native_notes_backend native_notes_;
    eas::ews_notes_backend ews_notes_;
    eas::notes_service notes_;
    eas::native_tasks_backend native_tasks_;
    eas::ews_tasks_backend ews_tasks_;
    eas::tasks_service tasks_;
};

// Connection settings of a made-up account
inline eas::connection_settings test_settings()
{
    eas::connection_settings settings;
    settings.server_url = "https://mail.example.com";
    settings.username = "alice";
    settings.password = "secret";
    settings.domain = "EXAMPLE";
    settings.device_id = "dev1";
    settings.format = eas::wire_format::xml;
    return settings;
}

// An executor on top of http_request_mock
class FakeTransportFixture : public BaseFixture
{
public:
    FakeTransportFixture() : ctx_(test_settings()), executor_(ctx_) {}

    eas::connection_context& context() { return ctx_; }

    eas::basic_command_executor<http_request_mock>& executor()
    {
        return executor_;
    }

    const std::vector<http_request_mock::recorded_request>& requests() const
    {
        return http_request_mock::requests();
    }

protected:
    void SetUp() override { http_request_mock::storage::instance().clear(); }

    void TearDown() override
    {
        http_request_mock::storage::instance().clear();
    }

private:
    eas::connection_context ctx_;
    eas::basic_command_executor<http_request_mock> executor_;
};
} // namespace tests
