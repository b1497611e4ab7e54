
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
#include <memory>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <strings.h>
#include <type_traits>
#include <utility>
#include <vector>

#include "eas_fwd.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "logging.hpp"
#include "ntlm.hpp"
#include "requests.hpp"
#include "responses.hpp"
#include "wbxml.hpp"
#include "xml.hpp"

namespace eas
{
//! Encoding of ActiveSync request and response bodies
enum class wire_format
{
    //! Binary XML as used by every Exchange server
    wbxml,

    //! Plain XML text; useful against test servers and for debugging
    xml
};

//! Everything needed to talk to one account's server
struct connection_settings final
{
    //! Host name or URL of the server, e.g. https://mail.example.com
    std::string server_url;
    std::string username;
    std::string password;
    std::string domain;

    //! Identifies this device towards the server; generated if empty
    std::string device_id;
    std::string device_type;
    std::string user_agent;

    //! Whether to verify the server's TLS certificate and host name
    bool verify_tls;

    //! Upper bound for connecting and for every single request
    std::chrono::seconds timeout;
    wire_format format;

    connection_settings()
        : device_type("Android"), user_agent("eassync/1.0"), verify_tls(true),
          timeout(60), format(wire_format::wbxml)
    {
    }

    //! The account's credentials; a "DOMAIN\user" user name is split if no
    //! domain was given
    eas::credentials credentials() const
    {
        eas::credentials creds;
        creds.username = username;
        creds.password = password;
        creds.domain = domain;
        const auto backslash = username.find('\\');
        if (domain.empty() && backslash != std::string::npos)
        {
            creds.domain = username.substr(0, backslash);
            creds.username = username.substr(backslash + 1);
        }
        return creds;
    }
};

namespace internal
{
    inline std::string hex_encode(const std::vector<unsigned char>& buf)
    {
        static const char* const hex = "0123456789abcdef";
        std::string res;
        res.reserve(buf.size() * 2);
        for (const auto b : buf)
        {
            res += hex[b >> 4];
            res += hex[b & 0x0F];
        }
        return res;
    }

    //! A random 32 hex digit identifier, e.g. for ClientId
    inline std::string make_client_id()
    {
        return hex_encode(ntlm::random_bytes(16));
    }

    // Protocol versions we can speak, best first
    inline const std::vector<std::string>& supported_protocol_versions()
    {
        static const std::vector<std::string> versions = {"14.1", "14.0",
                                                          "12.1", "12.0"};
        return versions;
    }

    //! The version assumed when the server's versions cannot be detected:
    //! the oldest one supported
    inline const std::string& fallback_protocol_version()
    {
        return supported_protocol_versions().back();
    }

    //! Compares two "major.minor" version strings numerically
    inline int compare_versions(const std::string& lhs, const std::string& rhs)
    {
        const auto major_minor = [](const std::string& v) {
            char* end = nullptr;
            const auto major = strtol(v.c_str(), &end, 10);
            long minor = 0;
            if (end != nullptr && *end == '.')
            {
                minor = strtol(end + 1, nullptr, 10);
            }
            return std::make_pair(major, minor);
        };
        const auto l = major_minor(lhs);
        const auto r = major_minor(rhs);
        return l < r ? -1 : (r < l ? 1 : 0);
    }

    //! Splits a comma separated header value like "2.5,12.0,14.1"
    inline std::vector<std::string> split_versions(const std::string& header)
    {
        std::vector<std::string> res;
        std::string::size_type pos = 0;
        while (pos <= header.size())
        {
            auto comma = header.find(',', pos);
            if (comma == std::string::npos)
            {
                comma = header.size();
            }
            const auto v = trim(header.substr(pos, comma - pos));
            if (!v.empty())
            {
                res.push_back(v);
            }
            pos = comma + 1;
        }
        return res;
    }

    //! The best version both sides support, if any
    inline optional<std::string>
    select_protocol_version(const std::vector<std::string>& server_versions)
    {
        for (const auto& v : supported_protocol_versions())
        {
            if (std::find(server_versions.begin(), server_versions.end(), v) !=
                server_versions.end())
            {
                return v;
            }
        }
        return optional<std::string>();
    }

    //! EWS schema matching an ActiveSync protocol version: servers that
    //! speak 14.x are Exchange 2010 or later
    inline ews_schema ews_schema_for(const std::string& protocol_version)
    {
        return compare_versions(protocol_version, "14.0") >= 0
                   ? ews_schema::exchange_2010
                   : ews_schema::exchange_2007_sp1;
    }
} // namespace internal

//! \brief Per-account connection state.
//!
//! Holds the settings, the detected protocol version, the authentication
//! session, the provisioning policy key and the folder hierarchy sync key.
//! Created when an account connects and discarded on disconnect. Not
//! thread-safe: use one context per thread or serialize access, except for
//! cancel() which may be called from any thread.
class connection_context final
{
public:
    explicit connection_context(connection_settings settings)
        : settings_(std::move(settings)), auth_state_(auth_state::no_session),
          policy_key_("0"), folder_sync_key_("0"), cancelled_(false)
    {
        check<exception>(!settings_.server_url.empty(),
                         "Server URL must not be empty");
        if (settings_.device_id.empty())
        {
            settings_.device_id = internal::make_client_id();
        }
    }

    connection_context(const connection_context&) = delete;
    connection_context& operator=(const connection_context&) = delete;

    const connection_settings& settings() const EAS_NOEXCEPT
    {
        return settings_;
    }

    //! The detected protocol version; unset until detection succeeded
    const internal::optional<std::string>& protocol_version() const
        EAS_NOEXCEPT
    {
        return protocol_version_;
    }

    void set_protocol_version(std::string version)
    {
        protocol_version_ = std::move(version);
    }

    void reset_protocol_version()
    {
        protocol_version_ = internal::optional<std::string>();
    }

    //! Value of the Authorization header of the negotiated session, if any
    const internal::optional<std::string>& session() const EAS_NOEXCEPT
    {
        return session_;
    }

    void set_session(std::string token)
    {
        session_ = std::move(token);
        auth_state_ = auth_state::session_established;
    }

    //! Drops the session; the next request starts over with Basic
    //! authentication
    void clear_session(auth_state state = auth_state::no_session)
    {
        session_ = internal::optional<std::string>();
        auth_state_ = state;
    }

    auth_state authentication_state() const EAS_NOEXCEPT
    {
        return auth_state_;
    }

    const std::string& policy_key() const EAS_NOEXCEPT { return policy_key_; }

    void set_policy_key(std::string key) { policy_key_ = std::move(key); }

    const std::string& folder_sync_key() const EAS_NOEXCEPT
    {
        return folder_sync_key_;
    }

    void set_folder_sync_key(std::string key)
    {
        folder_sync_key_ = std::move(key);
    }

    //! Aborts the request in flight and makes every further request fail
    //! with error_code::cancelled until reset_cancellation() is called
    void cancel() EAS_NOEXCEPT { cancelled_.store(true); }

    void reset_cancellation() EAS_NOEXCEPT { cancelled_.store(false); }

    bool is_cancelled() const EAS_NOEXCEPT { return cancelled_.load(); }

    const std::atomic<bool>* cancellation_flag() const EAS_NOEXCEPT
    {
        return &cancelled_;
    }

private:
    connection_settings settings_;
    internal::optional<std::string> protocol_version_;
    internal::optional<std::string> session_;
    auth_state auth_state_;
    std::string policy_key_;
    std::string folder_sync_key_;
    std::atomic<bool> cancelled_;
};

//! Resolves the endpoints of both protocols from the configured server URL
class url_resolver
{
public:
    virtual ~url_resolver() = default;

    //! The ActiveSync endpoint, e.g.
    //! https://mail.example.com/Microsoft-Server-ActiveSync
    virtual std::string activesync_url() const = 0;

    //! The EWS endpoint, e.g. https://mail.example.com/EWS/Exchange.asmx
    virtual std::string ews_url() const = 0;
};

//! Derives both endpoints from the server's base URL
class default_url_resolver final : public url_resolver
{
public:
    explicit default_url_resolver(const std::string& server_url)
        : base_(base_url(server_url))
    {
    }

    std::string activesync_url() const override
    {
        return base_ + "/Microsoft-Server-ActiveSync";
    }

    std::string ews_url() const override
    {
        return base_ + "/EWS/Exchange.asmx";
    }

    //! Adds https:// if there is no scheme and strips any known endpoint
    //! path and trailing slashes
    static std::string base_url(const std::string& server_url)
    {
        auto url = internal::trim(server_url);
        if (url.find("://") == std::string::npos)
        {
            url = "https://" + url;
        }

        bool stripped = true;
        while (stripped)
        {
            stripped = false;
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            for (const auto suffix :
                 {"/default.eas", "/Microsoft-Server-ActiveSync",
                  "/EWS/Exchange.asmx"})
            {
                const auto len = strlen(suffix);
                if (url.size() >= len &&
                    strcasecmp(url.c_str() + url.size() - len, suffix) == 0)
                {
                    url.erase(url.size() - len);
                    stripped = true;
                }
            }
        }
        return url;
    }

private:
    std::string base_;
};

//! \brief Executes ActiveSync commands.
//!
//! Implementations own the HTTP exchange: headers, authentication, WBXML
//! coding and mapping of HTTP failures to exceptions.
class command_executor
{
public:
    virtual ~command_executor() = default;

    //! \brief Sends a command and returns the response as XML text.
    //!
    //! The returned string is empty if the server sent no body. Throws on
    //! transport, HTTP and authentication failures.
    virtual std::string send_command(const std::string& command,
                                     const std::string& xml) = 0;

    //! \brief Sends a command and parses the response with given parser.
    //!
    //! Never throws for expected failures; they are returned as error.
    template <typename Parser>
    result<typename std::result_of<Parser(const std::string&)>::type>
    execute(const std::string& command, const std::string& xml, Parser parse)
    {
        typedef typename std::result_of<Parser(const std::string&)>::type
            value_type;
        return internal::capture<value_type>(
            [&]() { return parse(send_command(command, xml)); });
    }
};

//! Posts SOAP envelopes to the EWS endpoint
class soap_executor
{
public:
    virtual ~soap_executor() = default;

    //! \brief Sends the envelope and returns the response document.
    //!
    //! Throws soap_fault if the server answered with a SOAP fault.
    virtual std::string send_soap(const std::string& action,
                                  const std::string& envelope) = 0;
};

//! Asks the server which ActiveSync versions it supports
class options_query
{
public:
    virtual ~options_query() = default;

    //! Throws on failure
    virtual std::vector<std::string> supported_protocol_versions() = 0;
};

//! Source of the protocol version to use with a connection
class version_source
{
public:
    virtual ~version_source() = default;

    //! The version to use; never fails
    virtual std::string protocol_version() = 0;

    virtual bool is_version_detected() const = 0;
};

//! \brief The HTTP implementation of command_executor, soap_executor and
//! options_query.
//!
//! RequestHandler is the HTTP layer, internal::http_request by default. If
//! the server rejects Basic authentication and offers NTLM, the handshake is
//! run once on the same connection and the request is retried once. A second
//! rejection is an authentication_error.
template <typename RequestHandler = internal::http_request>
class basic_command_executor final : public command_executor,
                                     public soap_executor,
                                     public options_query
{
public:
    typedef authentication_negotiator<RequestHandler> negotiator_type;

    explicit basic_command_executor(connection_context& ctx)
        : ctx_(ctx),
          urls_(new default_url_resolver(ctx.settings().server_url)),
          negotiator_(new ntlm_negotiator<RequestHandler>())
    {
    }

    basic_command_executor(connection_context& ctx,
                           std::unique_ptr<url_resolver> urls,
                           std::unique_ptr<negotiator_type> negotiator)
        : ctx_(ctx), urls_(std::move(urls)), negotiator_(std::move(negotiator))
    {
        check(urls_ != nullptr, "URL resolver must not be null");
        check(negotiator_ != nullptr, "Negotiator must not be null");
    }

    const url_resolver& urls() const EAS_NOEXCEPT { return *urls_; }

    //! URL of given ActiveSync command
    std::string command_url(const std::string& command) const
    {
        using internal::curl_escape;

        const auto& settings = ctx_.settings();
        const internal::curl_ptr curl;
        return urls_->activesync_url() + "/default.eas?Cmd=" +
               curl_escape(curl, command) + "&User=" +
               curl_escape(curl,
                           settings.credentials().qualified_username()) +
               "&DeviceId=" + curl_escape(curl, settings.device_id) +
               "&DeviceType=" + curl_escape(curl, settings.device_type);
    }

    std::string send_command(const std::string& command,
                             const std::string& xml) override
    {
        const auto& settings = ctx_.settings();
        const bool use_wbxml = settings.format == wire_format::wbxml;
        const auto version = ctx_.protocol_version().value_or(
            internal::fallback_protocol_version());

        RequestHandler handler(command_url(command));
        prepare(handler);
        handler.set_method(RequestHandler::method::POST);
        handler.set_content_type(use_wbxml ? "application/vnd.ms-sync.wbxml"
                                           : "text/xml");
        handler.set_header("MS-ASProtocolVersion", version);
        if (!ctx_.policy_key().empty())
        {
            handler.set_header("X-MS-PolicyKey", ctx_.policy_key());
        }

        internal::logger()->debug("{} (protocol version {})", command,
                                  version);
        internal::logger()->trace("Request: {}", xml);

        const auto body = use_wbxml ? internal::wbxml_encode(xml) : xml;
        auto response = send_authenticated(handler, body);

        if (response.code() == 449L)
        {
            throw status_error(error_code::provisioning_required,
                               command + ": server requires provisioning",
                               449);
        }
        if (!response.ok())
        {
            throw http_error(response.code());
        }

        const auto& content = response.content();
        std::string decoded;
        if (!content.empty() && looks_like_wbxml(response))
        {
            decoded = internal::wbxml_decode(content);
        }
        else
        {
            decoded = content;
        }
        internal::logger()->trace("Response: {}", decoded);
        return decoded;
    }

    std::string send_soap(const std::string& action,
                          const std::string& envelope) override
    {
        RequestHandler handler(urls_->ews_url());
        prepare(handler);
        handler.set_method(RequestHandler::method::POST);
        handler.set_content_type("text/xml; charset=utf-8");
        handler.set_header("SOAPAction",
                           "\"" + std::string(internal::ews_messages_uri()) +
                               "/" + action + "\"");

        internal::logger()->debug("EWS {}", action);
        internal::logger()->trace("Request: {}", envelope);

        auto response = send_authenticated(handler, envelope);
        internal::logger()->trace("Response: {}", response.content());

        if (response.is_soap_fault())
        {
            // Raises soap_fault if the body is a well-formed fault
            internal::xml_document doc(response.content());
            internal::check_soap_fault(doc);
            throw http_error(response.code());
        }
        if (!response.ok())
        {
            throw http_error(response.code());
        }
        return response.content();
    }

    std::vector<std::string> supported_protocol_versions() override
    {
        RequestHandler handler(urls_->activesync_url());
        prepare(handler);
        handler.set_method(RequestHandler::method::OPTIONS);

        auto response = send_authenticated(handler, std::string());
        if (!response.ok())
        {
            throw http_error(response.code());
        }
        const auto header = response.header("MS-ASProtocolVersions");
        if (!header.has_value())
        {
            throw internal::missing_field("MS-ASProtocolVersions");
        }
        return internal::split_versions(header.value());
    }

private:
    connection_context& ctx_;
    std::unique_ptr<url_resolver> urls_;
    std::unique_ptr<negotiator_type> negotiator_;

    void prepare(RequestHandler& handler)
    {
        if (ctx_.is_cancelled())
        {
            throw cancelled_error();
        }
        const auto& settings = ctx_.settings();
        handler.set_header("User-Agent", settings.user_agent);
        handler.set_timeout(settings.timeout);
        handler.set_tls_verification(settings.verify_tls);
        handler.set_cancellation_flag(ctx_.cancellation_flag());
    }

    static bool looks_like_wbxml(const internal::http_response& response)
    {
        const auto type = response.header("Content-Type");
        if (type.has_value())
        {
            return type.value().find("wbxml") != std::string::npos;
        }
        return response.content()[0] == '\x03';
    }

    static bool offers_ntlm(const internal::http_response& response)
    {
        for (const auto& value : response.header_values("WWW-Authenticate"))
        {
            if (strncasecmp(internal::trim(value).c_str(), "NTLM", 4) == 0)
            {
                return true;
            }
        }
        return false;
    }

    // Sends the request with the current credentials. Runs the NTLM
    // handshake at most once per request.
    internal::http_response send_authenticated(RequestHandler& handler,
                                               const std::string& body)
    {
        const auto creds = ctx_.settings().credentials();
        const bool had_session = ctx_.session().has_value();

        // NTLM authenticates a connection, not a request: with an
        // established session every new connection repeats the handshake
        if (!had_session)
        {
            handler.set_header("Authorization",
                               internal::basic_authorization(creds));
            auto response = handler.send(body);
            if (response.code() != 401L)
            {
                return response;
            }
            if (!offers_ntlm(response))
            {
                ctx_.clear_session(auth_state::failed);
                throw authentication_error(
                    "Server rejected the credentials of " +
                    creds.qualified_username());
            }
        }

        const auto token = negotiator_->negotiate(handler, body, creds);
        if (!token.has_value())
        {
            ctx_.clear_session(auth_state::failed);
            throw authentication_error("NTLM negotiation failed for " +
                                       creds.qualified_username());
        }
        ctx_.set_session(token.value());

        handler.set_header("Authorization", token.value());
        auto response = handler.send(body);
        if (response.code() == 401L)
        {
            ctx_.clear_session(auth_state::failed);
            throw authentication_error(
                "Server rejected the NTLM session of " +
                creds.qualified_username());
        }
        return response;
    }
};

//! \brief Detects the protocol version once per connection.
//!
//! The detected version is cached in the connection context. If detection
//! fails the oldest supported version is returned (and not cached, so the
//! next call tries again).
class version_detector final : public version_source
{
public:
    version_detector(connection_context& ctx, options_query& query)
        : ctx_(ctx), options_(query)
    {
    }

    std::string protocol_version() override
    {
        if (ctx_.protocol_version().has_value())
        {
            return ctx_.protocol_version().value();
        }

        try
        {
            const auto offered = options_.supported_protocol_versions();
            const auto selected = internal::select_protocol_version(offered);
            if (selected.has_value())
            {
                internal::logger()->info("Using protocol version {}",
                                         selected.value());
                ctx_.set_protocol_version(selected.value());
                return selected.value();
            }
            internal::logger()->warn(
                "Server offers no supported protocol version");
        }
        catch (cancelled_error&)
        {
            throw;
        }
        catch (exception& exc)
        {
            internal::logger()->warn("Protocol version detection failed: {}",
                                     exc.what());
        }
        return internal::fallback_protocol_version();
    }

    bool is_version_detected() const override
    {
        return ctx_.protocol_version().has_value();
    }

private:
    connection_context& ctx_;
    options_query& options_;
};

//! The two ways an operation can reach the server
enum class protocol_path
{
    //! ActiveSync
    native,

    //! EWS SOAP
    soap
};

//! Operation families with their own capability threshold
enum class capability
{
    folders,
    mail,
    notes,
    tasks,
    move,
    mailbox_search,
    gal_search
};

namespace internal
{
    inline std::string enum_to_str(protocol_path path)
    {
        switch (path)
        {
        case protocol_path::native:
            return "native";
        case protocol_path::soap:
            return "soap";
        default:
            throw exception("Unexpected <protocol_path>");
        }
    }

    //! Lowest protocol version that can do this natively. Notes and tasks
    //! classes are only synced by 14.0 and later.
    inline const char* native_threshold(capability cap) EAS_NOEXCEPT
    {
        switch (cap)
        {
        case capability::notes:
        case capability::tasks:
            return "14.0";
        default:
            return "12.0";
        }
    }

    //! Whether the operation family can fall back to EWS
    inline bool has_soap_path(capability cap) EAS_NOEXCEPT
    {
        return cap == capability::notes || cap == capability::tasks ||
               cap == capability::gal_search;
    }
} // namespace internal

//! \brief Picks the protocol path of an operation.
//!
//! The single place where the detected version decides between ActiveSync
//! and EWS.
class capability_resolver final
{
public:
    explicit capability_resolver(version_source& versions)
        : versions_(versions)
    {
    }

    protocol_path path_for(capability cap)
    {
        const auto version = versions_.protocol_version();
        if (internal::compare_versions(version,
                                       internal::native_threshold(cap)) >= 0)
        {
            return protocol_path::native;
        }
        return internal::has_soap_path(cap) ? protocol_path::soap
                                            : protocol_path::native;
    }

    //! The path to try if the first one reports not_supported
    static internal::optional<protocol_path> alternative(capability cap,
                                                         protocol_path path)
    {
        if (!internal::has_soap_path(cap))
        {
            return internal::optional<protocol_path>();
        }
        return path == protocol_path::native ? protocol_path::soap
                                             : protocol_path::native;
    }

    //! EWS schema version to announce for the current connection
    ews_schema schema()
    {
        return internal::ews_schema_for(versions_.protocol_version());
    }

private:
    version_source& versions_;
};

namespace internal
{
    //! \brief Runs func on the backend for the operation's protocol path.
    //!
    //! If that path turns out not to support the operation (capability
    //! error, HTTP 501 or a not_supported status) and the operation has a
    //! second path, func runs once more on the other backend.
    template <typename T, typename Backend, typename Function>
    inline T dispatch(capability_resolver& caps, capability cap,
                      Backend& native, Backend& soap, Function func)
    {
        const auto path = caps.path_for(cap);
        std::string reason;
        try
        {
            return func(path == protocol_path::native ? native : soap);
        }
        catch (capability_error& exc)
        {
            reason = exc.what();
        }
        catch (http_error& exc)
        {
            if (exc.code() != 501L)
            {
                throw;
            }
            reason = exc.what();
        }
        catch (status_error& exc)
        {
            if (exc.code() != error_code::not_supported)
            {
                throw;
            }
            reason = exc.what();
        }

        const auto alt = capability_resolver::alternative(cap, path);
        if (!alt.has_value())
        {
            throw capability_error(reason);
        }
        logger()->info("The {} path does not support this operation ({}), "
                       "trying {}",
                       enum_to_str(path), reason, enum_to_str(alt.value()));
        return func(alt.value() == protocol_path::native ? native : soap);
    }
} // namespace internal

//! \brief Runs the two-phase Provision exchange.
//!
//! Asks for the policy, acknowledges it and stores the final policy key in
//! the connection context.
class provisioner final
{
public:
    provisioner(connection_context& ctx, command_executor& executor)
        : ctx_(ctx), executor_(executor)
    {
    }

    //! Returns the final policy key
    std::string provision()
    {
        ctx_.set_policy_key("0");
        auto first = internal::parse_provision_response(
            executor_.send_command("Provision", internal::provision_request()));
        check_status(first);

        // Policy status 2: the server has no policy for this device
        if (first.policy_status == 2 || first.policy_key.empty())
        {
            ctx_.set_policy_key("0");
            return ctx_.policy_key();
        }

        ctx_.set_policy_key(first.policy_key);
        auto second = internal::parse_provision_response(executor_.send_command(
            "Provision", internal::provision_ack_request(first.policy_key)));
        check_status(second);
        if (second.policy_key.empty())
        {
            throw internal::missing_field("PolicyKey");
        }
        ctx_.set_policy_key(second.policy_key);
        internal::logger()->info("Device provisioned");
        return ctx_.policy_key();
    }

private:
    static void check_status(const internal::provision_response& res)
    {
        if (res.status != 1)
        {
            throw status_error(error_code::server_status,
                               "Provision: server returned status " +
                                   std::to_string(res.status),
                               res.status);
        }
        if (res.policy_status != 1 && res.policy_status != 2)
        {
            throw status_error(error_code::server_status,
                               "Provision: policy status " +
                                   std::to_string(res.policy_status),
                               res.policy_status);
        }
    }

    connection_context& ctx_;
    command_executor& executor_;
};
} // namespace eas
