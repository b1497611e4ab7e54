
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

#ifndef OPENSSL_SUPPRESS_DEPRECATED
#    define OPENSSL_SUPPRESS_DEPRECATED
#endif

#include <chrono>
#include <ctype.h>
#include <errno.h>
#include <iconv.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <strings.h>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/md4.h>
#include <openssl/rand.h>

#include "errors.hpp"
#include "http.hpp"
#include "logging.hpp"
#include "xml.hpp"

namespace eas
{
//! User name, password and Windows domain of an account
struct credentials final
{
    std::string username;
    std::string password;
    std::string domain;

    //! The user name qualified with the domain, "DOMAIN\user", or just the
    //! user name if there is no domain
    std::string qualified_username() const
    {
        return domain.empty() ? username : domain + "\\" + username;
    }
};

//! State of the NTLM handshake of one connection
enum class auth_state
{
    no_session,
    challenge_sent,
    session_established,
    failed
};

namespace internal
{
    inline std::string enum_to_str(auth_state state)
    {
        switch (state)
        {
        case auth_state::no_session:
            return "no_session";
        case auth_state::challenge_sent:
            return "challenge_sent";
        case auth_state::session_established:
            return "session_established";
        case auth_state::failed:
            return "failed";
        default:
            throw exception("Unexpected <auth_state>");
        }
    }

    // Value of the Authorization header for HTTP basic authentication
    inline std::string basic_authorization(const credentials& creds)
    {
        return "Basic " + base64::encode(creds.qualified_username() + ":" +
                                         creds.password);
    }

    // NTLMv2 message codec (MS-NLMP). Only the connection-oriented
    // three-message exchange used by HTTP is implemented.
    namespace ntlm
    {
        typedef std::vector<unsigned char> bytes;

        enum negotiate_flags : uint32_t
        {
            negotiate_unicode = 0x00000001,
            negotiate_oem = 0x00000002,
            request_target = 0x00000004,
            negotiate_ntlm = 0x00000200,
            negotiate_always_sign = 0x00008000,
            negotiate_extended_session_security = 0x00080000,
            negotiate_target_info = 0x00800000,
            negotiate_128 = 0x20000000,
            negotiate_56 = 0x80000000
        };

        inline const char* workstation() EAS_NOEXCEPT { return "EASSYNC"; }

        inline void put_uint16(bytes& buf, uint16_t val)
        {
            buf.push_back(static_cast<unsigned char>(val & 0xFF));
            buf.push_back(static_cast<unsigned char>((val >> 8) & 0xFF));
        }

        inline void put_uint32(bytes& buf, uint32_t val)
        {
            for (int i = 0; i < 4; ++i)
            {
                buf.push_back(
                    static_cast<unsigned char>((val >> (8 * i)) & 0xFF));
            }
        }

        inline uint16_t get_uint16(const bytes& buf, size_t offset)
        {
            return static_cast<uint16_t>(buf[offset] | (buf[offset + 1] << 8));
        }

        inline uint32_t get_uint32(const bytes& buf, size_t offset)
        {
            return static_cast<uint32_t>(buf[offset]) |
                   (static_cast<uint32_t>(buf[offset + 1]) << 8) |
                   (static_cast<uint32_t>(buf[offset + 2]) << 16) |
                   (static_cast<uint32_t>(buf[offset + 3]) << 24);
        }

        inline void put_signature(bytes& buf, uint32_t message_type)
        {
            static const char signature[] = "NTLMSSP";
            buf.insert(buf.end(), signature, signature + sizeof(signature));
            put_uint32(buf, message_type);
        }

        // Writes a security buffer (length, allocated length, offset)
        inline void put_field(bytes& buf, size_t length, size_t offset)
        {
            put_uint16(buf, static_cast<uint16_t>(length));
            put_uint16(buf, static_cast<uint16_t>(length));
            put_uint32(buf, static_cast<uint32_t>(offset));
        }

        // RAII wrapper around an iconv(3) conversion descriptor
        class iconv_handle final
        {
        public:
            iconv_handle(const char* to, const char* from)
                : cd_(iconv_open(to, from))
            {
                const auto invalid =
                    reinterpret_cast<iconv_t>(static_cast<intptr_t>(-1));
                if (cd_ == invalid)
                {
                    throw exception(std::string("iconv_open failed: ") +
                                    strerror(errno));
                }
            }

            ~iconv_handle() { iconv_close(cd_); }

            iconv_handle(const iconv_handle&) = delete;
            iconv_handle& operator=(const iconv_handle&) = delete;

            iconv_t get() const EAS_NOEXCEPT { return cd_; }

        private:
            iconv_t cd_;
        };

        // Converts UTF-8 to UTF-16LE; throws on malformed input
        inline bytes to_utf16le(const std::string& str)
        {
            if (str.empty())
            {
                return bytes();
            }
            const iconv_handle conv("UTF-16LE", "UTF-8");

            std::vector<char> in(str.begin(), str.end());
            // Every UTF-8 sequence is at least as long as half its UTF-16
            // encoding
            std::vector<char> out(2 * in.size());
            auto pin = &in[0];
            auto pout = &out[0];
            auto in_left = in.size();
            auto out_left = out.size();
            if (iconv(conv.get(), &pin, &in_left, &pout, &out_left) ==
                static_cast<size_t>(-1))
            {
                throw exception(std::string("Invalid UTF-8 in NTLM input: ") +
                                strerror(errno));
            }
            return bytes(out.begin(), out.end() - out_left);
        }

        inline std::string to_upper(std::string str)
        {
            for (auto& c : str)
            {
                c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
            }
            return str;
        }

        inline bytes hmac_md5(const bytes& key, const bytes& data)
        {
            bytes digest(EVP_MAX_MD_SIZE);
            unsigned int len = 0;
            const auto res =
                HMAC(EVP_md5(), key.data(), static_cast<int>(key.size()),
                     data.data(), data.size(), &digest[0], &len);
            check<exception>(res != nullptr, "HMAC-MD5 failed");
            digest.resize(len);
            return digest;
        }

        // NTOWFv1: MD4 of the UTF-16LE password
        inline bytes nt_hash(const std::string& password)
        {
            const auto unicode = to_utf16le(password);
            bytes digest(MD4_DIGEST_LENGTH);
            MD4_CTX ctx;
            check<exception>(MD4_Init(&ctx) == 1 &&
                                 MD4_Update(&ctx, unicode.data(),
                                            unicode.size()) == 1 &&
                                 MD4_Final(&digest[0], &ctx) == 1,
                             "MD4 failed");
            return digest;
        }

        // NTOWFv2 (and LMOWFv2): HMAC-MD5 keyed with the NT hash over the
        // upper-cased user name followed by the domain
        inline bytes ntowf_v2(const std::string& password,
                              const std::string& username,
                              const std::string& domain)
        {
            return hmac_md5(nt_hash(password),
                            to_utf16le(to_upper(username) + domain));
        }

        // Current time as Windows FILETIME (100ns ticks since 1601-01-01)
        inline uint64_t filetime_now()
        {
            using namespace std::chrono;
            const auto since_epoch =
                duration_cast<microseconds>(
                    system_clock::now().time_since_epoch())
                    .count();
            return (static_cast<uint64_t>(since_epoch) +
                    11644473600000000ULL) *
                   10ULL;
        }

        //! The Type 1 message: announces our capabilities
        inline bytes negotiate_message(const std::string& domain)
        {
            const auto dom = to_upper(domain);
            const std::string ws = workstation();
            const uint32_t flags = negotiate_unicode | negotiate_oem |
                                   request_target | negotiate_ntlm |
                                   negotiate_always_sign |
                                   negotiate_extended_session_security |
                                   negotiate_128 | negotiate_56;
            const size_t header_size = 32;

            bytes msg;
            put_signature(msg, 1);
            put_uint32(msg, flags);
            put_field(msg, dom.size(), header_size);
            put_field(msg, ws.size(), header_size + dom.size());
            msg.insert(msg.end(), dom.begin(), dom.end());
            msg.insert(msg.end(), ws.begin(), ws.end());
            return msg;
        }

        //! Contents of a server's Type 2 message we need for the response
        struct challenge_message
        {
            uint32_t flags;
            bytes server_challenge;
            bytes target_info;
        };

        inline optional<challenge_message> parse_challenge(const bytes& msg)
        {
            static const unsigned char signature[] = "NTLMSSP";
            if (msg.size() < 32 ||
                memcmp(msg.data(), signature, sizeof(signature)) != 0 ||
                get_uint32(msg, 8) != 2)
            {
                return optional<challenge_message>();
            }

            challenge_message challenge;
            challenge.flags = get_uint32(msg, 20);
            challenge.server_challenge.assign(msg.begin() + 24,
                                              msg.begin() + 32);
            if (msg.size() >= 48)
            {
                const size_t length = get_uint16(msg, 40);
                const size_t offset = get_uint32(msg, 44);
                if (offset + length <= msg.size())
                {
                    challenge.target_info.assign(msg.begin() + offset,
                                                 msg.begin() + offset + length);
                }
            }
            return challenge;
        }

        // LMv2: HMAC over both challenges, followed by the client challenge
        inline bytes lmv2_response(const bytes& response_key,
                                   const bytes& server_challenge,
                                   const bytes& client_challenge)
        {
            auto data = server_challenge;
            data.insert(data.end(), client_challenge.begin(),
                        client_challenge.end());
            auto response = hmac_md5(response_key, data);
            response.insert(response.end(), client_challenge.begin(),
                            client_challenge.end());
            return response;
        }

        // NTLMv2: NTProofStr followed by the client blob ("temp")
        inline bytes ntlmv2_response(const bytes& response_key,
                                     const bytes& server_challenge,
                                     const bytes& client_challenge,
                                     uint64_t timestamp,
                                     const bytes& target_info)
        {
            bytes blob;
            blob.push_back(0x01);
            blob.push_back(0x01);
            put_uint16(blob, 0);
            put_uint32(blob, 0);
            put_uint32(blob, static_cast<uint32_t>(timestamp & 0xFFFFFFFFULL));
            put_uint32(blob, static_cast<uint32_t>(timestamp >> 32));
            blob.insert(blob.end(), client_challenge.begin(),
                        client_challenge.end());
            put_uint32(blob, 0);
            blob.insert(blob.end(), target_info.begin(), target_info.end());
            put_uint32(blob, 0);

            auto data = server_challenge;
            data.insert(data.end(), blob.begin(), blob.end());
            auto response = hmac_md5(response_key, data);
            response.insert(response.end(), blob.begin(), blob.end());
            return response;
        }

        //! The Type 3 message: proves knowledge of the password
        inline bytes authenticate_message(const challenge_message& challenge,
                                          const credentials& creds,
                                          const bytes& client_challenge,
                                          uint64_t timestamp)
        {
            const auto key =
                ntowf_v2(creds.password, creds.username, creds.domain);
            const auto lm = lmv2_response(key, challenge.server_challenge,
                                          client_challenge);
            const auto nt =
                ntlmv2_response(key, challenge.server_challenge,
                                client_challenge, timestamp,
                                challenge.target_info);
            const auto domain = to_utf16le(to_upper(creds.domain));
            const auto user = to_utf16le(creds.username);
            const auto ws = to_utf16le(workstation());
            const uint32_t flags = negotiate_unicode | negotiate_ntlm |
                                   negotiate_always_sign |
                                   negotiate_extended_session_security |
                                   negotiate_target_info | negotiate_128 |
                                   negotiate_56;

            size_t offset = 64;
            bytes msg;
            put_signature(msg, 3);
            put_field(msg, lm.size(), offset);
            offset += lm.size();
            put_field(msg, nt.size(), offset);
            offset += nt.size();
            put_field(msg, domain.size(), offset);
            offset += domain.size();
            put_field(msg, user.size(), offset);
            offset += user.size();
            put_field(msg, ws.size(), offset);
            offset += ws.size();
            put_field(msg, 0, offset); // no session key exchange
            put_uint32(msg, flags);

            for (const auto* payload : {&lm, &nt, &domain, &user, &ws})
            {
                msg.insert(msg.end(), payload->begin(), payload->end());
            }
            return msg;
        }

        // Picks the NTLM challenge out of a list of WWW-Authenticate header
        // values. A bare "NTLM" offer (no token) yields an empty message.
        inline optional<bytes>
        challenge_from_headers(const std::vector<std::string>& values)
        {
            for (const auto& value : values)
            {
                const auto trimmed = trim(value);
                if (strncasecmp(trimmed.c_str(), "NTLM", 4) != 0)
                {
                    continue;
                }
                const auto token = trim(trimmed.substr(4));
                try
                {
                    return base64::decode(token);
                }
                catch (exception& exc)
                {
                    logger()->warn("Malformed NTLM challenge: {}", exc.what());
                    return optional<bytes>();
                }
            }
            return optional<bytes>();
        }

        inline bytes random_bytes(size_t count)
        {
            bytes buf(count);
            check<exception>(RAND_bytes(&buf[0], static_cast<int>(count)) == 1,
                             "Could not gather random bytes");
            return buf;
        }
    } // namespace ntlm
} // namespace internal

//! \brief Performs the handshake needed when basic credentials are
//! rejected.
//!
//! Implementations run a challenge/response exchange over the given
//! request handler and return the value for the Authorization header of
//! the retried request. A rejected or unusable challenge yields an empty
//! optional; cancellation and transport failures propagate.
template <typename RequestHandler> class authentication_negotiator
{
public:
    virtual ~authentication_negotiator() = default;

    virtual internal::optional<std::string>
    negotiate(RequestHandler& handler, const std::string& request_body,
              const credentials& creds) = 0;

    virtual auth_state state() const = 0;
};

//! \brief NTLMv2 over HTTP.
//!
//! Sends the Type 1 message with the original request, picks the Type 2
//! challenge out of the 401 response and builds the Type 3 message. The
//! Type 3 message must be sent on the same connection, so the caller retries
//! the request with the same handler.
template <typename RequestHandler>
class ntlm_negotiator final : public authentication_negotiator<RequestHandler>
{
public:
    ntlm_negotiator() : state_(auth_state::no_session) {}

    internal::optional<std::string>
    negotiate(RequestHandler& handler, const std::string& request_body,
              const credentials& creds) override
    {
        using namespace internal;

        state_ = auth_state::no_session;
        try
        {
            handler.set_header(
                "Authorization",
                "NTLM " +
                    base64::encode(ntlm::negotiate_message(creds.domain)));
            auto response = handler.send(request_body);
            state_ = auth_state::challenge_sent;

            if (response.code() != 401L)
            {
                logger()->warn("NTLM negotiation: expected a challenge, got "
                               "HTTP status {}",
                               response.code());
                state_ = auth_state::failed;
                return optional<std::string>();
            }

            const auto raw = ntlm::challenge_from_headers(
                response.header_values("WWW-Authenticate"));
            const auto challenge = raw.has_value()
                                       ? ntlm::parse_challenge(raw.value())
                                       : optional<ntlm::challenge_message>();
            if (!challenge.has_value())
            {
                logger()->warn("NTLM negotiation: no usable challenge");
                state_ = auth_state::failed;
                return optional<std::string>();
            }

            const auto message = ntlm::authenticate_message(
                challenge.value(), creds, ntlm::random_bytes(8),
                ntlm::filetime_now());
            state_ = auth_state::session_established;
            logger()->debug("NTLM session established for {}",
                            creds.qualified_username());
            return "NTLM " + base64::encode(message);
        }
        catch (cancelled_error&)
        {
            state_ = auth_state::no_session;
            throw;
        }
        catch (transport_error&)
        {
            state_ = auth_state::no_session;
            throw;
        }
        catch (exception& exc)
        {
            logger()->warn("NTLM negotiation failed: {}", exc.what());
            state_ = auth_state::failed;
            return optional<std::string>();
        }
    }

    auth_state state() const override { return state_; }

private:
    auth_state state_;
};
} // namespace eas
