
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
#include <stdexcept>
#include <string>
#include <utility>

#include "eas_fwd.hpp"

namespace eas
{
template <typename ExceptionType = assertion_error>
inline void check(bool expr, const char* msg)
{
    if (!expr)
    {
        throw ExceptionType(msg);
    }
}

//! Base-class for all exceptions thrown by this library
class exception : public std::runtime_error
{
public:
    explicit exception(const std::string& what) : std::runtime_error(what) {}
    explicit exception(const char* what) : std::runtime_error(what) {}
};

//! Raised when an assertion fails
class assertion_error final : public exception
{
public:
    explicit assertion_error(const std::string& what) : exception(what) {}
    explicit assertion_error(const char* what) : exception(what) {}
};

//! Raised when a response from a server could not be parsed
class xml_parse_error final : public exception
{
public:
    explicit xml_parse_error(const std::string& what) : exception(what) {}
    explicit xml_parse_error(const char* what) : exception(what) {}
};

//! Raised when a WBXML document could not be encoded or decoded
class wbxml_error final : public exception
{
public:
    explicit wbxml_error(const std::string& what) : exception(what) {}
    explicit wbxml_error(const char* what) : exception(what) {}
};

//! Raised when the transport layer (libcurl) fails to complete a request,
//! e.g. connection refused, time-out or a TLS handshake failure
class transport_error : public exception
{
public:
    explicit transport_error(const std::string& what) : exception(what) {}
    explicit transport_error(const char* what) : exception(what) {}
};

//! Raised when an in-flight request was cancelled by the caller
class cancelled_error final : public exception
{
public:
    cancelled_error() : exception("Operation was cancelled") {}
};

//! Raised when a HTTP request was not successful
class http_error final : public exception
{
public:
    explicit http_error(long status_code)
        : exception("HTTP status code: " + std::to_string(status_code)),
          code_(status_code)
    {
    }

    long code() const EAS_NOEXCEPT { return code_; }

private:
    long code_;
};

//! \brief Raised when the server rejected our credentials.
//!
//! Either basic authentication failed and the server offered no other
//! scheme or the negotiated session was rejected as well. This is terminal
//! for the current operation.
class authentication_error final : public exception
{
public:
    explicit authentication_error(const std::string& what) : exception(what)
    {
    }
};

//! \brief A SOAP fault occurred due to a bad request.
//!
//! Raised when the EWS endpoint answers with HTTP 500 and a SOAP fault
//! element instead of a response message.
class soap_fault final : public exception
{
public:
    explicit soap_fault(const std::string& what) : exception(what) {}
    explicit soap_fault(const char* what) : exception(what) {}
};

//! Classification of every failure an operation of this library can report
enum class error_code
{
    //! Connection refused, time-out, TLS failure
    transport,

    //! The server answered with an unexpected HTTP status code
    http_status,

    //! Credentials were rejected even after negotiating a session
    authentication_failed,

    //! The server asked the device to (re-)provision itself
    provisioning_required,

    //! A well-known or given collection does not exist on the server
    folder_not_found,

    //! The sync key of a collection was rejected by the server; the local
    //! key has been reset to zero
    invalid_sync_key,

    //! The referenced item does not exist (anymore)
    item_not_found,

    //! The mailbox is full or the payload was too large
    quota_exceeded,

    //! Any other non-success status code reported by the server
    server_status,

    //! A response could not be parsed or lacked an expected field
    parse_error,

    //! Neither protocol path supports the requested operation
    not_supported,

    //! The caller cancelled the operation
    cancelled
};

namespace internal
{
    inline std::string enum_to_str(error_code code)
    {
        switch (code)
        {
        case error_code::transport:
            return "transport";
        case error_code::http_status:
            return "http_status";
        case error_code::authentication_failed:
            return "authentication_failed";
        case error_code::provisioning_required:
            return "provisioning_required";
        case error_code::folder_not_found:
            return "folder_not_found";
        case error_code::invalid_sync_key:
            return "invalid_sync_key";
        case error_code::item_not_found:
            return "item_not_found";
        case error_code::quota_exceeded:
            return "quota_exceeded";
        case error_code::server_status:
            return "server_status";
        case error_code::parse_error:
            return "parse_error";
        case error_code::not_supported:
            return "not_supported";
        case error_code::cancelled:
            return "cancelled";
        default:
            throw exception("Unexpected <error_code>");
        }
    }
} // namespace internal

//! \brief Raised when a parsed response carries a non-success status.
//!
//! Carries the mapped error_code and the raw numeric status (or 0 if the
//! status was not numeric, e.g. an EWS ResponseCode).
class status_error final : public exception
{
public:
    status_error(error_code code, const std::string& what, int status = 0)
        : exception(what), code_(code), status_(status)
    {
    }

    error_code code() const EAS_NOEXCEPT { return code_; }
    int status() const EAS_NOEXCEPT { return status_; }

private:
    error_code code_;
    int status_;
};

//! Raised when an operation is not available on the selected protocol path
class capability_error final : public exception
{
public:
    explicit capability_error(const std::string& what) : exception(what) {}
};

//! Describes why an operation failed; see result
class error final
{
public:
    error(error_code code, std::string message, int status = 0)
        : message_(std::move(message)), code_(code), status_(status)
    {
    }

    error_code code() const EAS_NOEXCEPT { return code_; }

    //! Human readable description of the failure
    const std::string& message() const EAS_NOEXCEPT { return message_; }

    //! The protocol status code that caused this error, if any
    int status() const EAS_NOEXCEPT { return status_; }

    //! Whether this error stems from the network or HTTP layer rather than
    //! from a protocol-level status
    bool is_transport_error() const EAS_NOEXCEPT
    {
        return code_ == error_code::transport ||
               code_ == error_code::http_status;
    }

private:
    std::string message_;
    error_code code_;
    int status_;
};

//! \brief The outcome of an operation: either a value or an error.
//!
//! No public operation of a service throws for expected failure modes;
//! they return a result instead.
template <typename T> class result final
{
public:
    typedef T value_type;

    result(T val) : value_(std::move(val)), error_(), ok_(true) {}

    result(class error err)
        : value_(), error_(new class error(std::move(err))), ok_(false)
    {
    }

    result(const result& other)
        : value_(other.value_),
          error_(other.error_ ? new class error(*other.error_) : nullptr),
          ok_(other.ok_)
    {
    }

    result& operator=(const result& rhs)
    {
        if (&rhs != this)
        {
            value_ = rhs.value_;
            error_.reset(rhs.error_ ? new class error(*rhs.error_) : nullptr);
            ok_ = rhs.ok_;
        }
        return *this;
    }

    result(result&&) = default;
    result& operator=(result&&) = default;

    bool ok() const EAS_NOEXCEPT { return ok_; }
    explicit operator bool() const EAS_NOEXCEPT { return ok_; }

    //! Returns the value; throws eas::exception if this result holds an
    //! error
    const T& value() const
    {
        if (!ok_)
        {
            throw exception("Bad result access: " + error_->message());
        }
        return value_;
    }

    T& value()
    {
        if (!ok_)
        {
            throw exception("Bad result access: " + error_->message());
        }
        return value_;
    }

    //! Returns the error; throws eas::exception if this result holds a
    //! value
    const class error& error() const
    {
        if (ok_)
        {
            throw exception("Bad result access: result holds a value");
        }
        return *error_;
    }

private:
    T value_;
    std::unique_ptr<class error> error_;
    bool ok_;
};

namespace internal
{
    // Runs func and converts every expected failure into an error result.
    // Assertion errors and anything not derived from eas::exception are
    // programming errors and propagate to the caller.
    template <typename T, typename Function>
    inline result<T> capture(Function func)
    {
        try
        {
            return result<T>(func());
        }
        catch (status_error& exc)
        {
            return error(exc.code(), exc.what(), exc.status());
        }
        catch (authentication_error& exc)
        {
            return error(error_code::authentication_failed, exc.what());
        }
        catch (http_error& exc)
        {
            if (exc.code() == 501L)
            {
                return error(error_code::not_supported, exc.what(),
                             static_cast<int>(exc.code()));
            }
            return error(error_code::http_status, exc.what(),
                         static_cast<int>(exc.code()));
        }
        catch (soap_fault& exc)
        {
            return error(error_code::server_status, exc.what(), 500);
        }
        catch (cancelled_error& exc)
        {
            return error(error_code::cancelled, exc.what());
        }
        catch (transport_error& exc)
        {
            return error(error_code::transport, exc.what());
        }
        catch (xml_parse_error& exc)
        {
            return error(error_code::parse_error, exc.what());
        }
        catch (wbxml_error& exc)
        {
            return error(error_code::parse_error, exc.what());
        }
        catch (capability_error& exc)
        {
            return error(error_code::not_supported, exc.what());
        }
    }
} // namespace internal
} // namespace eas
