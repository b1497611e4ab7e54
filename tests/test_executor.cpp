
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

#include "fixtures.hpp"

#include <string>
#include <vector>

namespace
{
typedef eas::internal::http_response::header_list header_list;

header_list www_authenticate(const std::vector<std::string>& values)
{
    header_list headers;
    for (const auto& v : values)
    {
        headers.emplace_back("WWW-Authenticate", v);
    }
    return headers;
}

std::string challenge_header()
{
    const std::vector<unsigned char> server_challenge{0x01, 0x23, 0x45, 0x67,
                                                      0x89, 0xab, 0xcd, 0xef};
    return "NTLM " + eas::internal::base64::encode(
                         tests::ntlm_challenge(server_challenge));
}

// Decodes the NTLM message of an "Authorization: NTLM <token>" header
std::vector<unsigned char> ntlm_message(const std::string& authorization)
{
    return eas::internal::base64::decode(authorization.substr(5));
}
} // namespace

namespace tests
{
    class ExecutorTest : public FakeTransportFixture
    {
    };

    TEST_F(ExecutorTest, SendsActiveSyncHeaders)
    {
        http_request_mock::enqueue(200, "<FolderSync/>");

        const auto res = executor().send_command("FolderSync", "<x/>");
        EXPECT_EQ("<FolderSync/>", res);

        ASSERT_EQ(1U, requests().size());
        const auto& req = requests().front();
        EXPECT_EQ("https://mail.example.com/Microsoft-Server-ActiveSync/"
                  "default.eas?Cmd=FolderSync&User=EXAMPLE%5Calice&"
                  "DeviceId=dev1&DeviceType=Android",
                  req.url);
        EXPECT_FALSE(req.is_options);
        EXPECT_EQ("text/xml", req.header("Content-Type"));
        EXPECT_EQ("0", req.header("X-MS-PolicyKey"));
        EXPECT_EQ("eassync/1.0", req.header("User-Agent"));
        EXPECT_EQ("<x/>", req.body);
    }

    TEST_F(ExecutorTest, FallsBackToOldestVersionUntilDetected)
    {
        executor().send_command("Sync", "<x/>");
        context().set_protocol_version("14.1");
        executor().send_command("Sync", "<x/>");

        ASSERT_EQ(2U, requests().size());
        EXPECT_EQ("12.0", requests()[0].header("MS-ASProtocolVersion"));
        EXPECT_EQ("14.1", requests()[1].header("MS-ASProtocolVersion"));
    }

    TEST_F(ExecutorTest, SendsPolicyKey)
    {
        context().set_policy_key("1307199584");
        executor().send_command("Sync", "<x/>");
        EXPECT_EQ("1307199584", requests().front().header("X-MS-PolicyKey"));
    }

    TEST_F(ExecutorTest, StartsWithBasicAuthentication)
    {
        executor().send_command("Sync", "<x/>");
        EXPECT_EQ("Basic " + eas::internal::base64::encode(
                                 std::string("EXAMPLE\\alice:secret")),
                  requests().front().header("Authorization"));
        EXPECT_EQ(eas::auth_state::no_session,
                  context().authentication_state());
    }

    TEST_F(ExecutorTest, Status449RequiresProvisioning)
    {
        http_request_mock::enqueue(449);
        try
        {
            executor().send_command("Sync", "<x/>");
            FAIL() << "Expected an exception";
        }
        catch (eas::status_error& exc)
        {
            EXPECT_EQ(eas::error_code::provisioning_required, exc.code());
            EXPECT_EQ(449, exc.status());
        }
    }

    TEST_F(ExecutorTest, UnexpectedStatusIsAnHttpError)
    {
        http_request_mock::enqueue(503);
        try
        {
            executor().send_command("Sync", "<x/>");
            FAIL() << "Expected an exception";
        }
        catch (eas::http_error& exc)
        {
            EXPECT_EQ(503L, exc.code());
        }
    }

    TEST_F(ExecutorTest, ExecuteReturnsErrorsAsResult)
    {
        http_request_mock::enqueue(449);
        const auto res = executor().execute(
            "Sync", "<x/>", [](const std::string& xml) { return xml; });
        ASSERT_FALSE(res.ok());
        EXPECT_EQ(eas::error_code::provisioning_required, res.error().code());
    }

    TEST_F(ExecutorTest, RejectedWithoutNtlmOffer)
    {
        http_request_mock::enqueue(401, "",
                                   www_authenticate({"Basic realm=\"mail\""}));

        EXPECT_THROW(executor().send_command("Sync", "<x/>"),
                     eas::authentication_error);
        EXPECT_EQ(1U, requests().size());
        EXPECT_EQ(eas::auth_state::failed, context().authentication_state());
        EXPECT_FALSE(context().session().has_value());
    }

    TEST_F(ExecutorTest, NtlmHandshake)
    {
        http_request_mock::enqueue(401, "",
                                   www_authenticate({"Negotiate", "NTLM"}));
        http_request_mock::enqueue(401, "",
                                   www_authenticate({challenge_header()}));
        http_request_mock::enqueue(200, "<Sync/>");

        EXPECT_EQ("<Sync/>", executor().send_command("Sync", "<x/>"));

        ASSERT_EQ(3U, requests().size());
        EXPECT_TRUE(contains_str(requests()[0].header("Authorization"),
                                 "Basic "));

        const auto type1 = requests()[1].header("Authorization");
        ASSERT_EQ(0U, type1.find("NTLM "));
        EXPECT_EQ(1U, eas::internal::ntlm::get_uint32(ntlm_message(type1), 8));

        const auto type3 = requests()[2].header("Authorization");
        ASSERT_EQ(0U, type3.find("NTLM "));
        EXPECT_EQ(3U, eas::internal::ntlm::get_uint32(ntlm_message(type3), 8));

        // Every leg carries the request body
        for (const auto& req : requests())
        {
            EXPECT_EQ("<x/>", req.body);
        }

        EXPECT_EQ(eas::auth_state::session_established,
                  context().authentication_state());
        ASSERT_TRUE(context().session().has_value());
        EXPECT_EQ(type3, context().session().value());
    }

    TEST_F(ExecutorTest, RejectedAfterNtlmHandshake)
    {
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));
        http_request_mock::enqueue(401, "",
                                   www_authenticate({challenge_header()}));
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));

        EXPECT_THROW(executor().send_command("Sync", "<x/>"),
                     eas::authentication_error);

        // No further attempts after the Type 3 message was rejected
        EXPECT_EQ(3U, requests().size());
        EXPECT_EQ(eas::auth_state::failed, context().authentication_state());
        EXPECT_FALSE(context().session().has_value());
    }

    TEST_F(ExecutorTest, ChallengeMissingFailsAuthentication)
    {
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));

        EXPECT_THROW(executor().send_command("Sync", "<x/>"),
                     eas::authentication_error);
        EXPECT_EQ(2U, requests().size());
        EXPECT_EQ(eas::auth_state::failed, context().authentication_state());
    }

    TEST_F(ExecutorTest, CancellationDuringNtlmHandshake)
    {
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));
        http_request_mock::enqueue_failure(eas::cancelled_error());

        const auto res = executor().execute(
            "Sync", "<x/>", [](const std::string& body) { return body; });
        ASSERT_FALSE(res.ok());
        EXPECT_EQ(eas::error_code::cancelled, res.error().code());
        EXPECT_EQ(eas::auth_state::no_session,
                  context().authentication_state());
        EXPECT_FALSE(context().session().has_value());
    }

    TEST_F(ExecutorTest, TransportFailureDuringNtlmHandshake)
    {
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));
        http_request_mock::enqueue_failure(
            eas::transport_error("Operation timed out"));

        const auto res = executor().execute(
            "Sync", "<x/>", [](const std::string& body) { return body; });
        ASSERT_FALSE(res.ok());
        EXPECT_EQ(eas::error_code::transport, res.error().code());
        EXPECT_TRUE(res.error().is_transport_error());
        EXPECT_NE(eas::auth_state::failed, context().authentication_state());
    }

    TEST_F(ExecutorTest, EstablishedSessionRunsHandshakeDirectly)
    {
        http_request_mock::enqueue(401, "", www_authenticate({"NTLM"}));
        http_request_mock::enqueue(401, "",
                                   www_authenticate({challenge_header()}));
        http_request_mock::enqueue(200, "<Sync/>");
        executor().send_command("Sync", "<x/>");
        ASSERT_EQ(3U, requests().size());

        http_request_mock::enqueue(401, "",
                                   www_authenticate({challenge_header()}));
        http_request_mock::enqueue(200, "<Sync/>");
        executor().send_command("Sync", "<y/>");

        ASSERT_EQ(5U, requests().size());
        const auto type1 = requests()[3].header("Authorization");
        ASSERT_EQ(0U, type1.find("NTLM "));
        EXPECT_EQ(1U, eas::internal::ntlm::get_uint32(ntlm_message(type1), 8));
        const auto type3 = requests()[4].header("Authorization");
        EXPECT_EQ(3U, eas::internal::ntlm::get_uint32(ntlm_message(type3), 8));
    }

    TEST_F(ExecutorTest, CancelledContextSendsNothing)
    {
        context().cancel();
        EXPECT_THROW(executor().send_command("Sync", "<x/>"),
                     eas::cancelled_error);
        EXPECT_THROW(executor().send_soap("GetItem", "<x/>"),
                     eas::cancelled_error);
        EXPECT_TRUE(requests().empty());

        context().reset_cancellation();
        executor().send_command("Sync", "<x/>");
        EXPECT_EQ(1U, requests().size());
    }

    TEST_F(ExecutorTest, SupportedProtocolVersions)
    {
        header_list headers;
        headers.emplace_back("MS-ASProtocolVersions",
                             "2.5,12.0, 12.1,14.0,14.1");
        http_request_mock::enqueue(200, "", headers);

        const auto versions = executor().supported_protocol_versions();
        const std::vector<std::string> expected{"2.5", "12.0", "12.1", "14.0",
                                                "14.1"};
        EXPECT_EQ(expected, versions);

        ASSERT_EQ(1U, requests().size());
        EXPECT_TRUE(requests().front().is_options);
        EXPECT_EQ("https://mail.example.com/Microsoft-Server-ActiveSync",
                  requests().front().url);
    }

    TEST_F(ExecutorTest, MissingVersionHeaderIsAnError)
    {
        http_request_mock::enqueue(200);
        EXPECT_THROW(executor().supported_protocol_versions(),
                     eas::xml_parse_error);
    }

    TEST_F(ExecutorTest, SoapRequestHeaders)
    {
        http_request_mock::enqueue(200, soap_success("CreateItem"));

        executor().send_soap("CreateItem", "<envelope/>");

        ASSERT_EQ(1U, requests().size());
        const auto& req = requests().front();
        EXPECT_EQ("https://mail.example.com/EWS/Exchange.asmx", req.url);
        EXPECT_EQ("\"http://schemas.microsoft.com/exchange/services/2006/"
                  "messages/CreateItem\"",
                  req.header("SOAPAction"));
        EXPECT_EQ("text/xml; charset=utf-8", req.header("Content-Type"));
        EXPECT_EQ("<envelope/>", req.body);
    }

    TEST_F(ExecutorTest, SoapFault)
    {
        http_request_mock::enqueue(
            500,
            "<s:Envelope "
            "xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\"><s:Body>"
            "<s:Fault><faultcode>s:Client</faultcode>"
            "<faultstring>The request failed schema validation</faultstring>"
            "</s:Fault></s:Body></s:Envelope>");

        try
        {
            executor().send_soap("CreateItem", "<envelope/>");
            FAIL() << "Expected a SOAP fault";
        }
        catch (eas::soap_fault& exc)
        {
            EXPECT_STREQ("The request failed schema validation", exc.what());
        }
    }

    TEST_F(ExecutorTest, ServerErrorWithoutFault)
    {
        http_request_mock::enqueue(500, "<html/>");
        EXPECT_THROW(executor().send_soap("CreateItem", "<envelope/>"),
                     eas::http_error);
    }

    TEST_F(ExecutorTest, WbxmlRoundTrip)
    {
        auto settings = test_settings();
        settings.format = eas::wire_format::wbxml;
        eas::connection_context ctx(settings);
        eas::basic_command_executor<http_request_mock> exec(ctx);

        header_list headers;
        headers.emplace_back("Content-Type", "application/vnd.ms-sync.wbxml");
        http_request_mock::enqueue(
            200,
            eas::internal::wbxml_encode(
                "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
                "<FolderSync xmlns=\"FolderHierarchy\">"
                "<Status>1</Status></FolderSync>"),
            headers);

        const auto res = exec.send_command(
            "FolderSync", eas::internal::folder_sync_request("0"));
        EXPECT_TRUE(contains_str(res, "<Status>1</Status>"));

        ASSERT_EQ(1U, requests().size());
        const auto& req = requests().front();
        EXPECT_EQ("application/vnd.ms-sync.wbxml", req.header("Content-Type"));
        ASSERT_FALSE(req.body.empty());
        EXPECT_EQ('\x03', req.body[0]);
    }

    TEST(ConnectionTest, BaseUrl)
    {
        typedef eas::default_url_resolver resolver;

        EXPECT_EQ("https://mail.example.com",
                  resolver::base_url("mail.example.com/"));
        EXPECT_EQ("https://mail.example.com",
                  resolver::base_url("https://mail.example.com/"
                                     "Microsoft-Server-ActiveSync/default.eas"));
        EXPECT_EQ("http://mail.example.com",
                  resolver::base_url(
                      " http://mail.example.com/EWS/Exchange.asmx "));

        const resolver urls("mail.example.com");
        EXPECT_EQ("https://mail.example.com/Microsoft-Server-ActiveSync",
                  urls.activesync_url());
        EXPECT_EQ("https://mail.example.com/EWS/Exchange.asmx", urls.ews_url());
    }

    TEST(ConnectionTest, CommandUrlIsPercentEncoded)
    {
        auto settings = test_settings();
        settings.device_id = "dev 1/\xC3\xA4";
        settings.device_type = "Smart~Phone";
        eas::connection_context ctx(settings);
        eas::basic_command_executor<http_request_mock> executor(ctx);

        EXPECT_EQ("https://mail.example.com/Microsoft-Server-ActiveSync/"
                  "default.eas?Cmd=Sync&User=EXAMPLE%5Calice&"
                  "DeviceId=dev%201%2F%C3%A4&DeviceType=Smart~Phone",
                  executor.command_url("Sync"));
    }

    TEST(ConnectionTest, ContextRequiresServerUrl)
    {
        eas::connection_settings settings;
        EXPECT_THROW(eas::connection_context ctx(settings), eas::exception);
    }

    TEST(ConnectionTest, GeneratesDeviceId)
    {
        auto settings = test_settings();
        settings.device_id.clear();
        eas::connection_context ctx(settings);
        EXPECT_EQ(32U, ctx.settings().device_id.size());
        EXPECT_EQ("0", ctx.policy_key());
        EXPECT_EQ("0", ctx.folder_sync_key());
        EXPECT_FALSE(ctx.protocol_version().has_value());
    }

    TEST(ConnectionTest, SplitsQualifiedUserName)
    {
        eas::connection_settings settings;
        settings.username = "CORP\\bob";
        settings.password = "pw";

        const auto creds = settings.credentials();
        EXPECT_EQ("CORP", creds.domain);
        EXPECT_EQ("bob", creds.username);
        EXPECT_EQ("CORP\\bob", creds.qualified_username());

        settings.domain = "OTHER";
        EXPECT_EQ("CORP\\bob", settings.credentials().username);
    }
} // namespace tests
