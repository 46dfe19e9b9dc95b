#include "test_fixture.hpp"
#include "soapx/soapx.hpp"
#include <glog/logging.h>

using namespace soapx;

class SoapServiceTest : public IntegrationTestFixture {
protected:
    static GlobalOptions remote_wsdl() {
        GlobalOptions options;
        options.wsdl = wsdl_url();
        options.open_timeout = std::chrono::seconds(2);
        options.read_timeout = std::chrono::seconds(5);
        return options;
    }
};

// ============================================================================
// Contract resolution over HTTP
// ============================================================================

TEST_F(SoapServiceTest, ResolveContractFromUrl) {
    Client client(remote_wsdl());

    EXPECT_EQ(client.service_name(), "PingService");
    EXPECT_EQ(client.operations(), (std::set<std::string>{"GetStatus", "Ping"}));
    EXPECT_EQ(client.contract()->endpoint(), endpoint_url());
}

TEST_F(SoapServiceTest, MissingRemoteDocument) {
    GlobalOptions options;
    options.wsdl = base_url() + "/missing?wsdl";
    EXPECT_THROW(Client client(options), ContractError);
}

// ============================================================================
// Invocation
// ============================================================================

TEST_F(SoapServiceTest, CallPing) {
    Client client(remote_wsdl());

    Response response = client.call("Ping");

    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.body()["ping_response"]["payload"], "no-cookie");
    auto actions = received_actions();
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0], "\"urn:example:ping#Ping\"");
}

TEST_F(SoapServiceTest, CallWithoutWsdl) {
    GlobalOptions options;
    options.endpoint = endpoint_url();
    options.namespace_uri = "urn:example:ping";
    Client client(options);

    EXPECT_THROW(client.operations(), MissingContractError);
    Response response = client.call("Ping");
    EXPECT_TRUE(response.success());
    EXPECT_EQ(received_actions().at(0), "\"Ping\"");
}

TEST_F(SoapServiceTest, ServiceFaultRaises) {
    Client client(remote_wsdl());

    try {
        client.call("GetStatus");
        FAIL() << "Expected SoapFault";
    } catch (const SoapFault& fault) {
        EXPECT_EQ(fault.fault_code(), "soap:Server");
        EXPECT_EQ(fault.fault_reason(), "Status backend offline");
        EXPECT_EQ(fault.http().code, 500);
    }
}

TEST_F(SoapServiceTest, ServiceFaultWithoutRaising) {
    auto options = remote_wsdl();
    options.raise_errors = false;
    Client client(options);

    Response response = client.call("GetStatus");
    EXPECT_FALSE(response.success());
    EXPECT_TRUE(response.soap_fault());
}

// ============================================================================
// Two-phase invocation
// ============================================================================

TEST_F(SoapServiceTest, SessionCookieCarriedToNextInvocation) {
    Client client(remote_wsdl());

    client.prepare_invocation("Ping");
    Response opened = client.finalize_invocation();
    EXPECT_EQ(opened.body()["ping_response"]["payload"], "no-cookie");

    auto session = client.http().cookies.find("SESSION");
    ASSERT_TRUE(session.has_value());

    client.prepare_invocation("Ping");
    Response resumed = client.finalize_invocation();

    EXPECT_EQ(resumed.body()["ping_response"]["payload"], "SESSION=" + session->value);
    auto cookies = received_cookies();
    ASSERT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies[0], "");
    EXPECT_EQ(cookies[1], "SESSION=" + session->value);
}

TEST_F(SoapServiceTest, ModifiedHandleIsSent) {
    Client client(remote_wsdl());

    auto handle = client.prepare_invocation("Ping");
    handle->http().headers["SOAPAction"] = "\"urn:example:ping#Custom\"";
    client.finalize_invocation();

    EXPECT_EQ(received_actions().at(0), "\"urn:example:ping#Custom\"");
}

// ============================================================================
// Transport failures
// ============================================================================

TEST_F(SoapServiceTest, ReadTimeout) {
    GlobalOptions options;
    options.endpoint = base_url() + "/slow";
    options.namespace_uri = "urn:example:ping";
    options.read_timeout = std::chrono::seconds(1);
    Client client(options);

    try {
        client.call("Ping");
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSPORT_FAILED);
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
}

TEST_F(SoapServiceTest, ConnectionRefused) {
    GlobalOptions options;
    options.endpoint = "http://127.0.0.1:1/soap";
    options.namespace_uri = "urn:example:ping";
    options.open_timeout = std::chrono::seconds(2);
    Client client(options);

    EXPECT_THROW(client.call("Ping"), TransportError);
}
