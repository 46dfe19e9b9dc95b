#pragma once

#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// In-process HTTP server playing a SOAP service on an ephemeral loopback port.
//
//   GET  /service?wsdl  ping_service.wsdl with its address pointing here
//   POST /soap          Ping: answers with a session cookie and echoes the
//                       Cookie header it received as the payload
//                       GetStatus: SOAP 1.1 fault with status 500
//   POST /slow          answers after SLOW_RESPONSE_DELAY
class IntegrationTestFixture : public ::testing::Test {
protected:
    static constexpr std::chrono::milliseconds SLOW_RESPONSE_DELAY{1500};

    void SetUp() override;

    static std::string base_url();
    static std::string wsdl_url() { return base_url() + "/service?wsdl"; }
    static std::string endpoint_url() { return base_url() + "/soap"; }

    // Requests seen by the server since the current test started
    static std::vector<std::string> received_actions();
    static std::vector<std::string> received_cookies();

public:
    // Called by global environment - start/stop the server once for all tests
    static void GlobalSetUp();
    static void GlobalTearDown();

private:
    static void serve();
    static void handle(boost::asio::ip::tcp::socket& socket);
    static std::string load_wsdl();

    static std::unique_ptr<boost::asio::io_context> ioc_;
    static std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    static std::thread server_thread_;
    static std::atomic<bool> stopping_;
    static unsigned short port_;
    static std::string wsdl_;
    static std::atomic<int> session_counter_;

    static std::mutex requests_mutex_;
    static std::vector<std::string> actions_;
    static std::vector<std::string> cookies_;
};
