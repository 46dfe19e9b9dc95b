#pragma once

#include "soapx/contract.hpp"
#include "soapx/http.hpp"
#include "soapx/options.hpp"
#include "soapx/response.hpp"
#include "soapx/wsse.hpp"
#include <functional>
#include <memory>
#include <string>

namespace soapx {

// A built request that has not been sent yet. Callers may change the HTTP
// request (headers, body) before calling response(). Copies are independent.
class PreparedRequest {
public:
    const std::string& operation_name() const { return operation_name_; }

    HttpRequest& http() { return http_; }
    const HttpRequest& http() const { return http_; }

    WsseSettings& wsse() { return wsse_; }
    const WsseSettings& wsse() const { return wsse_; }

    GlobalOptions& config() { return config_; }
    const GlobalOptions& config() const { return config_; }

    // Send the request through the adapter it was built with
    Response response() const;

private:
    friend class RequestBuilder;

    PreparedRequest() = default;

    std::string operation_name_;
    HttpRequest http_;
    WsseSettings wsse_;
    GlobalOptions config_;
    std::shared_ptr<HttpAdapter> adapter_;
};

// Turns an operation name and its local options into a PreparedRequest
class RequestBuilder {
public:
    using PostConfiguration = std::function<void(PreparedRequest&)>;

    RequestBuilder(std::string operation_name, LocalOptions locals);

    void set_contract(std::shared_ptr<const Contract> contract) { contract_ = std::move(contract); }
    void set_adapter(std::shared_ptr<HttpAdapter> adapter) { adapter_ = std::move(adapter); }
    void set_http(HttpRequest http) { http_ = std::move(http); }
    void set_wsse(WsseSettings wsse) { wsse_ = std::move(wsse); }
    void set_config(GlobalOptions config) { config_ = std::move(config); }

    // Throws UnknownOperationError when the contract has a document that does
    // not define the operation, ConfigurationError without an endpoint.
    PreparedRequest build(const PostConfiguration& post_configuration = {}) const;

private:
    std::string soap_action(const std::optional<OperationInfo>& info) const;

    std::string operation_name_;
    LocalOptions locals_;
    std::shared_ptr<const Contract> contract_;
    std::shared_ptr<HttpAdapter> adapter_;
    HttpRequest http_;
    WsseSettings wsse_;
    GlobalOptions config_;
};

} // namespace soapx
