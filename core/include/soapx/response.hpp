#pragma once

#include "soapx/errors.hpp"
#include "soapx/http.hpp"
#include "soapx/options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace soapx {

class SoapFault : public Error {
public:
    SoapFault(HttpResponse http, std::string fault_code, std::string fault_reason);

    const HttpResponse& http() const { return http_; }
    const std::string& fault_code() const { return fault_code_; }
    const std::string& fault_reason() const { return fault_reason_; }

private:
    HttpResponse http_;
    std::string fault_code_;
    std::string fault_reason_;
};

class HttpError : public Error {
public:
    explicit HttpError(HttpResponse http);

    const HttpResponse& http() const { return http_; }
    int code() const { return http_.code; }

private:
    HttpResponse http_;
};

// Received SOAP response. With raise_errors enabled, construction throws
// SoapFault or HttpError instead of producing an unsuccessful response.
class Response {
public:
    Response(HttpResponse http, const GlobalOptions& globals);

    const HttpResponse& http() const { return http_; }
    const std::string& xml() const { return http_.body; }

    bool success() const { return !soap_fault() && !http_error(); }
    bool soap_fault() const;
    bool http_error() const;

    // Whole envelope, its Header and its Body converted to JSON
    nlohmann::json hash() const;
    nlohmann::json header() const;
    nlohmann::json body() const;

    // Throws SoapFault or HttpError when the response is unsuccessful
    void raise_errors() const;

private:
    nlohmann::json envelope_section(const std::string& local_name) const;

    HttpResponse http_;
    SoapVersion soap_version_;
    bool strip_namespaces_;
    KeyConversion convert_tags_to_;
};

} // namespace soapx
