#include "soapx/request_builder.hpp"
#include "soapx/errors.hpp"
#include "envelope_builder.hpp"
#include "xml_utils.hpp"
#include <glog/logging.h>
#include <sstream>

namespace soapx {

namespace {

std::string join(const std::set<std::string>& names) {
    std::ostringstream out;
    for (auto it = names.begin(); it != names.end(); ++it) {
        if (it != names.begin()) {
            out << ", ";
        }
        out << *it;
    }
    return out.str();
}

std::string format_headers(const HttpHeaders& headers) {
    std::ostringstream out;
    for (const auto& [name, value] : headers) {
        out << "\n  " << name << ": " << value;
    }
    return out.str();
}

} // namespace

Response PreparedRequest::response() const {
    if (!adapter_) {
        throw TransportError("No HTTP adapter configured for operation " + operation_name_);
    }

    if (config_.log) {
        LOG(INFO) << "SOAP request: " << http_.url << format_headers(http_.headers);
        LOG(INFO) << xml::filtered(http_.body, config_.filters, config_.pretty_print_xml);
    }

    HttpResponse http = adapter_->execute(HttpMethod::POST, http_);

    if (config_.log) {
        LOG(INFO) << "SOAP response (status " << http.code << ")";
        LOG(INFO) << xml::filtered(http.body, config_.filters, config_.pretty_print_xml);
    }
    return Response(std::move(http), config_);
}

RequestBuilder::RequestBuilder(std::string operation_name, LocalOptions locals)
    : operation_name_(std::move(operation_name)),
      locals_(std::move(locals)) {}

std::string RequestBuilder::soap_action(const std::optional<OperationInfo>& info) const {
    if (locals_.soap_action) {
        return *locals_.soap_action;
    }
    if (info && !info->soap_action.empty()) {
        return info->soap_action;
    }
    return operation_name_;
}

PreparedRequest RequestBuilder::build(const PostConfiguration& post_configuration) const {
    std::optional<OperationInfo> info;
    if (contract_ && contract_->has_document()) {
        info = contract_->find_operation(operation_name_);
        if (!info) {
            throw UnknownOperationError("Unable to find SOAP operation: " + operation_name_ +
                                        "\nOperations provided by your service: " +
                                        join(contract_->operation_names()));
        }
    }

    std::string endpoint = contract_ ? contract_->endpoint() : config_.endpoint.value_or("");
    if (endpoint.empty()) {
        throw ConfigurationError("No SOAP endpoint known for operation " + operation_name_ +
                                 ", set the endpoint option");
    }
    if (contract_ && contract_->soap_version() && *contract_->soap_version() != config_.soap_version) {
        VLOG(1) << "WSDL binding SOAP version differs from the soap_version option, using the option";
    }

    EnvelopeBuilder envelope(config_, locals_, wsse_);
    envelope.set_soap_version(config_.soap_version);
    envelope.set_target_namespace(contract_ ? contract_->target_namespace()
                                            : config_.namespace_uri.value_or(""));
    if (locals_.message_tag) {
        envelope.set_input(*locals_.message_tag, info ? info->input_namespace : "");
    } else if (info) {
        envelope.set_input(info->input_tag, info->input_namespace);
    } else {
        envelope.set_input(convert_key(operation_name_, config_.convert_request_keys_to), "");
    }
    if (config_.element_form_default) {
        envelope.set_element_form_default(*config_.element_form_default);
    } else if (contract_) {
        envelope.set_element_form_default(contract_->element_form_default());
    }

    PreparedRequest request;
    request.operation_name_ = operation_name_;
    request.http_ = http_;
    request.wsse_ = wsse_;
    request.config_ = config_;
    request.adapter_ = adapter_;

    request.http_.url = endpoint;
    request.http_.body = envelope.to_xml();

    std::string action = soap_action(info);
    if (config_.soap_version == SoapVersion::SOAP_12) {
        request.http_.headers["Content-Type"] =
            "application/soap+xml;charset=" + config_.encoding + ";action=\"" + action + "\"";
    } else {
        request.http_.headers["Content-Type"] = "text/xml;charset=" + config_.encoding;
        request.http_.headers["SOAPAction"] = "\"" + action + "\"";
    }

    for (const auto& [name, value] : locals_.headers) {
        request.http_.headers[name] = value;
    }
    request.http_.set_cookies(locals_.cookies);

    VLOG(1) << "Built request for " << operation_name_ << " (" << request.http_.body.size() << " bytes)";

    if (post_configuration) {
        post_configuration(request);
    }
    return request;
}

} // namespace soapx
