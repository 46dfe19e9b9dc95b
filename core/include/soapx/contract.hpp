#pragma once

#include "soapx/options.hpp"
#include "soapx/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace soapx {

class HttpAdapter;
class WsdlParser;

// Resolved service description. Built once by a ContractResolver and shared
// read-only afterwards.
class Contract {
public:
    Contract() = default;

    bool has_document() const { return has_document_; }

    std::set<std::string> operation_names() const;
    const std::map<std::string, OperationInfo>& operations() const { return operations_; }
    std::optional<OperationInfo> find_operation(const std::string& name) const;

    const std::string& service_name() const { return service_name_; }

    // Explicit namespace/endpoint options take precedence over the document
    std::string target_namespace() const;
    std::string endpoint() const;

    const std::optional<std::string>& adapter() const { return adapter_; }
    const std::string& element_form_default() const { return element_form_default_; }
    const std::optional<SoapVersion>& soap_version() const { return soap_version_; }

    void set_document(const WsdlParser& parser);
    void set_endpoint(const std::string& endpoint) { endpoint_ = endpoint; }
    void set_namespace(const std::string& namespace_uri) { namespace_uri_ = namespace_uri; }
    void set_adapter(const std::string& adapter) { adapter_ = adapter; }

private:
    bool has_document_ = false;
    std::map<std::string, OperationInfo> operations_;
    std::string service_name_;
    std::string document_namespace_;
    std::string document_endpoint_;
    std::string element_form_default_ = "unqualified";
    std::optional<SoapVersion> soap_version_;
    std::optional<std::string> endpoint_;
    std::optional<std::string> namespace_uri_;
    std::optional<std::string> adapter_;
};

class ContractResolver {
public:
    virtual ~ContractResolver() = default;

    // Resolver loading WSDL documents from inline XML, local files or URLs.
    // Remote documents are fetched through the given adapter.
    static std::unique_ptr<ContractResolver> create(std::shared_ptr<HttpAdapter> adapter);

    virtual std::shared_ptr<const Contract> resolve(const GlobalOptions& globals) = 0;
};

} // namespace soapx
