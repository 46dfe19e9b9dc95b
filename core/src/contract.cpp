#include "soapx/contract.hpp"
#include "soapx/errors.hpp"
#include "soapx/http.hpp"
#include "soapx/wsdl.hpp"
#include <glog/logging.h>

namespace soapx {

std::set<std::string> Contract::operation_names() const {
    std::set<std::string> names;
    for (const auto& [name, info] : operations_) {
        names.insert(name);
    }
    return names;
}

std::optional<OperationInfo> Contract::find_operation(const std::string& name) const {
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Contract::target_namespace() const {
    return namespace_uri_ ? *namespace_uri_ : document_namespace_;
}

std::string Contract::endpoint() const {
    return endpoint_ ? *endpoint_ : document_endpoint_;
}

void Contract::set_document(const WsdlParser& parser) {
    has_document_ = true;
    operations_.clear();
    for (const auto& operation : parser.get_all_operations()) {
        operations_[operation.name] = operation;
    }
    service_name_ = parser.get_service_name();
    document_namespace_ = parser.get_target_namespace();
    document_endpoint_ = parser.get_endpoint();
    element_form_default_ = parser.get_element_form_default();
    soap_version_ = parser.get_soap_version();
}

namespace {

bool is_remote(const std::string& location) {
    return location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0;
}

class WsdlContractResolver : public ContractResolver {
public:
    explicit WsdlContractResolver(std::shared_ptr<HttpAdapter> adapter)
        : adapter_(std::move(adapter)) {}

    std::shared_ptr<const Contract> resolve(const GlobalOptions& globals) override {
        auto contract = std::make_shared<Contract>();

        if (globals.wsdl) {
            auto parser = load(*globals.wsdl, globals);
            contract->set_document(*parser);
            LOG(INFO) << "Resolved WSDL for service '" << contract->service_name() << "' ("
                      << contract->operations().size() << " operations)";
        }
        if (globals.endpoint) {
            contract->set_endpoint(*globals.endpoint);
        }
        if (globals.namespace_uri) {
            contract->set_namespace(*globals.namespace_uri);
        }
        if (globals.adapter) {
            contract->set_adapter(*globals.adapter);
        }
        return contract;
    }

private:
    std::unique_ptr<WsdlParser> load(const std::string& location, const GlobalOptions& globals) {
        if (!location.empty() && location.front() == '<') {
            VLOG(1) << "Loading inline WSDL document";
            return WsdlParser::create(location);
        }
        if (!is_remote(location)) {
            VLOG(1) << "Loading WSDL from file " << location;
            return WsdlParser::create_from_file(location);
        }

        if (!adapter_) {
            throw ContractError("No HTTP adapter available to fetch " + location);
        }
        LOG(INFO) << "Fetching WSDL from " << location;
        HttpRequest request = HttpRequest::from_options(globals);
        request.url = location;
        HttpResponse response = adapter_->execute(HttpMethod::GET, request);
        if (response.error()) {
            LOG(ERROR) << "Fetching WSDL from " << location << " returned HTTP " << response.code;
            throw ContractError("Unable to fetch WSDL from " + location + ": HTTP " +
                                std::to_string(response.code));
        }
        return WsdlParser::create(response.body);
    }

    std::shared_ptr<HttpAdapter> adapter_;
};

} // namespace

std::unique_ptr<ContractResolver> ContractResolver::create(std::shared_ptr<HttpAdapter> adapter) {
    return std::make_unique<WsdlContractResolver>(std::move(adapter));
}

} // namespace soapx
