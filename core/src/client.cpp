#include "soapx/client.hpp"
#include "soapx/errors.hpp"
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <sstream>

namespace soapx {

namespace {

constexpr const char* INSUFFICIENT_OPTIONS_MESSAGE =
    "Expected either a WSDL document or the SOAP endpoint and target namespace options.\n\n"
    "  # with a remote WSDL document\n"
    "  wsdl: http://example.com/users?wsdl\n\n"
    "  # with a local WSDL document\n"
    "  wsdl: ../wsdl/users.xml\n\n"
    "  # without a WSDL document\n"
    "  endpoint: http://example.com/users\n"
    "  namespace: http://v1.example.com\n";

bool describes_service(const GlobalOptions& globals) {
    return globals.wsdl.has_value() || (globals.endpoint.has_value() && globals.namespace_uri.has_value());
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::ostringstream out;
    for (size_t i = 0; i < errors.size(); ++i) {
        out << (i ? "; " : "") << errors[i];
    }
    return out.str();
}

} // namespace

Client::Client(GlobalOptions globals, const OptionsCustomizer& block, ClientDependencies dependencies) {
    if (block) {
        block(globals);
    }
    if (!describes_service(globals)) {
        LOG(ERROR) << "Client options name neither a WSDL document nor endpoint and namespace";
        throw InitializationError(INSUFFICIENT_OPTIONS_MESSAGE);
    }

    adapter_ = dependencies.http ? dependencies.http
                                 : HttpAdapter::create(globals.adapter.value_or(HttpAdapter::DEFAULT_ADAPTER));
    verifier_ = dependencies.verifier ? dependencies.verifier
                                      : std::shared_ptr<SignatureVerifier>(SignatureVerifier::create());
    wsse_ = WsseSettings::from_options(globals);
    http_ = HttpRequest::from_options(globals);
    globals_ = std::make_shared<const GlobalOptions>(std::move(globals));

    std::shared_ptr<ContractResolver> resolver = dependencies.resolver;
    if (!resolver) {
        resolver = ContractResolver::create(adapter_);
    }
    build_contract(*resolver);

    LOG(INFO) << "SOAP client created (adapter: " << adapter_->name()
              << ", document: " << (contract_->has_document() ? "yes" : "no")
              << ", endpoint: " << contract_->endpoint() << ")";
}

Client::Client(const YAML::Node& globals, const OptionsCustomizer& block, ClientDependencies dependencies)
    : Client(GlobalOptions::from_yaml(globals), block, std::move(dependencies)) {}

Client::Client(const std::string& wsdl_location) {
    throw LegacyInitializationError(
        "Some code tries to initialize the client with \"" + wsdl_location + "\" (string)\n"
        "The client expects a mapping of options for creating a new client and executing requests.\n"
        "Pass GlobalOptions with wsdl = \"" + wsdl_location + "\" instead.");
}

void Client::build_contract(ContractResolver& resolver) {
    contract_ = resolver.resolve(*globals_);
    if (!contract_) {
        throw ContractError("Contract resolver produced no contract");
    }
}

std::set<std::string> Client::operations() const {
    if (!contract_->has_document()) {
        throw MissingContractError("Unable to inspect the service without a WSDL document.");
    }
    return contract_->operation_names();
}

std::string Client::service_name() const {
    if (!contract_->has_document()) {
        throw MissingContractError("Unable to inspect the service without a WSDL document.");
    }
    return contract_->service_name();
}

Operation Client::operation(const std::string& operation_name) const {
    return Operation::create(operation_name, contract_, globals_, adapter_);
}

Response Client::call(const std::string& operation_name, const LocalOptions& locals) const {
    return operation(operation_name).call(locals);
}

PreparedRequest Client::build_request(const std::string& operation_name, const LocalOptions& locals) const {
    return operation(operation_name).build(locals);
}

std::shared_ptr<PreparedRequest> Client::prepare_invocation(const std::string& operation_name,
                                                            const LocalOptions& locals,
                                                            const PrepareHook& hook) {
    if (operation_name.empty()) {
        throw InvocationArgumentError("prepare_invocation requires the name of the operation to invoke");
    }

    RequestBuilder builder(operation_name, locals);
    builder.set_contract(contract_);
    builder.set_adapter(adapter_);
    builder.set_http(http());
    builder.set_wsse(wsse_);
    builder.set_config(*globals_);

    auto handle = std::make_shared<PreparedRequest>(builder.build());
    if (hook) {
        hook(PREPARE_SENTINEL, *handle);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pending_) {
        LOG(WARNING) << "Discarding prepared invocation of " << pending_->operation_name()
                     << " that was never finalized";
    }
    pending_ = handle;
    return handle;
}

Response Client::finalize_invocation() {
    std::shared_ptr<PreparedRequest> handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle.swap(pending_);
    }
    if (!handle) {
        throw NoPendingInvocationError("finalize_invocation requires a prior prepare_invocation");
    }
    return finalize_invocation(*handle);
}

Response Client::finalize_invocation(const PreparedRequest& request) {
    Response response = request.response();

    if (wsse_.verify_response) {
        VerificationResult result = verifier_->verify(response.xml());
        if (!result.valid) {
            LOG(ERROR) << "Response to " << request.operation_name() << " failed signature verification";
            throw VerificationError("Response signature verification failed: " + join_errors(result.errors));
        }
    }

    // Cookies from an unverified response never reach the session
    auto cookies = response.http().cookies();
    if (!cookies.empty()) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        http_.set_cookies(cookies);
        VLOG(1) << "Stored " << cookies.size() << " cookies from " << request.operation_name();
    }
    return response;
}

bool Client::has_pending_invocation() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_ != nullptr;
}

HttpRequest Client::http() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return http_;
}

} // namespace soapx
