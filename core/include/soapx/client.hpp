/**
 * @file client.hpp
 * @brief SOAP client: contract resolution and operation invocation
 *
 * A Client resolves its service contract once, at construction, and then
 * dispatches named remote operations. Besides the single-step call(), it
 * offers a two-phase invocation: prepare_invocation() builds the HTTP request
 * and hands it out for modification, finalize_invocation() sends it,
 * propagates response cookies and verifies the response signature when
 * wsse_verify_response is set.
 */

#pragma once

#include "soapx/contract.hpp"
#include "soapx/http.hpp"
#include "soapx/operation.hpp"
#include "soapx/options.hpp"
#include "soapx/request_builder.hpp"
#include "soapx/response.hpp"
#include "soapx/wsse.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace YAML {
class Node;
}

namespace soapx {

/// Collaborators a Client works with. Empty members are created from the
/// options: the adapter named by `adapter`, the WSDL resolver and the XML-DSig
/// verifier.
struct ClientDependencies {
    std::shared_ptr<ContractResolver> resolver;
    std::shared_ptr<HttpAdapter> http;
    std::shared_ptr<SignatureVerifier> verifier;
};

/**
 * @brief Client for a SOAP service described by WSDL or endpoint + namespace
 *
 * Thread safety:
 * - operations(), service_name(), operation(), call() and build_request()
 *   only read state fixed at construction and may run concurrently
 * - prepare_invocation() / finalize_invocation() share one pending slot per
 *   client; concurrent two-phase callers should use their own clients or
 *   finalize the handle they were given explicitly
 *
 * Example:
 * @code
 * soapx::GlobalOptions options;
 * options.wsdl = "service.wsdl";
 * soapx::Client client(options);
 *
 * auto handle = client.prepare_invocation("Ping");
 * handle->http().headers["X-Auth"] = sign(handle->http().body);
 * auto response = client.finalize_invocation();
 * @endcode
 */
class Client {
public:
    /// Hook run while a two-phase invocation is prepared, before
    /// prepare_invocation() returns. Receives PREPARE_SENTINEL and the handle.
    using PrepareHook = std::function<void(int, PreparedRequest&)>;

    static constexpr int PREPARE_SENTINEL = 0;

    /**
     * @brief Create a client and resolve its contract
     * @param globals Client options; requires `wsdl` or `endpoint` + `namespace_uri`
     * @param block Evaluated against the options before they are validated
     * @param dependencies Optional collaborators overriding the defaults
     * @throws InitializationError when the options cannot describe a service
     */
    explicit Client(GlobalOptions globals,
                    const OptionsCustomizer& block = {},
                    ClientDependencies dependencies = {});

    /**
     * @brief Create a client from a YAML mapping of options
     * @throws LegacyInitializationError when the node is not a mapping
     */
    explicit Client(const YAML::Node& globals,
                    const OptionsCustomizer& block = {},
                    ClientDependencies dependencies = {});

    /**
     * @brief Pre-2.0 calling convention taking a bare WSDL location
     * @throws LegacyInitializationError always, pointing at the options form
     */
    explicit Client(const std::string& wsdl_location);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    const GlobalOptions& globals() const { return *globals_; }
    std::shared_ptr<const Contract> contract() const { return contract_; }

    // =========================================================================
    // Contract introspection
    // =========================================================================

    /// @throws MissingContractError without a WSDL document
    std::set<std::string> operations() const;

    /// @throws MissingContractError without a WSDL document
    std::string service_name() const;

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Fresh operation value; existence is checked when a request is built
    Operation operation(const std::string& operation_name) const;

    Response call(const std::string& operation_name, const LocalOptions& locals = {}) const;

    /// Build the request without sending it
    PreparedRequest build_request(const std::string& operation_name,
                                  const LocalOptions& locals = {}) const;

    // =========================================================================
    // Two-phase invocation
    // =========================================================================

    /**
     * @brief Build a request from copies of the client's HTTP, WS-Security and
     * option state and make it the pending invocation
     *
     * A previously prepared handle that was never finalized is discarded.
     *
     * @param operation_name Operation to invoke, must not be empty
     * @param locals Per-call options
     * @param hook Run immediately with PREPARE_SENTINEL and the new handle
     * @return The pending handle; changes to it are sent by finalize_invocation()
     * @throws InvocationArgumentError when no operation is named
     */
    std::shared_ptr<PreparedRequest> prepare_invocation(const std::string& operation_name,
                                                        const LocalOptions& locals = {},
                                                        const PrepareHook& hook = {});

    /**
     * @brief Send the pending invocation and consume it
     * @throws NoPendingInvocationError when nothing was prepared
     * @throws VerificationError when the response signature is invalid
     */
    Response finalize_invocation();

    /// Send an explicit handle; the pending slot is left untouched
    Response finalize_invocation(const PreparedRequest& request);

    bool has_pending_invocation() const;

    /// Snapshot of the ambient HTTP state, including propagated cookies
    HttpRequest http() const;
    const WsseSettings& wsse() const { return wsse_; }

private:
    void build_contract(ContractResolver& resolver);

    std::shared_ptr<const GlobalOptions> globals_;
    std::shared_ptr<const Contract> contract_;
    std::shared_ptr<HttpAdapter> adapter_;
    std::shared_ptr<SignatureVerifier> verifier_;
    WsseSettings wsse_;

    mutable std::mutex state_mutex_;
    HttpRequest http_;
    std::shared_ptr<PreparedRequest> pending_;
};

} // namespace soapx
