#pragma once

#include "soapx/contract.hpp"
#include "soapx/options.hpp"
#include "soapx/request_builder.hpp"
#include "soapx/response.hpp"
#include <memory>
#include <string>

namespace soapx {

class HttpAdapter;

// One remote operation bound to a contract and the client options. Holds no
// per-call state; every dispatch creates a fresh value.
class Operation {
public:
    static Operation create(std::string name,
                            std::shared_ptr<const Contract> contract,
                            std::shared_ptr<const GlobalOptions> globals,
                            std::shared_ptr<HttpAdapter> adapter);

    const std::string& name() const { return name_; }
    const Contract& contract() const { return *contract_; }
    const GlobalOptions& globals() const { return *globals_; }

    PreparedRequest build(const LocalOptions& locals = {}) const;
    Response call(const LocalOptions& locals = {}) const;

private:
    Operation(std::string name,
              std::shared_ptr<const Contract> contract,
              std::shared_ptr<const GlobalOptions> globals,
              std::shared_ptr<HttpAdapter> adapter);

    std::string name_;
    std::shared_ptr<const Contract> contract_;
    std::shared_ptr<const GlobalOptions> globals_;
    std::shared_ptr<HttpAdapter> adapter_;
};

} // namespace soapx
