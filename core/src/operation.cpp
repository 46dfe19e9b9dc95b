#include "soapx/operation.hpp"
#include "soapx/http.hpp"
#include "soapx/wsse.hpp"
#include <glog/logging.h>

namespace soapx {

Operation::Operation(std::string name,
                     std::shared_ptr<const Contract> contract,
                     std::shared_ptr<const GlobalOptions> globals,
                     std::shared_ptr<HttpAdapter> adapter)
    : name_(std::move(name)),
      contract_(std::move(contract)),
      globals_(std::move(globals)),
      adapter_(std::move(adapter)) {}

Operation Operation::create(std::string name,
                            std::shared_ptr<const Contract> contract,
                            std::shared_ptr<const GlobalOptions> globals,
                            std::shared_ptr<HttpAdapter> adapter) {
    return Operation(std::move(name), std::move(contract), std::move(globals), std::move(adapter));
}

PreparedRequest Operation::build(const LocalOptions& locals) const {
    RequestBuilder builder(name_, locals);
    builder.set_contract(contract_);
    builder.set_adapter(adapter_);
    builder.set_http(HttpRequest::from_options(*globals_));
    builder.set_wsse(WsseSettings::from_options(*globals_));
    builder.set_config(*globals_);
    return builder.build();
}

Response Operation::call(const LocalOptions& locals) const {
    VLOG(1) << "Calling operation " << name_;
    return build(locals).response();
}

} // namespace soapx
