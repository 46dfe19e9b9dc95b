#pragma once

#include "soapx/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace soapx {

class WsdlParser {
public:
    virtual ~WsdlParser() = default;

    // Create parser from WSDL document content
    static std::unique_ptr<WsdlParser> create(const std::string& wsdl_xml);

    // Create parser from file
    static std::unique_ptr<WsdlParser> create_from_file(const std::string& file_path);

    // Service metadata
    virtual std::string get_service_name() const = 0;
    virtual std::string get_target_namespace() const = 0;
    virtual std::string get_endpoint() const = 0;
    virtual std::string get_element_form_default() const = 0;
    virtual std::optional<SoapVersion> get_soap_version() const = 0;

    // Operation discovery
    virtual std::vector<std::string> get_operation_names() const = 0;
    virtual bool has_operation(const std::string& operation_name) const = 0;
    virtual OperationInfo get_operation(const std::string& operation_name) const = 0;
    virtual std::vector<OperationInfo> get_all_operations() const = 0;

    // Raw document access
    virtual std::string get_wsdl_xml() const = 0;
};

} // namespace soapx
