#pragma once

// Main header file for the soapx core library

#include "soapx/errors.hpp"
#include "soapx/types.hpp"
#include "soapx/options.hpp"
#include "soapx/http.hpp"
#include "soapx/wsdl.hpp"
#include "soapx/contract.hpp"
#include "soapx/wsse.hpp"
#include "soapx/response.hpp"
#include "soapx/request_builder.hpp"
#include "soapx/operation.hpp"
#include "soapx/client.hpp"

namespace soapx {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace soapx
