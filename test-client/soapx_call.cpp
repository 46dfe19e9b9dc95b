#include "soapx/soapx.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

struct CallArguments {
    std::optional<std::string> config_file;
    std::optional<std::string> wsdl;
    std::optional<std::string> endpoint;
    std::optional<std::string> namespace_uri;
    std::string operation;
    std::string message = "{}";
    std::vector<std::pair<std::string, std::string>> headers;
    bool list = false;
    bool two_phase = false;
    bool print_request = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config=FILE        YAML file with client options\n"
              << "  --wsdl=LOCATION      WSDL path or URL (overrides the config file)\n"
              << "  --endpoint=URL       SOAP endpoint (overrides the config file)\n"
              << "  --namespace=URI      Target namespace (overrides the config file)\n"
              << "  --list               List the operations of the service\n"
              << "  --operation=NAME     Operation to invoke\n"
              << "  --message=JSON       Message body as a JSON object (default: {})\n"
              << "  --header=NAME:VALUE  Extra HTTP header, may be repeated\n"
              << "  --two-phase          Prepare and finalize the invocation separately\n"
              << "  --print-request      Print the request envelope before sending\n"
              << "  --help, -h           Show this help message\n";
}

class SoapCall {
public:
    explicit SoapCall(CallArguments arguments)
        : arguments_(std::move(arguments)) {}

    int Run() {
        soapx::GlobalOptions options;
        if (arguments_.config_file) {
            LOG(INFO) << "Loading client options from " << *arguments_.config_file;
            options = soapx::GlobalOptions::from_yaml_file(*arguments_.config_file);
        }

        soapx::Client client(options, [this](soapx::GlobalOptions& globals) {
            if (arguments_.wsdl) globals.wsdl = arguments_.wsdl;
            if (arguments_.endpoint) globals.endpoint = arguments_.endpoint;
            if (arguments_.namespace_uri) globals.namespace_uri = arguments_.namespace_uri;
        });

        if (arguments_.list) {
            std::cout << "Service: " << client.service_name() << std::endl;
            for (const auto& name : client.operations()) {
                std::cout << "  " << name << std::endl;
            }
            if (arguments_.operation.empty()) {
                return 0;
            }
        }

        if (arguments_.operation.empty()) {
            LOG(ERROR) << "No operation given, use --operation=NAME or --list";
            return 1;
        }

        soapx::LocalOptions locals;
        locals.message = json::parse(arguments_.message);
        for (const auto& [name, value] : arguments_.headers) {
            locals.headers[name] = value;
        }

        soapx::Response response = arguments_.two_phase ? InvokeTwoPhase(client, locals)
                                                        : InvokeDirect(client, locals);

        std::cout << response.body().dump(2) << std::endl;
        return response.success() ? 0 : 1;
    }

private:
    soapx::Response InvokeDirect(soapx::Client& client, const soapx::LocalOptions& locals) {
        if (arguments_.print_request) {
            PrintRequest(client.build_request(arguments_.operation, locals));
        }
        return client.call(arguments_.operation, locals);
    }

    soapx::Response InvokeTwoPhase(soapx::Client& client, const soapx::LocalOptions& locals) {
        auto handle = client.prepare_invocation(arguments_.operation, locals);
        if (arguments_.print_request) {
            PrintRequest(*handle);
        }
        soapx::Response response = client.finalize_invocation();

        auto cookies = client.http().cookies;
        if (!cookies.empty()) {
            std::cout << "Session cookies: " << cookies.fetch() << std::endl;
        }
        return response;
    }

    void PrintRequest(const soapx::PreparedRequest& request) {
        std::cout << "POST " << request.http().url << std::endl;
        for (const auto& [name, value] : request.http().headers) {
            std::cout << name << ": " << value << std::endl;
        }
        std::cout << std::endl << request.http().body << std::endl;
    }

    CallArguments arguments_;
};

} // namespace

int main(int argc, char* argv[]) {
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    // Parse command line arguments
    CallArguments arguments;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) {
            arguments.config_file = arg.substr(9);
        } else if (arg.find("--wsdl=") == 0) {
            arguments.wsdl = arg.substr(7);
        } else if (arg.find("--endpoint=") == 0) {
            arguments.endpoint = arg.substr(11);
        } else if (arg.find("--namespace=") == 0) {
            arguments.namespace_uri = arg.substr(12);
        } else if (arg.find("--operation=") == 0) {
            arguments.operation = arg.substr(12);
        } else if (arg.find("--message=") == 0) {
            arguments.message = arg.substr(10);
        } else if (arg.find("--header=") == 0) {
            std::string header = arg.substr(9);
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Invalid header (expected NAME:VALUE): " << header << std::endl;
                return 1;
            }
            arguments.headers.emplace_back(header.substr(0, colon), header.substr(colon + 1));
        } else if (arg == "--list") {
            arguments.list = true;
        } else if (arg == "--two-phase") {
            arguments.two_phase = true;
        } else if (arg == "--print-request") {
            arguments.print_request = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        SoapCall call(std::move(arguments));
        return call.Run();
    } catch (const soapx::SoapFault& e) {
        LOG(ERROR) << "SOAP fault " << e.fault_code() << ": " << e.fault_reason();
        return 1;
    } catch (const soapx::Error& e) {
        LOG(ERROR) << "soapx_call failed [" << soapx::error_kind_name(e.kind()) << "]: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "soapx_call failed: " << e.what();
        return 1;
    }
}
