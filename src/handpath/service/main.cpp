#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <viam/sdk/common/instance.hpp>
#include <viam/sdk/config/resource.hpp>
#include <viam/sdk/log/logging.hpp>
#include <viam/sdk/module/service.hpp>
#include <viam/sdk/registry/registry.hpp>
#include <viam/sdk/services/mlmodel.hpp>

#include <handpath/service/handpath_mlmodel_service.hpp>

namespace {

namespace vsdk = ::viam::sdk;
using handpath::service::handpath_mlmodel_service;

int serve(const std::string& socket_path) try {
    vsdk::Instance inst;

    auto registration = std::make_shared<vsdk::ModelRegistration>(
        vsdk::API::get<vsdk::MLModelService>(),
        vsdk::Model{"handpath", "mlmodelservice", "handpath"},
        // NOLINTNEXTLINE(performance-unnecessary-value-param): Signature is fixed by ModelRegistration.
        [](vsdk::Dependencies deps, vsdk::ResourceConfig config) {
            return std::make_shared<handpath_mlmodel_service>(std::move(deps), std::move(config));
        },
        [](const vsdk::ResourceConfig& config) { return handpath_mlmodel_service::validate(config); });

    vsdk::Registry::get().register_model(registration);

    auto module_service = std::make_shared<vsdk::ModuleService>(socket_path);
    module_service->add_model_from_registry(registration->api(), registration->model());

    VIAM_SDK_LOG(info) << "handpath module serving on " << socket_path;
    module_service->serve();

    return EXIT_SUCCESS;
} catch (const std::exception& ex) {
    std::cerr << "ERROR: " << ex.what() << std::endl;
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: handpath-module /path/to/unix/socket" << std::endl;
        return EXIT_FAILURE;
    }
    return serve(argv[1]);
}
