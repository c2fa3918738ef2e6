#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <viam/sdk/config/resource.hpp>
#include <viam/sdk/resource/reconfigurable.hpp>
#include <viam/sdk/services/mlmodel.hpp>

#include <handpath/synth/config.hpp>

namespace handpath::service {

///
/// MLModelService that synthesizes a human-like pointer trajectory per inference.
///
/// Attributes name generator_config members; ranges are two-element lists.
/// Inputs are start_px [2], end_px [2], and optionally duration_sec [1] (0 derives
/// a duration from distance) and seed [1] (int64; absent seeds nondeterministically).
///
class handpath_mlmodel_service final : public ::viam::sdk::MLModelService, public ::viam::sdk::Reconfigurable {
   public:
    handpath_mlmodel_service(::viam::sdk::Dependencies deps, ::viam::sdk::ResourceConfig config);

    void reconfigure(const ::viam::sdk::Dependencies&, const ::viam::sdk::ResourceConfig&) override;

    std::shared_ptr<named_tensor_views> infer(const named_tensor_views& inputs, const ::viam::sdk::ProtoStruct& extra) override;

    struct metadata metadata(const ::viam::sdk::ProtoStruct& extra) override;

    ///
    /// Checks resource attributes without constructing a service.
    ///
    /// @return Implicit dependencies (always empty)
    /// @throws std::invalid_argument on an unknown attribute or an invalid configuration
    ///
    static std::vector<std::string> validate(const ::viam::sdk::ResourceConfig& cfg);

    ///
    /// Builds a generator configuration from resource attributes.
    ///
    /// @throws std::invalid_argument on an unknown attribute, a wrongly typed value,
    ///         or a configuration that fails generator_config::validate()
    ///
    static synth::generator_config parse_config(const ::viam::sdk::ResourceConfig& cfg);

   private:
    mutable std::shared_mutex config_mutex_;
    synth::generator_config config_;
};

}  // namespace handpath::service
