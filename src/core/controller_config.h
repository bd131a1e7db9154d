#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace xanchor {
namespace core {

struct ControllerConfig {
    // Activation within this distance (meters) of an anchor toggles its persistence
    float proximity_threshold = 0.1f;

    // One gesture source per entry, sampled in order
    std::vector<std::string> input_sources = {"/user/hand/right", "/user/hand/left"};
    std::string primary_activation_component = "/input/trigger/click";
    std::string secondary_activation_component = "/input/select/click";
    std::string viewer_path = "/user/head";

    // Persisted names look like "anchor/1a2b"
    std::string name_prefix = "anchor/";
    uint32_t name_suffix_length = 4;
    uint32_t max_name_attempts = 16;
    uint64_t name_seed = 0;  // 0 = seed from std::random_device

    // Keep the record persisted when the store rejects an unpersist
    bool gate_unpersist_on_success = false;
};

}  // namespace core
}  // namespace xanchor
