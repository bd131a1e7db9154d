#include "anchor_name_generator.h"

#include <utility>

namespace xanchor {
namespace core {

static uint64_t ResolveSeed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | device();
}

AnchorNameGenerator::AnchorNameGenerator(std::string prefix, uint32_t suffix_length, uint32_t max_attempts,
                                         uint64_t seed)
    : prefix_(std::move(prefix)),
      suffix_length_(suffix_length == 0 ? 1 : suffix_length),
      max_attempts_(max_attempts == 0 ? 1 : max_attempts),
      engine_(ResolveSeed(seed)) {}

std::string AnchorNameGenerator::Candidate() {
    static const char kHexDigits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> digit(0, 15);

    std::string name = prefix_;
    name.reserve(prefix_.size() + suffix_length_);
    for (uint32_t i = 0; i < suffix_length_; i++) {
        name.push_back(kHexDigits[digit(engine_)]);
    }
    return name;
}

std::string AnchorNameGenerator::Generate(const std::unordered_set<std::string>& taken) {
    for (uint32_t attempt = 0; attempt < max_attempts_; attempt++) {
        std::string name = Candidate();
        if (taken.find(name) == taken.end()) {
            return name;
        }
    }
    return std::string();
}

}  // namespace core
}  // namespace xanchor
