#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <unordered_set>

namespace xanchor {
namespace core {

// Short random names for persisted anchors: prefix followed by lowercase hex digits
class AnchorNameGenerator {
   public:
    // seed 0 draws a seed from std::random_device
    AnchorNameGenerator(std::string prefix, uint32_t suffix_length, uint32_t max_attempts, uint64_t seed = 0);

    // Returns a name not contained in taken, or an empty string once max_attempts candidates collided
    std::string Generate(const std::unordered_set<std::string>& taken);

   private:
    std::string Candidate();

    std::string prefix_;
    uint32_t suffix_length_;
    uint32_t max_attempts_;
    std::mt19937_64 engine_;
};

}  // namespace core
}  // namespace xanchor
