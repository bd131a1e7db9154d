// Shared utilities
#include "common.h"

#include <unordered_map>

namespace xanchor {

// Only the codes this project produces or receives from providers
static const std::unordered_map<XrResult, const char*> g_resultStrings = {
    {XR_SUCCESS, "XR_SUCCESS"},
    {XR_ERROR_VALIDATION_FAILURE, "XR_ERROR_VALIDATION_FAILURE"},
    {XR_ERROR_RUNTIME_FAILURE, "XR_ERROR_RUNTIME_FAILURE"},
    {XR_ERROR_OUT_OF_MEMORY, "XR_ERROR_OUT_OF_MEMORY"},
    {XR_ERROR_FEATURE_UNSUPPORTED, "XR_ERROR_FEATURE_UNSUPPORTED"},
    {XR_ERROR_LIMIT_REACHED, "XR_ERROR_LIMIT_REACHED"},
    {XR_ERROR_HANDLE_INVALID, "XR_ERROR_HANDLE_INVALID"},
    {XR_ERROR_PATH_INVALID, "XR_ERROR_PATH_INVALID"},
    {XR_ERROR_CALL_ORDER_INVALID, "XR_ERROR_CALL_ORDER_INVALID"},
    {XR_ERROR_POSE_INVALID, "XR_ERROR_POSE_INVALID"},
    {XR_ERROR_CREATE_SPATIAL_ANCHOR_FAILED_MSFT, "XR_ERROR_CREATE_SPATIAL_ANCHOR_FAILED_MSFT"},
    {XR_ERROR_SPATIAL_ANCHOR_NAME_NOT_FOUND_MSFT, "XR_ERROR_SPATIAL_ANCHOR_NAME_NOT_FOUND_MSFT"},
    {XR_ERROR_SPATIAL_ANCHOR_NAME_INVALID_MSFT, "XR_ERROR_SPATIAL_ANCHOR_NAME_INVALID_MSFT"},
};

const char* ResultToString(XrResult result) {
    auto it = g_resultStrings.find(result);
    if (it != g_resultStrings.end()) {
        return it->second;
    }
    return "XR_UNKNOWN_RESULT";
}

}  // namespace xanchor
