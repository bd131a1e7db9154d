#pragma once

#include <openxr/openxr.h>

namespace xanchor {

// Readable name for a result code, "XR_UNKNOWN_RESULT" for codes not in the table
const char* ResultToString(XrResult result);

}  // namespace xanchor
