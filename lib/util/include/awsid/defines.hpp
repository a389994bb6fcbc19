#pragma once

namespace awsid {
#if defined(AWSID_DEBUG)
constexpr bool debug_v{true};
#elif defined(NDEBUG)
constexpr bool debug_v{false};
#else
constexpr bool debug_v{true};
#endif
} // namespace awsid
