#ifndef VKSYNC_ERROR_CODE_INCLUDED
#define VKSYNC_ERROR_CODE_INCLUDED

#include <volk.h>

#include <system_error>
#include <type_traits>

namespace vksync
{
    [[nodiscard]] std::error_code make_error_code(VkResult result);
} // namespace vksync

template<>
struct std::is_error_code_enum<VkResult> : std::true_type
{
};

#endif
