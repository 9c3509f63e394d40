#ifndef VKSYNC_UTILITY_INCLUDED
#define VKSYNC_UTILITY_INCLUDED

#include <volk.h>

#include <cassert>
#include <cstdint>
#include <source_location>
#include <utility>

namespace vksync
{
    VkResult check_result(VkResult result,
        std::source_location source_location = std::source_location::current());

    [[nodiscard]] constexpr bool is_success_result(VkResult result) noexcept
    {
        return std::to_underlying(result) >= 0;
    }

    template<typename T>
    [[nodiscard]] constexpr uint32_t count_cast(T const count)
    {
        assert(std::in_range<uint32_t>(count));
        return static_cast<uint32_t>(count);
    }
} // namespace vksync

#endif
