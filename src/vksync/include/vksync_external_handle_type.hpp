#ifndef VKSYNC_EXTERNAL_HANDLE_TYPE_INCLUDED
#define VKSYNC_EXTERNAL_HANDLE_TYPE_INCLUDED

#include <boost/container/flat_set.hpp>

#include <fmt/format.h>

#include <volk.h>

#include <array>
#include <cstdint>
#include <string_view>

namespace vksync
{
    enum class primitive_kind_t : uint8_t
    {
        semaphore,
        fence,
        event,
    };

    [[nodiscard]] std::string_view to_string(primitive_kind_t kind) noexcept;

    // Mechanisms through which a primitive can be shared with another
    // process or API.
    enum class external_handle_type_t : uint8_t
    {
        opaque_fd,
        opaque_win32,
        opaque_win32_kmt,
        d3d12_fence,
        sync_fd,
    };

    inline constexpr std::array all_external_handle_types{
        external_handle_type_t::opaque_fd,
        external_handle_type_t::opaque_win32,
        external_handle_type_t::opaque_win32_kmt,
        external_handle_type_t::d3d12_fence,
        external_handle_type_t::sync_fd,
    };

    // Ordered by enumeration value, which keeps pairwise checks and error
    // reports deterministic.
    using external_handle_types_t =
        boost::container::flat_set<external_handle_type_t>;

    [[nodiscard]] std::string_view to_string(
        external_handle_type_t type) noexcept;

    [[nodiscard]] constexpr bool is_fd_handle_type(
        external_handle_type_t const type) noexcept
    {
        return type == external_handle_type_t::opaque_fd ||
            type == external_handle_type_t::sync_fd;
    }

    [[nodiscard]] VkExternalSemaphoreHandleTypeFlagBits to_semaphore_handle_type(
        external_handle_type_t type) noexcept;

    // d3d12_fence has no fence counterpart and maps to 0.
    [[nodiscard]] VkExternalFenceHandleTypeFlags to_fence_handle_type(
        external_handle_type_t type) noexcept;

    [[nodiscard]] VkExternalSemaphoreHandleTypeFlags to_semaphore_handle_types(
        external_handle_types_t const& types) noexcept;

    [[nodiscard]] VkExternalFenceHandleTypeFlags to_fence_handle_types(
        external_handle_types_t const& types) noexcept;

    // Bits without a counterpart in external_handle_type_t are ignored.
    [[nodiscard]] external_handle_types_t from_semaphore_handle_types(
        VkExternalSemaphoreHandleTypeFlags flags);

    [[nodiscard]] external_handle_types_t from_fence_handle_types(
        VkExternalFenceHandleTypeFlags flags);
} // namespace vksync

template<>
struct fmt::formatter<vksync::external_handle_type_t>
    : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(vksync::external_handle_type_t const type,
        FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            vksync::to_string(type),
            ctx);
    }
};

template<>
struct fmt::formatter<vksync::primitive_kind_t>
    : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(vksync::primitive_kind_t const kind, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(vksync::to_string(kind),
            ctx);
    }
};

#endif
