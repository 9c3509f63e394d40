#include <vksync_external_handle_type.hpp>

#include <volk.h>

#include <cassert>
#include <string_view>

std::string_view vksync::to_string(primitive_kind_t const kind) noexcept
{
    switch (kind)
    {
    case primitive_kind_t::semaphore:
        return "semaphore";
    case primitive_kind_t::fence:
        return "fence";
    case primitive_kind_t::event:
        return "event";
    }

    assert(false);
    return "unknown primitive";
}

std::string_view vksync::to_string(external_handle_type_t const type) noexcept
{
    switch (type)
    {
    case external_handle_type_t::opaque_fd:
        return "opaque_fd";
    case external_handle_type_t::opaque_win32:
        return "opaque_win32";
    case external_handle_type_t::opaque_win32_kmt:
        return "opaque_win32_kmt";
    case external_handle_type_t::d3d12_fence:
        return "d3d12_fence";
    case external_handle_type_t::sync_fd:
        return "sync_fd";
    }

    assert(false);
    return "unknown handle type";
}

VkExternalSemaphoreHandleTypeFlagBits vksync::to_semaphore_handle_type(
    external_handle_type_t const type) noexcept
{
    switch (type)
    {
    case external_handle_type_t::opaque_fd:
        return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_OPAQUE_FD_BIT;
    case external_handle_type_t::opaque_win32:
        return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_OPAQUE_WIN32_BIT;
    case external_handle_type_t::opaque_win32_kmt:
        return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_OPAQUE_WIN32_KMT_BIT;
    case external_handle_type_t::d3d12_fence:
        return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_D3D12_FENCE_BIT;
    case external_handle_type_t::sync_fd:
        return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_SYNC_FD_BIT;
    }

    assert(false);
    return VK_EXTERNAL_SEMAPHORE_HANDLE_TYPE_FLAG_BITS_MAX_ENUM;
}

VkExternalFenceHandleTypeFlags vksync::to_fence_handle_type(
    external_handle_type_t const type) noexcept
{
    switch (type)
    {
    case external_handle_type_t::opaque_fd:
        return VK_EXTERNAL_FENCE_HANDLE_TYPE_OPAQUE_FD_BIT;
    case external_handle_type_t::opaque_win32:
        return VK_EXTERNAL_FENCE_HANDLE_TYPE_OPAQUE_WIN32_BIT;
    case external_handle_type_t::opaque_win32_kmt:
        return VK_EXTERNAL_FENCE_HANDLE_TYPE_OPAQUE_WIN32_KMT_BIT;
    case external_handle_type_t::d3d12_fence:
        return 0;
    case external_handle_type_t::sync_fd:
        return VK_EXTERNAL_FENCE_HANDLE_TYPE_SYNC_FD_BIT;
    }

    assert(false);
    return 0;
}

VkExternalSemaphoreHandleTypeFlags vksync::to_semaphore_handle_types(
    external_handle_types_t const& types) noexcept
{
    VkExternalSemaphoreHandleTypeFlags rv{};
    for (external_handle_type_t const type : types)
    {
        rv |= to_semaphore_handle_type(type);
    }
    return rv;
}

VkExternalFenceHandleTypeFlags vksync::to_fence_handle_types(
    external_handle_types_t const& types) noexcept
{
    VkExternalFenceHandleTypeFlags rv{};
    for (external_handle_type_t const type : types)
    {
        rv |= to_fence_handle_type(type);
    }
    return rv;
}

vksync::external_handle_types_t vksync::from_semaphore_handle_types(
    VkExternalSemaphoreHandleTypeFlags const flags)
{
    external_handle_types_t rv;
    for (external_handle_type_t const type : all_external_handle_types)
    {
        if ((flags & to_semaphore_handle_type(type)) != 0)
        {
            rv.insert(type);
        }
    }
    return rv;
}

vksync::external_handle_types_t vksync::from_fence_handle_types(
    VkExternalFenceHandleTypeFlags const flags)
{
    external_handle_types_t rv;
    for (external_handle_type_t const type : all_external_handle_types)
    {
        VkExternalFenceHandleTypeFlags const bit{to_fence_handle_type(type)};
        if (bit != 0 && (flags & bit) != 0)
        {
            rv.insert(type);
        }
    }
    return rv;
}
