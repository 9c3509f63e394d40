#include <vksync_primitive.hpp>

#include <vksync_device.hpp>
#include <vksync_error_code.hpp>
#include <vksync_external_handle_type.hpp>
#include <vksync_primitive_error.hpp>
#include <vksync_primitive_pool.hpp>

#include <spdlog/spdlog.h>

#include <vulkan/utility/vk_struct_helper.hpp>

#include <volk.h>

#include <source_location>
#include <utility>

// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <fmt/format.h>
// IWYU pragma: no_include <spdlog/common.h>

namespace
{
    using semaphore_traits_t =
        vksync::primitive_traits_t<vksync::primitive_kind_t::semaphore>;

    using fence_traits_t =
        vksync::primitive_traits_t<vksync::primitive_kind_t::fence>;

    using event_traits_t =
        vksync::primitive_traits_t<vksync::primitive_kind_t::event>;
} // namespace

VkResult semaphore_traits_t::create(vksync::device_t const& device,
    VkSemaphore& handle)
{
    VkSemaphoreCreateInfo const create_info{
        .sType = vku::GetSType<VkSemaphoreCreateInfo>(),
    };

    return device.dispatch.vkCreateSemaphore(device.logical_device,
        &create_info,
        nullptr,
        &handle);
}

VkResult semaphore_traits_t::create_exportable(vksync::device_t const& device,
    vksync::external_handle_types_t const& handle_types,
    VkSemaphore& handle)
{
    VkExportSemaphoreCreateInfo const export_info{
        .sType = vku::GetSType<VkExportSemaphoreCreateInfo>(),
        .handleTypes = vksync::to_semaphore_handle_types(handle_types),
    };

    VkSemaphoreCreateInfo const create_info{
        .sType = vku::GetSType<VkSemaphoreCreateInfo>(),
        .pNext = &export_info,
    };

    return device.dispatch.vkCreateSemaphore(device.logical_device,
        &create_info,
        nullptr,
        &handle);
}

void semaphore_traits_t::destroy(vksync::device_t const& device,
    VkSemaphore const handle) noexcept
{
    device.dispatch.vkDestroySemaphore(device.logical_device, handle, nullptr);
}

VkResult semaphore_traits_t::reset(
    [[maybe_unused]] vksync::device_t const& device,
    [[maybe_unused]] VkSemaphore const handle) noexcept
{
    return VK_SUCCESS;
}

VkResult semaphore_traits_t::export_fd(vksync::device_t const& device,
    VkSemaphore const handle,
    vksync::external_handle_type_t const handle_type,
    int& fd)
{
    VkSemaphoreGetFdInfoKHR const info{
        .sType = vku::GetSType<VkSemaphoreGetFdInfoKHR>(),
        .semaphore = handle,
        .handleType = vksync::to_semaphore_handle_type(handle_type),
    };

    return device.dispatch.vkGetSemaphoreFdKHR(device.logical_device,
        &info,
        &fd);
}

vksync::primitive_pool_t<VkSemaphore>& semaphore_traits_t::pool(
    vksync::device_t& device) noexcept
{
    return device.semaphore_pool;
}

VkResult fence_traits_t::create(vksync::device_t const& device,
    VkFence& handle)
{
    VkFenceCreateInfo const create_info{
        .sType = vku::GetSType<VkFenceCreateInfo>(),
    };

    return device.dispatch.vkCreateFence(device.logical_device,
        &create_info,
        nullptr,
        &handle);
}

VkResult fence_traits_t::create_exportable(vksync::device_t const& device,
    vksync::external_handle_types_t const& handle_types,
    VkFence& handle)
{
    VkExportFenceCreateInfo const export_info{
        .sType = vku::GetSType<VkExportFenceCreateInfo>(),
        .handleTypes = vksync::to_fence_handle_types(handle_types),
    };

    VkFenceCreateInfo const create_info{
        .sType = vku::GetSType<VkFenceCreateInfo>(),
        .pNext = &export_info,
    };

    return device.dispatch.vkCreateFence(device.logical_device,
        &create_info,
        nullptr,
        &handle);
}

void fence_traits_t::destroy(vksync::device_t const& device,
    VkFence const handle) noexcept
{
    device.dispatch.vkDestroyFence(device.logical_device, handle, nullptr);
}

VkResult fence_traits_t::reset(vksync::device_t const& device,
    VkFence const handle) noexcept
{
    return device.dispatch.vkResetFences(device.logical_device, 1, &handle);
}

VkResult fence_traits_t::export_fd(vksync::device_t const& device,
    VkFence const handle,
    vksync::external_handle_type_t const handle_type,
    int& fd)
{
    VkFenceGetFdInfoKHR const info{
        .sType = vku::GetSType<VkFenceGetFdInfoKHR>(),
        .fence = handle,
        .handleType = static_cast<VkExternalFenceHandleTypeFlagBits>(
            vksync::to_fence_handle_type(handle_type)),
    };

    return device.dispatch.vkGetFenceFdKHR(device.logical_device, &info, &fd);
}

vksync::primitive_pool_t<VkFence>& fence_traits_t::pool(
    vksync::device_t& device) noexcept
{
    return device.fence_pool;
}

VkResult event_traits_t::create(vksync::device_t const& device,
    VkEvent& handle)
{
    VkEventCreateInfo const create_info{
        .sType = vku::GetSType<VkEventCreateInfo>(),
    };

    return device.dispatch.vkCreateEvent(device.logical_device,
        &create_info,
        nullptr,
        &handle);
}

void event_traits_t::destroy(vksync::device_t const& device,
    VkEvent const handle) noexcept
{
    device.dispatch.vkDestroyEvent(device.logical_device, handle, nullptr);
}

VkResult event_traits_t::reset(vksync::device_t const& device,
    VkEvent const handle) noexcept
{
    return device.dispatch.vkResetEvent(device.logical_device, handle);
}

vksync::primitive_pool_t<VkEvent>& event_traits_t::pool(
    vksync::device_t& device) noexcept
{
    return device.event_pool;
}

vksync::oom_error_t vksync::detail::creation_failed(primitive_kind_t const kind,
    VkResult const result,
    std::source_location const source_location)
{
    if (classify_oom(result))
    {
        spdlog::warn("Creation of {} failed: {}",
            kind,
            make_error_code(result).message());
    }

    return to_oom_error(result, source_location);
}

void vksync::detail::reset_failed(primitive_kind_t const kind,
    VkResult const result)
{
    spdlog::warn("Reset of pooled {} failed, destroying it: {}",
        kind,
        make_error_code(result).message());
}
