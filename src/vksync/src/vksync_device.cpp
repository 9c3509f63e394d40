#include <vksync_device.hpp>

#include <vksync_capabilities.hpp>
#include <vksync_error_code.hpp>
#include <vksync_features.hpp>
#include <vksync_instance.hpp>
#include <vksync_utility.hpp>

#include <spdlog/spdlog.h>

#include <vulkan/utility/vk_struct_helper.hpp>

#include <volk.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <vector>

// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <fmt/format.h>
// IWYU pragma: no_include <spdlog/common.h>

namespace
{
    constexpr std::array external_primitive_extensions{
        VK_KHR_EXTERNAL_SEMAPHORE_EXTENSION_NAME,
        VK_KHR_EXTERNAL_SEMAPHORE_FD_EXTENSION_NAME,
        VK_KHR_EXTERNAL_FENCE_EXTENSION_NAME,
        VK_KHR_EXTERNAL_FENCE_FD_EXTENSION_NAME,
    };

    template<typename Handle, typename Destroy>
    void destroy_pooled(vksync::device_t const& device,
        vksync::primitive_pool_t<Handle>& pool,
        Destroy const destroy,
        std::string_view const kind)
    {
        std::vector<Handle> const handles{pool.drain()};
        if (handles.empty())
        {
            return;
        }

        spdlog::debug("Destroying {} pooled {}", handles.size(), kind);
        for (Handle const handle : handles)
        {
            destroy(device.logical_device, handle, nullptr);
        }
    }
} // namespace

vksync::device_t::~device_t()
{
    if (logical_device == VK_NULL_HANDLE)
    {
        return;
    }

    destroy_pooled(*this,
        semaphore_pool,
        dispatch.vkDestroySemaphore,
        "semaphores");
    destroy_pooled(*this, fence_pool, dispatch.vkDestroyFence, "fences");
    destroy_pooled(*this, event_pool, dispatch.vkDestroyEvent, "events");

    dispatch.vkDestroyDevice(logical_device, nullptr);
}

bool vksync::is_device_extension_enabled(char const* const extension_name,
    device_t const& device)
{
    return device.extensions.contains(extension_name);
}

std::expected<vksync::device_ptr_t, std::error_code> vksync::create_device(
    instance_ptr_t const& instance,
    std::span<char const* const> const& extensions,
    physical_device_features_t const& features,
    std::span<queue_family_t const> const& queue_families)
{
    std::vector<char const*> effective_extensions{std::cbegin(extensions),
        std::cend(extensions)};
    for (char const* const extension : external_primitive_extensions)
    {
        if (has_extension(features, extension) &&
            !std::ranges::contains(effective_extensions,
                std::string_view{extension},
                [](char const* name) { return std::string_view{name}; }))
        {
            effective_extensions.push_back(extension);
        }
    }

    float const priority{1.0f};
    std::vector<VkDeviceQueueCreateInfo> queue_create_infos;
    queue_create_infos.reserve(queue_families.size());
    for (queue_family_t const& family : queue_families)
    {
        queue_create_infos.push_back(
            {.sType = vku::GetSType<VkDeviceQueueCreateInfo>(),
                .queueFamilyIndex = family.index,
                .queueCount = 1,
                .pQueuePriorities = &priority});
    }

    VkDeviceCreateInfo const ci{.sType = vku::GetSType<VkDeviceCreateInfo>(),
        .queueCreateInfoCount = count_cast(queue_create_infos.size()),
        .pQueueCreateInfos = queue_create_infos.data(),
        .enabledExtensionCount = count_cast(effective_extensions.size()),
        .ppEnabledExtensionNames = effective_extensions.data()};

    device_ptr_t rv{new device_t};
    rv->instance = instance;
    rv->physical_device = features.device;
    rv->api_version =
        std::min(instance->api_version, features.properties.apiVersion);

    if (VkResult const result{
            vkCreateDevice(features.device, &ci, nullptr, &rv->logical_device)};
        result != VK_SUCCESS)
    {
        spdlog::error("Device creation failed: {}",
            make_error_code(result).message());
        return std::unexpected{make_error_code(result)};
    }

    volkLoadDeviceTable(&rv->dispatch, rv->logical_device);

    std::ranges::copy(effective_extensions,
        std::inserter(rv->extensions, rv->extensions.begin()));

    rv->capabilities = query_capabilities(*instance,
        rv->physical_device,
        rv->api_version,
        rv->extensions);

    spdlog::info("Created device on {}", features.properties.deviceName);

    return rv;
}
