#include <vksync_capabilities.hpp>

#include <vksync_instance.hpp>

#include <spdlog/spdlog.h>

#include <vulkan/utility/vk_struct_helper.hpp>

#include <volk.h>

// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <spdlog/common.h>

namespace
{
    [[nodiscard]] bool has_instance_capability(
        vksync::instance_t const& instance,
        char const* const extension_name)
    {
        return instance.api_version >= VK_API_VERSION_1_1 ||
            is_instance_extension_enabled(extension_name, instance);
    }

    [[nodiscard]] bool has_device_capability(uint32_t const api_version,
        std::set<std::string, std::less<>> const& extensions,
        char const* const extension_name)
    {
        return api_version >= VK_API_VERSION_1_1 ||
            extensions.contains(extension_name);
    }

    void query_semaphore_handle_types(VkPhysicalDevice const physical_device,
        vksync::external_primitive_capabilities_t& capabilities)
    {
        PFN_vkGetPhysicalDeviceExternalSemaphoreProperties const query{
            vkGetPhysicalDeviceExternalSemaphoreProperties
                ? vkGetPhysicalDeviceExternalSemaphoreProperties
                : vkGetPhysicalDeviceExternalSemaphorePropertiesKHR};
        if (!query)
        {
            spdlog::warn("External semaphore properties query not loaded");
            return;
        }

        for (vksync::external_handle_type_t const type :
            vksync::all_external_handle_types)
        {
            VkPhysicalDeviceExternalSemaphoreInfo const info{
                .sType =
                    vku::GetSType<VkPhysicalDeviceExternalSemaphoreInfo>(),
                .handleType = vksync::to_semaphore_handle_type(type)};

            VkExternalSemaphoreProperties properties{
                .sType = vku::GetSType<VkExternalSemaphoreProperties>()};
            query(physical_device, &info, &properties);

            auto& rv{capabilities.properties(type)};
            rv.exportable = (properties.externalSemaphoreFeatures &
                                VK_EXTERNAL_SEMAPHORE_FEATURE_EXPORTABLE_BIT) !=
                0;
            rv.importable = (properties.externalSemaphoreFeatures &
                                VK_EXTERNAL_SEMAPHORE_FEATURE_IMPORTABLE_BIT) !=
                0;
            rv.compatible_handle_types = vksync::from_semaphore_handle_types(
                properties.compatibleHandleTypes);
        }
    }

    void query_fence_handle_types(VkPhysicalDevice const physical_device,
        vksync::external_primitive_capabilities_t& capabilities)
    {
        PFN_vkGetPhysicalDeviceExternalFenceProperties const query{
            vkGetPhysicalDeviceExternalFenceProperties
                ? vkGetPhysicalDeviceExternalFenceProperties
                : vkGetPhysicalDeviceExternalFencePropertiesKHR};
        if (!query)
        {
            spdlog::warn("External fence properties query not loaded");
            return;
        }

        for (vksync::external_handle_type_t const type :
            vksync::all_external_handle_types)
        {
            auto const handle_type{static_cast<VkExternalFenceHandleTypeFlagBits>(
                vksync::to_fence_handle_type(type))};
            if (handle_type == 0)
            {
                continue;
            }

            VkPhysicalDeviceExternalFenceInfo const info{
                .sType = vku::GetSType<VkPhysicalDeviceExternalFenceInfo>(),
                .handleType = handle_type};

            VkExternalFenceProperties properties{
                .sType = vku::GetSType<VkExternalFenceProperties>()};
            query(physical_device, &info, &properties);

            auto& rv{capabilities.properties(type)};
            rv.exportable = (properties.externalFenceFeatures &
                                VK_EXTERNAL_FENCE_FEATURE_EXPORTABLE_BIT) != 0;
            rv.importable = (properties.externalFenceFeatures &
                                VK_EXTERNAL_FENCE_FEATURE_IMPORTABLE_BIT) != 0;
            rv.compatible_handle_types = vksync::from_fence_handle_types(
                properties.compatibleHandleTypes);
        }
    }
} // namespace

vksync::capability_table_t vksync::query_capabilities(
    instance_t const& instance,
    VkPhysicalDevice const physical_device,
    uint32_t const device_api_version,
    std::set<std::string, std::less<>> const& device_extensions)
{
    capability_table_t rv;

    rv.get_physical_device_properties2 = has_instance_capability(instance,
        VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME);

    rv.semaphore.instance_capabilities = has_instance_capability(instance,
        VK_KHR_EXTERNAL_SEMAPHORE_CAPABILITIES_EXTENSION_NAME);
    rv.semaphore.device_extension = has_device_capability(device_api_version,
        device_extensions,
        VK_KHR_EXTERNAL_SEMAPHORE_EXTENSION_NAME);
    rv.semaphore.fd_extension =
        device_extensions.contains(VK_KHR_EXTERNAL_SEMAPHORE_FD_EXTENSION_NAME);

    rv.fence.instance_capabilities = has_instance_capability(instance,
        VK_KHR_EXTERNAL_FENCE_CAPABILITIES_EXTENSION_NAME);
    rv.fence.device_extension = has_device_capability(device_api_version,
        device_extensions,
        VK_KHR_EXTERNAL_FENCE_EXTENSION_NAME);
    rv.fence.fd_extension =
        device_extensions.contains(VK_KHR_EXTERNAL_FENCE_FD_EXTENSION_NAME);

    if (rv.get_physical_device_properties2)
    {
        if (rv.semaphore.instance_capabilities)
        {
            query_semaphore_handle_types(physical_device, rv.semaphore);
        }

        if (rv.fence.instance_capabilities)
        {
            query_fence_handle_types(physical_device, rv.fence);
        }
    }

    return rv;
}
