#include <vksync_instance.hpp>

#include <vksync_error_code.hpp>
#include <vksync_features.hpp>
#include <vksync_utility.hpp>

#include <spdlog/spdlog.h>

#include <volk.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <vector>

// IWYU pragma: no_include <fmt/base.h>

#ifndef VKSYNC_ENABLE_DEBUG_UTILS
#define VKSYNC_ENABLE_DEBUG_UTILS 0
#endif

namespace
{
    // Needed to query external semaphore and fence capabilities on Vulkan
    // 1.0 instances, core from 1.1.
    constexpr std::array external_capability_extensions{
        VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME,
        VK_KHR_EXTERNAL_SEMAPHORE_CAPABILITIES_EXTENSION_NAME,
        VK_KHR_EXTERNAL_FENCE_CAPABILITIES_EXTENSION_NAME,
    };

    void add_if_available(std::vector<char const*>& extensions,
        char const* const extension_name)
    {
        if (std::ranges::contains(extensions,
                std::string_view{extension_name},
                [](char const* name) { return std::string_view{name}; }))
        {
            return;
        }

        if (vksync::is_instance_extension_available(extension_name))
        {
            extensions.push_back(extension_name);
        }
        else
        {
            spdlog::debug("Optional instance extension {} not available",
                extension_name);
        }
    }
} // namespace

vksync::instance_t::~instance_t()
{
    vkDestroyInstance(handle, nullptr);
    handle = VK_NULL_HANDLE;
}

std::expected<vksync::instance_ptr_t, std::error_code> vksync::create_instance(
    instance_create_info_t const& create_info)
{
    std::vector<char const*> required_extensions{
        std::cbegin(create_info.extensions),
        std::cend(create_info.extensions)};

#if VKSYNC_ENABLE_DEBUG_UTILS
    add_if_available(required_extensions, VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
#endif

    for (char const* const extension : external_capability_extensions)
    {
        add_if_available(required_extensions, extension);
    }

    for (char const* const extension : create_info.optional_extensions)
    {
        add_if_available(required_extensions, extension);
    }

    VkApplicationInfo const app_info{
        .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
        .pApplicationName = create_info.application_name,
        .applicationVersion = create_info.application_version,
        .pEngineName = "vksync",
        .engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0),
        .apiVersion = create_info.maximum_vulkan_version};

    VkInstanceCreateInfo const ci{
        .sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
        .pNext = create_info.chain,
        .pApplicationInfo = &app_info,
        .enabledLayerCount = count_cast(create_info.layers.size()),
        .ppEnabledLayerNames = create_info.layers.data(),
        .enabledExtensionCount = count_cast(required_extensions.size()),
        .ppEnabledExtensionNames = required_extensions.data()};

    instance_ptr_t rv{new instance_t};

    if (VkResult const result{vkCreateInstance(&ci, nullptr, &rv->handle)};
        result != VK_SUCCESS)
    {
        spdlog::error("Instance creation failed: {}",
            make_error_code(result).message());
        return std::unexpected{make_error_code(result)};
    }

    volkLoadInstanceOnly(rv->handle);

    // A 1.0 loader can't report higher versions.
    rv->api_version = std::min(create_info.maximum_vulkan_version,
        volkGetInstanceVersion());

    std::ranges::copy(create_info.layers,
        std::inserter(rv->layers, rv->layers.begin()));

    std::ranges::copy(required_extensions,
        std::inserter(rv->extensions, rv->extensions.begin()));

    return rv;
}

bool vksync::is_instance_extension_available(char const* extension_name,
    char const* layer_name)
{
    return std::ranges::contains(query_instance_extensions(layer_name),
        std::string_view{extension_name},
        &VkExtensionProperties::extensionName);
}

bool vksync::is_instance_extension_enabled(char const* const extension_name,
    instance_t const& instance)
{
    return instance.extensions.contains(extension_name);
}
