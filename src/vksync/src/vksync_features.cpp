#include <vksync_features.hpp>

#include <vksync_instance.hpp>
#include <vksync_utility.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <string_view>
#include <utility>

namespace
{
    [[nodiscard]] std::vector<vksync::queue_family_t> query_queue_families(
        VkPhysicalDevice device)
    {
        uint32_t count{};
        vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);

        std::vector<VkQueueFamilyProperties> family_properties{count};
        vkGetPhysicalDeviceQueueFamilyProperties(device,
            &count,
            family_properties.data());

        std::vector<vksync::queue_family_t> rv;
        rv.reserve(family_properties.size());

        uint32_t index{};
        for (auto const& properties : family_properties)
        {
            rv.emplace_back(index, properties);
            ++index;
        }

        return rv;
    }

    [[nodiscard]] std::vector<VkPhysicalDevice> query_physical_devices(
        VkInstance instance)
    {
        uint32_t count{};
        vksync::check_result(
            vkEnumeratePhysicalDevices(instance, &count, nullptr));

        std::vector<VkPhysicalDevice> rv{count};
        vksync::check_result(
            vkEnumeratePhysicalDevices(instance, &count, rv.data()));

        return rv;
    }

    [[nodiscard]] auto pick_device_by_type(
        std::ranges::forward_range auto&& devices)
    {
        for (VkPhysicalDeviceType const type :
            {VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU,
                VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU,
                VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU})
        {
            auto const it{std::ranges::find(devices,
                type,
                [](vksync::physical_device_features_t const& d)
                { return d.properties.deviceType; })};
            if (it != std::end(devices))
            {
                return it;
            }
        }

        return std::begin(devices);
    }
} // namespace

std::vector<VkLayerProperties> vksync::query_instance_layers()
{
    uint32_t count{};
    check_result(vkEnumerateInstanceLayerProperties(&count, nullptr));

    std::vector<VkLayerProperties> rv{count};
    check_result(vkEnumerateInstanceLayerProperties(&count, rv.data()));

    return rv;
}

std::vector<VkExtensionProperties> vksync::query_instance_extensions(
    char const* const layer_name)
{
    uint32_t count{};
    check_result(
        vkEnumerateInstanceExtensionProperties(layer_name, &count, nullptr));

    std::vector<VkExtensionProperties> rv{count};
    check_result(
        vkEnumerateInstanceExtensionProperties(layer_name, &count, rv.data()));

    return rv;
}

std::vector<VkExtensionProperties> vksync::query_device_extensions(
    VkPhysicalDevice device,
    char const* const layer_name)
{
    uint32_t count{};
    check_result(vkEnumerateDeviceExtensionProperties(device,
        layer_name,
        &count,
        nullptr));

    std::vector<VkExtensionProperties> rv{count};
    check_result(vkEnumerateDeviceExtensionProperties(device,
        layer_name,
        &count,
        rv.data()));

    return rv;
}

std::vector<vksync::physical_device_features_t>
vksync::query_available_physical_devices(VkInstance instance)
{
    std::vector<physical_device_features_t> rv;
    for (VkPhysicalDevice device : query_physical_devices(instance))
    {
        physical_device_features_t current{.device = device,
            .extensions = query_device_extensions(device),
            .queue_families = query_queue_families(device)};

        vkGetPhysicalDeviceProperties(device, &current.properties);

        rv.emplace_back(std::move(current));
    }

    return rv;
}

bool vksync::has_extension(physical_device_features_t const& device,
    char const* const extension_name)
{
    return std::ranges::contains(device.extensions,
        std::string_view{extension_name},
        &VkExtensionProperties::extensionName);
}

std::optional<vksync::physical_device_features_t>
vksync::pick_best_physical_device(instance_t const& instance,
    std::span<char const* const> const& extensions)
{
    std::vector<physical_device_features_t> physical_devices;
    for (physical_device_features_t& device :
        query_available_physical_devices(instance))
    {
        if (std::ranges::all_of(extensions,
                [&device](char const* const name)
                { return has_extension(device, name); }))
        {
            physical_devices.emplace_back(std::move(device));
        }
    }

    auto physical_device_it{pick_device_by_type(physical_devices)};
    if (physical_device_it == std::end(physical_devices))
    {
        return std::nullopt;
    }

    return std::make_optional(std::move(*physical_device_it));
}
