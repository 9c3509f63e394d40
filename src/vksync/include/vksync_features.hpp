#ifndef VKSYNC_FEATURES_INCLUDED
#define VKSYNC_FEATURES_INCLUDED

#include <volk.h>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vksync
{
    struct instance_t;
} // namespace vksync

namespace vksync
{
    [[nodiscard]] std::vector<VkLayerProperties> query_instance_layers();

    [[nodiscard]] std::vector<VkExtensionProperties> query_instance_extensions(
        char const* layer_name = nullptr);

    [[nodiscard]] std::vector<VkExtensionProperties> query_device_extensions(
        VkPhysicalDevice device,
        char const* layer_name = nullptr);

    struct [[nodiscard]] queue_family_t final
    {
        uint32_t index;
        VkQueueFamilyProperties properties;
    };

    struct [[nodiscard]] physical_device_features_t final
    {
        VkPhysicalDevice device;
        VkPhysicalDeviceProperties properties;
        std::vector<VkExtensionProperties> extensions;
        std::vector<queue_family_t> queue_families;
    };

    [[nodiscard]] std::vector<physical_device_features_t>
    query_available_physical_devices(VkInstance instance);

    [[nodiscard]] bool has_extension(physical_device_features_t const& device,
        char const* extension_name);

    [[nodiscard]] std::optional<physical_device_features_t>
    pick_best_physical_device(instance_t const& instance,
        std::span<char const* const> const& extensions);
} // namespace vksync

#endif
