#include <vksync_capability_gate.hpp>

#include <vksync_capabilities.hpp>
#include <vksync_device.hpp>

#include <volk.h>

#include <iterator>
#include <string_view>

namespace
{
    struct [[nodiscard]] kind_extensions_t final
    {
        std::string_view instance_capabilities;
        std::string_view device_extension;
    };

    [[nodiscard]] constexpr kind_extensions_t extensions_for(
        vksync::primitive_kind_t const kind)
    {
        if (kind == vksync::primitive_kind_t::fence)
        {
            return {VK_KHR_EXTERNAL_FENCE_CAPABILITIES_EXTENSION_NAME,
                VK_KHR_EXTERNAL_FENCE_EXTENSION_NAME};
        }

        return {VK_KHR_EXTERNAL_SEMAPHORE_CAPABILITIES_EXTENSION_NAME,
            VK_KHR_EXTERNAL_SEMAPHORE_EXTENSION_NAME};
    }

    [[nodiscard]] bool compatible(
        vksync::external_primitive_capabilities_t const& capabilities,
        vksync::external_handle_type_t const first,
        vksync::external_handle_type_t const second)
    {
        return capabilities.properties(first).compatible_handle_types.contains(
            second);
    }
} // namespace

std::expected<void, vksync::capability_failure_t> vksync::check_exportable(
    capability_table_t const& capabilities,
    primitive_kind_t const kind,
    external_handle_types_t const& handle_types)
{
    kind_extensions_t const names{extensions_for(kind)};

    if (!capabilities.get_physical_device_properties2)
    {
        return std::unexpected{missing_instance_extension(
            VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME)};
    }

    external_primitive_capabilities_t const* const primitive{
        capabilities.find(kind)};
    if (primitive == nullptr)
    {
        // Events have no external handle support at all.
        if (handle_types.empty())
        {
            return {};
        }
        return std::unexpected{handle_type_not_supported(*handle_types.begin())};
    }

    if (!primitive->instance_capabilities)
    {
        return std::unexpected{
            missing_instance_extension(names.instance_capabilities)};
    }

    if (!primitive->device_extension)
    {
        return std::unexpected{
            missing_device_extension(names.device_extension)};
    }

    for (external_handle_type_t const type : handle_types)
    {
        if (!primitive->properties(type).exportable)
        {
            return std::unexpected{handle_type_not_supported(type)};
        }
    }

    // Compatibility isn't transitive, every pair has to be checked.
    for (auto first{std::cbegin(handle_types)}; first != std::cend(handle_types);
         ++first)
    {
        for (auto second{std::next(first)}; second != std::cend(handle_types);
             ++second)
        {
            if (!compatible(*primitive, *first, *second) ||
                !compatible(*primitive, *second, *first))
            {
                return std::unexpected{
                    incompatible_handle_types(*first, *second)};
            }
        }
    }

    return {};
}

std::expected<void, vksync::capability_failure_t> vksync::check_exportable(
    device_t const& device,
    primitive_kind_t const kind,
    external_handle_types_t const& handle_types)
{
    return check_exportable(device.capabilities, kind, handle_types);
}
