#ifndef VKSYNC_PRIMITIVE_ERROR_INCLUDED
#define VKSYNC_PRIMITIVE_ERROR_INCLUDED

#include <vksync_external_handle_type.hpp>

#include <volk.h>

#include <optional>
#include <source_location>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

namespace vksync
{
    enum class oom_error_t
    {
        out_of_host_memory = 1,
        out_of_device_memory,
    };

    [[nodiscard]] std::error_code make_error_code(oom_error_t e);

    enum class capability_error_t
    {
        missing_instance_extension = 1,
        missing_device_extension,
        handle_type_not_supported,
        incompatible_handle_types,
    };

    [[nodiscard]] std::error_code make_error_code(capability_error_t e);

    // Detected before any native call, the caller can retry with different
    // parameters.
    struct [[nodiscard]] capability_failure_t final
    {
        capability_error_t error;

        // Name of the missing extension for the missing_* errors.
        std::string_view extension;

        std::optional<external_handle_type_t> first;
        std::optional<external_handle_type_t> second;

        [[nodiscard]] bool operator==(
            capability_failure_t const&) const = default;
    };

    [[nodiscard]] capability_failure_t missing_instance_extension(
        std::string_view extension);

    [[nodiscard]] capability_failure_t missing_device_extension(
        std::string_view extension);

    [[nodiscard]] capability_failure_t handle_type_not_supported(
        external_handle_type_t type);

    [[nodiscard]] capability_failure_t incompatible_handle_types(
        external_handle_type_t first,
        external_handle_type_t second);

    [[nodiscard]] std::error_code make_error_code(
        capability_failure_t const& failure);

    using external_primitive_error_t =
        std::variant<capability_failure_t, oom_error_t>;

    [[nodiscard]] std::error_code make_error_code(
        external_primitive_error_t const& error);

    // Only VK_ERROR_OUT_OF_HOST_MEMORY and VK_ERROR_OUT_OF_DEVICE_MEMORY
    // have a mapping.
    [[nodiscard]] constexpr std::optional<oom_error_t> classify_oom(
        VkResult const result) noexcept
    {
        switch (result)
        {
        case VK_ERROR_OUT_OF_HOST_MEMORY:
            return oom_error_t::out_of_host_memory;
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
            return oom_error_t::out_of_device_memory;
        default:
            return std::nullopt;
        }
    }

    // Any other failure from a creation call means the capability gate or
    // the driver broke its contract. That is logged and terminates.
    [[nodiscard]] oom_error_t to_oom_error(VkResult result,
        std::source_location source_location = std::source_location::current());
} // namespace vksync

template<>
struct std::is_error_code_enum<vksync::oom_error_t> : std::true_type
{
};

template<>
struct std::is_error_code_enum<vksync::capability_error_t> : std::true_type
{
};

#endif
