#include <vksync_primitive_error.hpp>

#include <vksync_error_code.hpp>

#include <spdlog/spdlog.h>

#include <cassert>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <variant>

// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <spdlog/common.h>

namespace
{
    struct [[nodiscard]] oom_error_category_t final : std::error_category
    {
        [[nodiscard]] char const* name() const noexcept override
        {
            return "vksync.oom";
        }

        [[nodiscard]] std::string message(int const condition) const override
        {
            switch (static_cast<vksync::oom_error_t>(condition))
            {
            case vksync::oom_error_t::out_of_host_memory:
                return "out of host memory";
            case vksync::oom_error_t::out_of_device_memory:
                return "out of device memory";
            default:
                assert(false);
                return "unrecognized out of memory error";
            }
        }
    };

    struct [[nodiscard]] capability_error_category_t final
        : std::error_category
    {
        [[nodiscard]] char const* name() const noexcept override
        {
            return "vksync.capability";
        }

        [[nodiscard]] std::string message(int const condition) const override
        {
            switch (static_cast<vksync::capability_error_t>(condition))
            {
            case vksync::capability_error_t::missing_instance_extension:
                return "instance extension not enabled";
            case vksync::capability_error_t::missing_device_extension:
                return "device extension not enabled";
            case vksync::capability_error_t::handle_type_not_supported:
                return "requested handle type not supported by the "
                       "implementation";
            case vksync::capability_error_t::incompatible_handle_types:
                return "requested handle types are not compatible";
            default:
                assert(false);
                return "unrecognized capability error";
            }
        }
    };

    oom_error_category_t const oom_category{};

    capability_error_category_t const capability_category{};
} // namespace

std::error_code vksync::make_error_code(oom_error_t const e)
{
    return {static_cast<int>(e), oom_category};
}

std::error_code vksync::make_error_code(capability_error_t const e)
{
    return {static_cast<int>(e), capability_category};
}

vksync::capability_failure_t vksync::missing_instance_extension(
    std::string_view const extension)
{
    return {.error = capability_error_t::missing_instance_extension,
        .extension = extension};
}

vksync::capability_failure_t vksync::missing_device_extension(
    std::string_view const extension)
{
    return {.error = capability_error_t::missing_device_extension,
        .extension = extension};
}

vksync::capability_failure_t vksync::handle_type_not_supported(
    external_handle_type_t const type)
{
    return {.error = capability_error_t::handle_type_not_supported,
        .first = type};
}

vksync::capability_failure_t vksync::incompatible_handle_types(
    external_handle_type_t const first,
    external_handle_type_t const second)
{
    return {.error = capability_error_t::incompatible_handle_types,
        .first = first,
        .second = second};
}

std::error_code vksync::make_error_code(capability_failure_t const& failure)
{
    return make_error_code(failure.error);
}

std::error_code vksync::make_error_code(
    external_primitive_error_t const& error)
{
    return std::visit([](auto const& e) { return make_error_code(e); },
        error);
}

vksync::oom_error_t vksync::to_oom_error(VkResult const result,
    std::source_location const source_location)
{
    if (std::optional<oom_error_t> const rv{classify_oom(result)})
    {
        return *rv;
    }

    spdlog::critical(
        "Unexpected VkResult = {} ({}) from primitive creation. {}:{}",
        std::to_underlying(result),
        make_error_code(result).message(),
        source_location.file_name(),
        source_location.line());
    std::terminate();
}
