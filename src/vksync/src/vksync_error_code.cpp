#include <vksync_error_code.hpp>

#include <string>
#include <system_error>

namespace
{
    struct [[nodiscard]] vulkan_error_category_t final : std::error_category
    {
        [[nodiscard]] char const* name() const noexcept override;

        [[nodiscard]] std::string message(int value) const override;
    };

    char const* vulkan_error_category_t::name() const noexcept
    {
        return "Vulkan";
    }

    std::string vulkan_error_category_t::message(int const value) const
    {
        // clang-format off
        switch (static_cast<VkResult>(value))
        {
        case VK_SUCCESS:
            return "Command successfully completed";
        case VK_NOT_READY:
            return "A fence or query has not yet completed";
        case VK_TIMEOUT:
            return "A wait operation has not completed in the specified time";
        case VK_EVENT_SET:
            return "An event is signaled";
        case VK_EVENT_RESET:
            return "An event is unsignaled";
        case VK_INCOMPLETE:
            return "A return array was too small for the result";
        case VK_ERROR_OUT_OF_HOST_MEMORY:
            return "A host memory allocation has failed";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
            return "A device memory allocation has failed";
        case VK_ERROR_INITIALIZATION_FAILED:
            return "Initialization of an object could not be completed for implementation-specific reason";
        case VK_ERROR_DEVICE_LOST:
            return "The logical or physical device has been lost";
        case VK_ERROR_LAYER_NOT_PRESENT:
            return "A requested layer is not present or could not be loaded";
        case VK_ERROR_EXTENSION_NOT_PRESENT:
            return "A requested extension is not supported";
        case VK_ERROR_FEATURE_NOT_PRESENT:
            return "A requested feature is not supported";
        case VK_ERROR_INCOMPATIBLE_DRIVER:
            return "The requested version of Vulkan is not supported by the driver or is otherwise incompatible for implementation-specific reasons";
        case VK_ERROR_TOO_MANY_OBJECTS:
            return "Too many objects of the type have already been created";
        case VK_ERROR_UNKNOWN:
            return "An unknown error has occurred";
        case VK_ERROR_INVALID_EXTERNAL_HANDLE:
            return "An external handle is not a valid handle of the specified type";
        case VK_ERROR_NOT_PERMITTED:
            return "The driver implementation has denied a request to acquire a priority above the default priority";
        case VK_ERROR_VALIDATION_FAILED_EXT:
            return "A command failed because invalid usage was detected by the implementation or a validation layer";
        default:
            return "(unrecognized error)";
        }
        // clang-format on
    }

    vulkan_error_category_t const vulkan_error_category{};
} // namespace

std::error_code vksync::make_error_code(VkResult result)
{
    return {static_cast<int>(result), vulkan_error_category};
}
