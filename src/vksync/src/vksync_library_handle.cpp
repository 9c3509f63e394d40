#include <vksync_library_handle.hpp>

#include <vksync_error_code.hpp>
#include <vksync_utility.hpp>

#include <spdlog/spdlog.h>

#include <volk.h>

#include <expected>

std::expected<vksync::library_handle_ptr_t, std::error_code>
vksync::initialize()
{
    if (VkResult const result{volkInitialize()}; !is_success_result(result))
    {
        spdlog::error("Vulkan loader not found: {}",
            make_error_code(result).message());
        return std::unexpected{make_error_code(result)};
    }

    spdlog::debug("Vulkan loader initialized, instance version {}.{}",
        VK_API_VERSION_MAJOR(volkGetInstanceVersion()),
        VK_API_VERSION_MINOR(volkGetInstanceVersion()));

    return library_handle_ptr_t{new library_handle_t};
}

vksync::library_handle_t::~library_handle_t() { volkFinalize(); }
