#ifndef VKSYNC_TEST_GLOBAL_LIBRARY_HANDLE_INCLUDED
#define VKSYNC_TEST_GLOBAL_LIBRARY_HANDLE_INCLUDED

#include <vksync_device.hpp>
#include <vksync_instance.hpp>
#include <vksync_library_handle.hpp>

namespace test
{
    // Null when no Vulkan implementation is available, tests that need one
    // are skipped.
    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    extern vksync::library_handle_ptr_t library;
    extern vksync::instance_ptr_t instance;
    extern vksync::device_ptr_t minimal_device;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace test

#endif
