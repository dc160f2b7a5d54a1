/**
 * @file os_interface.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <dlfcn.h>
#include <stdio.h>
#include <string.h>

#include <string>

#include <real_time_tools/iostream.hpp>

/**
 * @brief Create a common type_def to wrap xenomai and posix.
 */
#ifndef rt_printf
#define rt_printf printf
#endif
/**
 * @brief Create a common type_def to wrap xenomai and posix.
 */
#ifndef rt_fprintf
#define rt_fprintf fprintf
#endif

/**
 * @brief osi stands for Operating System Interface. It gathers the few
 * system calls needed to reach a vendor library at run time.
 */
namespace osi
{
/**
 * @brief Handle on a dynamic library opened with open_library().
 */
typedef void* LibraryHandle;

/**
 * @brief Load a dynamic library.
 *
 * @param path is either a file name searched in the default library paths
 * or a full path.
 * @return LibraryHandle the handle or nullptr upon failure, in which case
 * last_library_error() tells why.
 */
inline LibraryHandle open_library(const std::string& path)
{
    return dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
}

/**
 * @brief Get the reason of the last failed dynamic library call.
 *
 * @return std::string empty if there was no error.
 */
inline std::string last_library_error()
{
    const char* message = dlerror();
    return message == nullptr ? std::string() : std::string(message);
}

/**
 * @brief Look up a function exported by a loaded library.
 *
 * @tparam FunctionPointer is the function pointer type of the symbol.
 * @param handle is a handle returned by open_library().
 * @param name is the exported C name.
 * @return FunctionPointer nullptr if the library does not export the name.
 */
template <typename FunctionPointer>
FunctionPointer resolve_symbol(LibraryHandle handle, const char* name)
{
    // clear a pending error so that a null symbol can be told apart
    dlerror();
    void* symbol = dlsym(handle, name);
    return reinterpret_cast<FunctionPointer>(symbol);
}

/**
 * @brief Release a library handle. Failures are reported but not fatal.
 *
 * @param handle
 */
inline void close_library(LibraryHandle handle)
{
    if (handle == nullptr)
    {
        return;
    }
    int ret = dlclose(handle);
    if (ret != 0)
    {
        rt_fprintf(stderr, "dlclose: %s\n", last_library_error().c_str());
    }
}

}  // namespace osi
