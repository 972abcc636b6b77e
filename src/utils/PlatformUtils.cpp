/**
 * PlatformUtils.cpp
 *
 * Cross-platform system utilities.
 */

#include "PlatformUtils.hpp"

#include <thread>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#else
#include <sys/sysinfo.h>
#endif

namespace interlink::utils {

int64_t PlatformUtils::getAvailableMemory() {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    GlobalMemoryStatusEx(&status);
    return static_cast<int64_t>(status.ullAvailPhys);
#elif defined(__APPLE__)
    mach_port_t host = mach_host_self();
    vm_statistics64_data_t stats;
    mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
    host_statistics64(host, HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&stats), &count);
    return static_cast<int64_t>(stats.free_count) * vm_page_size;
#else
    struct sysinfo si;
    if (sysinfo(&si) != 0) {
        return 0;
    }
    // Free plus reclaimable buffers
    return (static_cast<int64_t>(si.freeram) + static_cast<int64_t>(si.bufferram)) * si.mem_unit;
#endif
}

int PlatformUtils::getCPUCores() {
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    return cores > 0 ? cores : 1;
}

std::optional<std::string> PlatformUtils::getEnv(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) return std::string(val);
    return std::nullopt;
}

} // namespace interlink::utils
