#include "qrfile/parallel.hpp"

#include "qrfile/env.hpp"

#include <algorithm>

namespace qrfile::parallel {

std::size_t ResolveWorkers(std::size_t requested, std::size_t task_count) {
    std::size_t limit = std::max<std::size_t>(1, task_count);
    if (requested > 0) {
        return std::min(requested, limit);
    }
    if (auto configured = env::GetSize("QRFILE_WORKERS")) {
        return std::min(*configured, limit);
    }
    unsigned int hw = std::thread::hardware_concurrency();
    std::size_t workers = hw > 0 ? static_cast<std::size_t>(hw) : 1;
    return std::min(workers, limit);
}

}  // namespace qrfile::parallel
