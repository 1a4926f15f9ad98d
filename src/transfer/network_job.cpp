// ============================================================================
// coalesce/transfer/network_job.cpp - Network Job Helpers
// ============================================================================

#include "coalesce/transfer/network_job.hpp"

namespace coalesce {

const char* JobPriorityToString(JobPriority priority) noexcept {
    switch (priority) {
        case JobPriority::Low:
            return "low";
        case JobPriority::Default:
            return "default";
        case JobPriority::High:
            return "high";
    }
    return "unknown";
}

}  // namespace coalesce
