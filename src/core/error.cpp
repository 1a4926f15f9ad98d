// ============================================================================
// coalesce/core/error.cpp - Error Category Implementation
// ============================================================================

#include "coalesce/core/error.hpp"

#include <string>

namespace coalesce {

namespace {

class CoalesceCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "coalesce"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::JobFailed:
                return "Network job failed";
            case Errc::Cancelled:
                return "Callback cancelled";
            case Errc::InvalidKey:
                return "Invalid resource key";
            case Errc::JobCreationFailed:
                return "Failed to create network job";
            case Errc::InvalidResponse:
                return "Response rejected by validator";
            case Errc::NoResponse:
                return "Job finished without a response";
            case Errc::Shutdown:
                return "Downloader is shutting down";
            default:
                return "Unknown coalesce error";
        }
    }
};

}  // namespace

const std::error_category& CoalesceCategory() noexcept {
    static const CoalesceCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), CoalesceCategory()};
}

}  // namespace coalesce
