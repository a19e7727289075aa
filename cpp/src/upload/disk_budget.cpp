#include "sloup/upload/disk_budget.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace sloup::upload {

using namespace sloup::core;

ConcurrencyDecision effective_concurrency(u32 requested, u64 max_disk_space, u64 segment_size,
                                          u32 segment_count) noexcept {
    ConcurrencyDecision d{};
    u64 n = requested;

    if (max_disk_space > 0 && segment_size > 0) {
        const u64 fits = max_disk_space / segment_size;
        if (fits == 0) {
            d.below_one_segment = true;
        }
        if (fits < n) {
            n = fits;
            d.limited_by_disk = true;
        }
    }

    if (segment_count > 0) {
        n = std::min<u64>(n, segment_count);
    }
    d.effective = static_cast<u32>(std::max<u64>(n, 1));
    return d;
}

// ========================================================================
// DiskBudgetGate
// ========================================================================

DiskBudgetGate::DiskBudgetGate(u32 capacity) noexcept : capacity_(capacity == 0 ? 1 : capacity) {}

void DiskBudgetGate::acquire() noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
    high_water_ = std::max(high_water_, in_use_);
}

Status DiskBudgetGate::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ == 0) {
            spdlog::critical("disk budget released with no unit held (capacity {})", capacity_);
            return make_status(StatusDomain::Budget, StatusCode::BudgetExhausted);
        }
        --in_use_;
    }
    cv_.notify_one();
    return ok_status();
}

u32 DiskBudgetGate::in_use() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

u32 DiskBudgetGate::high_water() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_;
}

// ========================================================================
// GatePermit
// ========================================================================

GatePermit::GatePermit(DiskBudgetGate& gate) noexcept : gate_(&gate) {
    gate_->acquire();
}

GatePermit::~GatePermit() noexcept {
    if (gate_ != nullptr) {
        const Status s = gate_->release();
        if (!is_ok(s)) {
            spdlog::critical("disk budget permit could not be returned");
        }
    }
}

Status GatePermit::release() noexcept {
    if (gate_ == nullptr) {
        return ok_status();
    }
    DiskBudgetGate* gate = gate_;
    gate_ = nullptr;
    return gate->release();
}

} // namespace sloup::upload
