#pragma once

#include <condition_variable>
#include <mutex>

#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"

namespace sloup::upload {

using u32 = sloup::core::u32;
using u64 = sloup::core::u64;

struct ConcurrencyDecision {
    u32 effective{1};
    bool limited_by_disk{false};   // max_disk_space forced fewer workers than requested
    bool below_one_segment{false}; // max_disk_space cannot hold a single segment
};

// min(requested, floor(max_disk_space / segment_size), segment_count), at
// least 1. max_disk_space == 0 means no explicit ceiling.
[[nodiscard]] ConcurrencyDecision effective_concurrency(u32 requested,
                                                        u64 max_disk_space,
                                                        u64 segment_size,
                                                        u32 segment_count) noexcept;

// Counting admission gate: one unit per segment file on local disk.
class DiskBudgetGate {
public:
    explicit DiskBudgetGate(u32 capacity) noexcept;

    DiskBudgetGate(const DiskBudgetGate&) = delete;
    DiskBudgetGate& operator=(const DiskBudgetGate&) = delete;

    // Blocks until a unit is free.
    void acquire() noexcept;

    // BudgetExhausted when nothing is held: the accounting is broken.
    [[nodiscard]] sloup::core::Status release() noexcept;

    [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
    [[nodiscard]] u32 in_use() const noexcept;
    [[nodiscard]] u32 high_water() const noexcept;

private:
    const u32 capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    u32 in_use_{0};
    u32 high_water_{0};
};

// Holds one gate unit for its lifetime.
class GatePermit {
public:
    explicit GatePermit(DiskBudgetGate& gate) noexcept;
    ~GatePermit() noexcept;

    GatePermit(const GatePermit&) = delete;
    GatePermit& operator=(const GatePermit&) = delete;

    // Gives the unit back early; later calls and the destructor are no-ops.
    [[nodiscard]] sloup::core::Status release() noexcept;

private:
    DiskBudgetGate* gate_;
};

} // namespace sloup::upload
