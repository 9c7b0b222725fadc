#pragma once

#include "mediaxfer/core/constants.hpp"

#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mediaxfer {

// Independent admission classes; each has its own slot count.
enum class ResourceClass {
    Upload,
    Download,
    Head,
    Delete,
    MetadataQuery
};

constexpr size_t RESOURCE_CLASS_COUNT = 5;

const char* resource_class_name(ResourceClass cls);

/// Per-class slot counts. 0 means "use the computed default".
struct GovernorLimits {
    size_t upload = 0;
    size_t download = 0;
    size_t head = 0;
    size_t remove = 0;
    size_t metadata_query = 0;

    size_t get(ResourceClass cls) const;
    void set(ResourceClass cls, size_t value);
};

/// Effective cores: the cgroup v2 cpu.max quota when one is set, otherwise
/// std::thread::hardware_concurrency() (FALLBACK_CPU_COUNT if unknown).
size_t detect_available_parallelism(const std::string& cpu_max_path = constants::CGROUP_CPU_MAX_PATH);

/// Network classes get max(4, 2 * cores); MetadataQuery gets max(2, cores).
size_t default_limit(ResourceClass cls, size_t cores);

/// Counting-semaphore admission control, one semaphore per ResourceClass.
///
/// acquire() blocks on a condition variable until a slot is free. Waiters
/// are admitted in arrival order within a class (ticket queue). The
/// returned Permit releases its slot when destroyed, so every exit path of
/// the guarded operation gives the slot back.
///
/// The governor must outlive every Permit it hands out.
class ConcurrencyGovernor {
public:
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept
            : governor_(other.governor_), cls_(other.cls_) {
            other.governor_ = nullptr;
        }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                governor_ = other.governor_;
                cls_ = other.cls_;
                other.governor_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        /// Give the slot back early. Safe to call more than once.
        void release();

        bool held() const { return governor_ != nullptr; }
        ResourceClass resource_class() const { return cls_; }

    private:
        friend class ConcurrencyGovernor;
        Permit(ConcurrencyGovernor* governor, ResourceClass cls)
            : governor_(governor), cls_(cls) {}

        ConcurrencyGovernor* governor_ = nullptr;
        ResourceClass cls_ = ResourceClass::Upload;
    };

    /// Unset limits are computed from detect_available_parallelism().
    explicit ConcurrencyGovernor(const GovernorLimits& limits = {});
    /// Same, with an explicit core count for the computed defaults.
    ConcurrencyGovernor(const GovernorLimits& limits, size_t cores);

    ConcurrencyGovernor(const ConcurrencyGovernor&) = delete;
    ConcurrencyGovernor& operator=(const ConcurrencyGovernor&) = delete;

    /// Block until a slot for cls is free.
    Permit acquire(ResourceClass cls);

    /// Take a slot only if one is free and nobody is queued ahead.
    std::optional<Permit> try_acquire(ResourceClass cls);

    struct ClassStats {
        size_t capacity = 0;
        size_t in_flight = 0;
        size_t waiting = 0;
        uint64_t admitted = 0;
    };
    ClassStats stats(ResourceClass cls) const;

    size_t capacity(ResourceClass cls) const { return stats(cls).capacity; }

    /// Log effective cores and per-class limits at info level.
    void log_configuration() const;

private:
    void release(ResourceClass cls);

    struct Slot {
        mutable std::mutex mutex;
        std::condition_variable cv;
        size_t capacity = 1;
        size_t in_flight = 0;
        std::deque<uint64_t> waiting;  // tickets in arrival order
        uint64_t next_ticket = 0;
        uint64_t admitted = 0;
    };

    Slot& slot(ResourceClass cls) { return slots_[static_cast<size_t>(cls)]; }
    const Slot& slot(ResourceClass cls) const { return slots_[static_cast<size_t>(cls)]; }

    std::array<Slot, RESOURCE_CLASS_COUNT> slots_;
    size_t cores_ = 0;
};

} // namespace mediaxfer
