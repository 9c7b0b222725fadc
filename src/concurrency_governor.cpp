#include "mediaxfer/transfer/concurrency_governor.hpp"
#include "mediaxfer/core/log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

namespace mediaxfer {

const char* resource_class_name(ResourceClass cls) {
    switch (cls) {
        case ResourceClass::Upload: return "upload";
        case ResourceClass::Download: return "download";
        case ResourceClass::Head: return "head";
        case ResourceClass::Delete: return "delete";
        case ResourceClass::MetadataQuery: return "metadata_query";
    }
    return "unknown";
}

size_t GovernorLimits::get(ResourceClass cls) const {
    switch (cls) {
        case ResourceClass::Upload: return upload;
        case ResourceClass::Download: return download;
        case ResourceClass::Head: return head;
        case ResourceClass::Delete: return remove;
        case ResourceClass::MetadataQuery: return metadata_query;
    }
    return 0;
}

void GovernorLimits::set(ResourceClass cls, size_t value) {
    switch (cls) {
        case ResourceClass::Upload: upload = value; break;
        case ResourceClass::Download: download = value; break;
        case ResourceClass::Head: head = value; break;
        case ResourceClass::Delete: remove = value; break;
        case ResourceClass::MetadataQuery: metadata_query = value; break;
    }
}

// cgroup v2 cpu.max holds "<quota> <period>" or "max <period>"
static std::optional<size_t> read_cpu_quota(const std::string& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;

    std::string quota_str, period_str;
    if (!(file >> quota_str)) return std::nullopt;
    if (quota_str == "max") return std::nullopt;
    file >> period_str;

    long long quota = 0;
    long long period = 100000;
    try {
        quota = std::stoll(quota_str);
        if (!period_str.empty()) {
            period = std::stoll(period_str);
        }
    } catch (const std::logic_error&) {
        log_debug("ignoring unparseable %s", path.c_str());
        return std::nullopt;
    }
    if (quota <= 0 || period <= 0) return std::nullopt;
    return std::max<size_t>(1, static_cast<size_t>(quota / period));
}

size_t detect_available_parallelism(const std::string& cpu_max_path) {
    if (auto quota = read_cpu_quota(cpu_max_path)) {
        return *quota;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : constants::FALLBACK_CPU_COUNT;
}

size_t default_limit(ResourceClass cls, size_t cores) {
    cores = std::max<size_t>(1, cores);
    if (cls == ResourceClass::MetadataQuery) {
        return std::max(constants::MIN_METADATA_CONCURRENCY, cores);
    }
    return std::max(constants::MIN_IO_CONCURRENCY, cores * 2);
}

// ============================================================================
// ConcurrencyGovernor
// ============================================================================

ConcurrencyGovernor::ConcurrencyGovernor(const GovernorLimits& limits)
    : ConcurrencyGovernor(limits, detect_available_parallelism()) {}

ConcurrencyGovernor::ConcurrencyGovernor(const GovernorLimits& limits, size_t cores)
    : cores_(cores) {
    for (size_t i = 0; i < RESOURCE_CLASS_COUNT; ++i) {
        auto cls = static_cast<ResourceClass>(i);
        size_t configured = limits.get(cls);
        slots_[i].capacity = configured > 0 ? configured : default_limit(cls, cores);
    }
}

ConcurrencyGovernor::Permit ConcurrencyGovernor::acquire(ResourceClass cls) {
    Slot& s = slot(cls);
    std::unique_lock<std::mutex> lock(s.mutex);

    uint64_t ticket = s.next_ticket++;
    s.waiting.push_back(ticket);
    s.cv.wait(lock, [&s, ticket] {
        return s.in_flight < s.capacity && s.waiting.front() == ticket;
    });
    s.waiting.pop_front();
    ++s.in_flight;
    ++s.admitted;

    // The next ticket may also fit
    if (!s.waiting.empty() && s.in_flight < s.capacity) {
        s.cv.notify_all();
    }
    return Permit(this, cls);
}

std::optional<ConcurrencyGovernor::Permit> ConcurrencyGovernor::try_acquire(ResourceClass cls) {
    Slot& s = slot(cls);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.waiting.empty() || s.in_flight >= s.capacity) {
        return std::nullopt;
    }
    ++s.in_flight;
    ++s.admitted;
    return Permit(this, cls);
}

void ConcurrencyGovernor::release(ResourceClass cls) {
    Slot& s = slot(cls);
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        --s.in_flight;
    }
    // Waiters check their own ticket, so wake them all
    s.cv.notify_all();
}

void ConcurrencyGovernor::Permit::release() {
    if (governor_) {
        governor_->release(cls_);
        governor_ = nullptr;
    }
}

ConcurrencyGovernor::ClassStats ConcurrencyGovernor::stats(ResourceClass cls) const {
    const Slot& s = slot(cls);
    std::lock_guard<std::mutex> lock(s.mutex);
    ClassStats out;
    out.capacity = s.capacity;
    out.in_flight = s.in_flight;
    out.waiting = s.waiting.size();
    out.admitted = s.admitted;
    return out;
}

void ConcurrencyGovernor::log_configuration() const {
    std::ostringstream limits;
    for (size_t i = 0; i < RESOURCE_CLASS_COUNT; ++i) {
        auto cls = static_cast<ResourceClass>(i);
        if (i > 0) limits << ", ";
        limits << resource_class_name(cls) << "=" << capacity(cls);
    }
    log_info("Concurrency: effective cores %zu, limits %s", cores_, limits.str().c_str());
}

} // namespace mediaxfer
