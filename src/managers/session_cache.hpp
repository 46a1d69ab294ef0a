#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// Outcome of a liveness probe on a cached handle.
struct ProbeResult {
    enum class Status { Alive, Dead };

    Status status;
    std::string reason;  // why the handle is considered dead

    static ProbeResult Alive() { return {Status::Alive, ""}; }
    static ProbeResult Dead(const std::string& why) { return {Status::Dead, why}; }

    bool alive() const { return status == Status::Alive; }
};

// Address -> live TransportHandle. Owned by the caller's top-level context
// and injected wherever connections are needed.
//
// acquire() reuses a cached handle only after a cheap probe (`pwd`) succeeds.
// A failed probe evicts the handle before a reconnect is attempted, so an
// address never has two live handles. Each address has its own slot lock:
// concurrent acquire() calls for one address serialize, and the ones that
// wait reuse whatever handle the first one left in the slot.
class SessionCache {
public:
    SessionCache(TransportFactory& factory, std::string remote_home,
                 int probe_timeout_ms, StatusCallback callback = nullptr);
    ~SessionCache();

    SessionCache(const SessionCache&) = delete;
    SessionCache& operator=(const SessionCache&) = delete;

    Result<std::shared_ptr<TransportHandle>> acquire(const std::string& address);

    // Run the liveness probe against a handle
    ProbeResult probe(TransportHandle& handle) const;

    // Close (best-effort) and forget the handle for address
    void evict(const std::string& address);

    bool contains(const std::string& address) const;
    size_t size() const;

    // Addresses with bookkeeping (a handle, or an acquire() in progress)
    size_t slot_count() const;

    // Close every cached handle
    void clear();

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<TransportHandle> handle;
    };

    TransportFactory& factory_;
    std::string remote_home_;
    int probe_timeout_ms_;
    StatusCallback callback_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> slot_for(const std::string& address);
    std::shared_ptr<Slot> find_slot(const std::string& address) const;

    // Forget an empty slot nobody else holds; caller holds slot->mutex
    void drop_slot_if_unused(const std::string& address, const std::shared_ptr<Slot>& slot);

    // Build, prepare and return a new handle; nothing is cached on failure
    Result<std::shared_ptr<TransportHandle>> reconnect(const std::string& address);

    void status(const std::string& msg) const;
};
