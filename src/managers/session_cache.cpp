#include "session_cache.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <vector>

// Cleanup must never mask the outcome of whatever triggered it
static void close_quietly(TransportHandle& handle) {
    try {
        handle.close();
    } catch (const std::exception& e) {
        brickdev_log(fmt::format("cache: close of {} failed: {}", handle.address(), e.what()));
    }
}

SessionCache::SessionCache(TransportFactory& factory, std::string remote_home,
                           int probe_timeout_ms, StatusCallback callback)
    : factory_(factory), remote_home_(std::move(remote_home)),
      probe_timeout_ms_(probe_timeout_ms), callback_(std::move(callback)) {
}

SessionCache::~SessionCache() {
    clear();
}

void SessionCache::status(const std::string& msg) const {
    if (callback_) callback_(msg);
}

std::shared_ptr<SessionCache::Slot> SessionCache::slot_for(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[address];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

std::shared_ptr<SessionCache::Slot> SessionCache::find_slot(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(address);
    return it == slots_.end() ? nullptr : it->second;
}

void SessionCache::drop_slot_if_unused(const std::string& address,
                                       const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(address);
    if (it == slots_.end() || it->second != slot || slot->handle) return;
    // References are only handed out under mutex_: the map's and the caller's
    // mean no acquire() is waiting on this slot
    if (slot.use_count() > 2) return;
    slots_.erase(it);
}

ProbeResult SessionCache::probe(TransportHandle& handle) const {
    if (!handle.is_open()) {
        return ProbeResult::Dead("connection is closed");
    }

    auto r = handle.run(PROBE_COMMAND, probe_timeout_ms_);
    if (r.failed()) {
        std::string why = r.stderr_data.empty()
            ? fmt::format("probe exited with {}", r.exit_code)
            : r.stderr_data;
        return ProbeResult::Dead(why);
    }
    return ProbeResult::Alive();
}

Result<std::shared_ptr<TransportHandle>> SessionCache::acquire(const std::string& address) {
    auto slot = slot_for(address);

    // Held across probe and reconnect: one attempt per address at a time
    std::lock_guard<std::mutex> lock(slot->mutex);

    if (slot->handle) {
        auto alive = probe(*slot->handle);
        if (alive.alive()) {
            status("Re-using existing connection to " + address);
            return Result<std::shared_ptr<TransportHandle>>::Ok(slot->handle);
        }

        // Stale: drop it before building the replacement
        brickdev_log(fmt::format("cache: {} handle for {}: {}",
                                 error_kind_name(ErrorKind::StaleHandle), address, alive.reason));
        close_quietly(*slot->handle);
        slot->handle.reset();
    }

    auto fresh = reconnect(address);
    if (fresh.is_ok()) {
        slot->handle = fresh.value;
    } else {
        drop_slot_if_unused(address, slot);
    }
    return fresh;
}

Result<std::shared_ptr<TransportHandle>> SessionCache::reconnect(const std::string& address) {
    using R = Result<std::shared_ptr<TransportHandle>>;

    status("Connecting to " + address + "...");
    auto connected = factory_.connect(address);
    if (connected.is_err()) {
        return R::Err(ErrorKind::Connection, connected.error);
    }
    auto handle = connected.value;

    auto channel = handle->open_file_channel();
    if (channel.is_err()) {
        close_quietly(*handle);
        return R::Err(ErrorKind::Connection, "Failed to open file transfer channel: " + channel.error);
    }

    auto cd = channel.value->chdir(remote_home_);
    if (cd.is_err()) {
        close_quietly(*handle);
        return R::Err(ErrorKind::Connection,
                      fmt::format("Failed to enter {} on {}: {}", remote_home_, address, cd.error));
    }

    status("Connected to " + address);
    brickdev_log(fmt::format("cache: new handle for {} (home {})", address, remote_home_));
    return R::Ok(handle);
}

void SessionCache::evict(const std::string& address) {
    auto slot = find_slot(address);
    if (!slot) return;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->handle) {
        close_quietly(*slot->handle);
        slot->handle.reset();
        brickdev_log("cache: evicted " + address);
    }
    drop_slot_if_unused(address, slot);
}

size_t SessionCache::slot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool SessionCache::contains(const std::string& address) const {
    auto slot = find_slot(address);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->handle != nullptr;
}

size_t SessionCache::size() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : slots_) slots.push_back(kv.second);
    }

    size_t live = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->handle) live++;
    }
    return live;
}

void SessionCache::clear() {
    std::vector<std::string> addresses;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : slots_) addresses.push_back(kv.first);
    }
    for (const auto& address : addresses) {
        evict(address);
    }
}
