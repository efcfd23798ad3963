#pragma once
#include "errors.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mtsatori {

// In-flight requests keyed by correlation id. A caller opens a slot, hands
// the id to the transport, then blocks in wait(); the transport thread
// resolves or rejects the slot when the response arrives. Late responses for
// slots that already timed out are discarded.
template<typename T>
class PendingTable {
public:
    // Throws BridgeError once the table has been closed by reject_all().
    uint64_t open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) throw BridgeError(closed_kind_, closed_reason_);
        uint64_t id = next_id_++;
        slots_[id];
        return id;
    }

    // Returns false when no slot with that id is waiting.
    bool resolve(uint64_t id, T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end() || it->second.done) return false;
            it->second.value = std::move(value);
            it->second.done = true;
        }
        cv_.notify_all();
        return true;
    }

    bool reject(uint64_t id, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end() || it->second.done) return false;
            it->second.error = std::move(error);
            it->second.done = true;
        }
        cv_.notify_all();
        return true;
    }

    // Block until the slot completes. Rethrows the stored error; a timeout
    // abandons the slot and throws BridgeError(TransientTransportError).
    T wait(uint64_t id, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            throw BridgeError(ErrorKind::InternalError,
                              "unknown request id " + std::to_string(id));
        }
        bool done = cv_.wait_for(lock, timeout, [&] {
            auto cur = slots_.find(id);
            return cur == slots_.end() || cur->second.done;
        });
        auto cur = slots_.find(id);
        if (!done || cur == slots_.end()) {
            if (cur != slots_.end()) slots_.erase(cur);
            throw BridgeError(ErrorKind::TransientTransportError,
                              "request " + std::to_string(id) + " timed out");
        }
        Slot slot = std::move(cur->second);
        slots_.erase(cur);
        lock.unlock();

        if (slot.error) std::rethrow_exception(slot.error);
        return std::move(*slot.value);
    }

    // Fail every open slot with kind and refuse new ones.
    void reject_all(ErrorKind kind, const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            closed_kind_ = kind;
            closed_reason_ = reason;
            for (auto& [id, slot] : slots_) {
                if (slot.done) continue;
                slot.error = std::make_exception_ptr(BridgeError(kind, reason));
                slot.done = true;
            }
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    struct Slot {
        bool done = false;
        std::optional<T> value;
        std::exception_ptr error;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<uint64_t, Slot> slots_;
    uint64_t next_id_ = 1;
    bool closed_ = false;
    ErrorKind closed_kind_ = ErrorKind::SessionTerminated;
    std::string closed_reason_;
};

} // namespace mtsatori
