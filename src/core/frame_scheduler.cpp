#include "astrofield/core/frame_scheduler.hpp"

#include <utility>
#include <vector>

FrameHandle FrameQueue::requestFrame(FrameCallback callback) {
    FrameHandle const handle = nextHandle++;
    pending.emplace(handle, std::move(callback));
    return handle;
}

void FrameQueue::cancelFrame(FrameHandle handle) {
    pending.erase(handle);
}

std::size_t FrameQueue::runFrame(double timestampMs) {
    std::vector<FrameHandle> due;
    due.reserve(pending.size());
    for (const auto &entry : pending) {
        due.push_back(entry.first);
    }

    std::size_t ran = 0;
    for (FrameHandle handle : due) {
        // An earlier callback may have cancelled this one
        auto it = pending.find(handle);
        if (it == pending.end()) {
            continue;
        }
        FrameCallback callback = std::move(it->second);
        pending.erase(it);
        callback(timestampMs);
        ++ran;
    }
    return ran;
}
