/**
 * @file frame_scheduler.hpp
 * @brief Single-threaded frame callback scheduling
 *
 * The host event loop owns the schedule; the simulator only requests the
 * next frame and cancels it when stopped.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

using FrameHandle = std::uint64_t;

/**
 * @class IFrameScheduler
 * @brief Host-side source of animation frames
 */
class IFrameScheduler {
public:
    using FrameCallback = std::function<void(double timestampMs)>;

    virtual ~IFrameScheduler() = default;

    /**
     * @brief Runs the callback once, on the next frame
     * @return Handle usable with cancelFrame()
     */
    virtual FrameHandle requestFrame(FrameCallback callback) = 0;

    /**
     * @brief Drops a pending callback; unknown handles are ignored
     */
    virtual void cancelFrame(FrameHandle handle) = 0;
};

/**
 * @class FrameQueue
 * @brief Scheduler driven by explicit runFrame() calls from the host loop
 *
 * Callbacks requested while a frame is running are deferred to the next
 * runFrame() call.
 */
class FrameQueue : public IFrameScheduler {
public:
    FrameHandle requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameHandle handle) override;

    /**
     * @brief Runs every callback that was pending when the call started
     * @param timestampMs Frame timestamp handed to the callbacks
     * @return Number of callbacks run
     */
    std::size_t runFrame(double timestampMs);

    std::size_t pendingCount() const { return pending.size(); }

private:
    std::map<FrameHandle, FrameCallback> pending;
    FrameHandle nextHandle = 1;
};
