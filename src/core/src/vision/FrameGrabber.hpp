#pragma once

#include "ICamera.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace sorting_arm::vision {

/**
 * Background capture into a single most-recent-frame slot.
 *
 * The capture thread overwrites the slot on every frame; frames the
 * consumer never picked up are counted as dropped.
 */
class FrameGrabber {
public:
    explicit FrameGrabber(std::unique_ptr<ICamera> camera);
    ~FrameGrabber();

    FrameGrabber(const FrameGrabber&) = delete;
    FrameGrabber& operator=(const FrameGrabber&) = delete;

    bool start(const CameraConfig& config);
    void stop();
    bool isRunning() const { return running_.load(); }

    /// Latest frame not yet returned, nullopt if none arrived since the last call. Non-blocking.
    std::optional<Frame> getFrame();

    /// Like getFrame() but waits up to @p timeoutMs for a new frame
    std::optional<Frame> waitFrame(int timeoutMs);

    uint64_t framesCaptured() const { return framesCaptured_.load(); }
    uint64_t framesDropped() const { return framesDropped_.load(); }

private:
    void captureLoop();

    std::unique_ptr<ICamera> camera_;

    std::thread captureThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopFlag_{false};

    // Latest frame slot
    std::optional<Frame> latest_;
    std::mutex slotMutex_;
    std::condition_variable slotCondition_;

    std::atomic<uint64_t> framesCaptured_{0};
    std::atomic<uint64_t> framesDropped_{0};
};

} // namespace sorting_arm::vision
