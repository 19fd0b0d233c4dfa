#include "FrameGrabber.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace sorting_arm::vision {

FrameGrabber::FrameGrabber(std::unique_ptr<ICamera> camera)
    : camera_(std::move(camera)) {
}

FrameGrabber::~FrameGrabber() {
    stop();
}

bool FrameGrabber::start(const CameraConfig& config) {
    if (running_.load()) {
        return true;
    }
    if (!camera_) {
        spdlog::error("FrameGrabber: no camera");
        return false;
    }
    if (!camera_->isOpen() && !camera_->open(config)) {
        spdlog::error("FrameGrabber: failed to open {}", camera_->name());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        latest_.reset();
    }
    stopFlag_.store(false);
    running_.store(true);
    captureThread_ = std::thread(&FrameGrabber::captureLoop, this);

    spdlog::info("FrameGrabber started on {}", camera_->name());
    return true;
}

void FrameGrabber::stop() {
    if (!running_.load() && !captureThread_.joinable()) {
        return;
    }

    stopFlag_.store(true);
    // Unblocks a camera waiting inside grab()
    if (camera_) {
        camera_->close();
    }
    slotCondition_.notify_all();

    if (captureThread_.joinable()) {
        captureThread_.join();
    }
    running_.store(false);

    spdlog::info("FrameGrabber stopped: {} frames captured, {} dropped",
                 framesCaptured_.load(), framesDropped_.load());
}

void FrameGrabber::captureLoop() {
    spdlog::debug("Capture thread started");

    while (!stopFlag_.load()) {
        auto frame = camera_->grab();
        if (stopFlag_.load()) break;

        if (!frame) {
            spdlog::warn("FrameGrabber: {} returned no frame", camera_->name());
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        framesCaptured_++;
        {
            std::lock_guard<std::mutex> lock(slotMutex_);
            if (latest_) {
                framesDropped_++;  // Overwrite unconsumed frame
            }
            latest_ = std::move(frame);
        }
        slotCondition_.notify_one();
    }

    running_.store(false);
    spdlog::debug("Capture thread stopped");
}

std::optional<Frame> FrameGrabber::getFrame() {
    std::lock_guard<std::mutex> lock(slotMutex_);
    std::optional<Frame> frame;
    frame.swap(latest_);
    return frame;
}

std::optional<Frame> FrameGrabber::waitFrame(int timeoutMs) {
    std::unique_lock<std::mutex> lock(slotMutex_);
    slotCondition_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [this] { return latest_.has_value() || stopFlag_.load(); });
    std::optional<Frame> frame;
    frame.swap(latest_);
    return frame;
}

} // namespace sorting_arm::vision
