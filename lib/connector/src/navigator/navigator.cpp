#include "navigator/navigator.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <system_error>

using namespace message_objects;

namespace navigator {

NavigatorSettings NavigatorSettings::fromRuntime(const config::RuntimeConfig& runtime) {
    NavigatorSettings settings;
    settings.kalman = runtime.kalman;
    settings.distance = runtime.distance;
    settings.resolver = runtime.resolver;
    settings.tracker = runtime.tracker;
    return settings;
}

int64_t Navigator::systemClock() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// --- конструктор ---
Navigator::Navigator(std::shared_ptr<BeaconRegistry> registry, const NavigatorSettings& settings,
                     Clock clock)
    : registry_(std::move(registry)),
      settings_(settings),
      estimator_(settings.distance),
      resolver_(settings.resolver),
      clock_(std::move(clock)) {
    if (!registry_)
        throw std::invalid_argument("Navigator requires a beacon registry");
    config::validate(settings_.kalman);
    config::validate(settings_.tracker);

    unsigned threads = settings_.tracker.workerThreads;
    if (threads == 0)
        threads = std::max(1u, std::thread::hardware_concurrency());

    workers_.reserve(threads);
    try {
        for (unsigned i = 0; i < threads; ++i) {
            workers_.emplace_back(&Navigator::workerLoop, this);
        }
    } catch (const std::system_error&) {
        // уже запущенные потоки нужно остановить до выхода из конструктора
        shutdown();
        throw;
    }
}

Navigator::~Navigator() {
    shutdown();
}

std::shared_ptr<Navigator::TrackerSlot> Navigator::findSlot(const std::string& trackerId) const {
    std::shared_lock<std::shared_mutex> lock(slotsMutex_);
    auto it = slots_.find(trackerId);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<Navigator::TrackerSlot> Navigator::slotFor(const std::string& trackerId) {
    if (auto slot = findSlot(trackerId))
        return slot;

    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    auto& slot = slots_[trackerId];
    if (!slot)
        slot = std::make_shared<TrackerSlot>(trackerId, settings_);
    return slot;
}

// --- submit ---
bool Navigator::submit(TrackerReport report) {
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        if (stopping_)
            return false;
        ++submitting_;
    }

    std::shared_ptr<TrackerSlot> scheduled;
    bool accepted = false;
    try {
        accepted = enqueue(std::move(report), scheduled);
    } catch (const std::exception&) {
        leaveSubmit(nullptr);
        throw;
    }
    leaveSubmit(std::move(scheduled));
    return accepted;
}

bool Navigator::enqueue(TrackerReport report, std::shared_ptr<TrackerSlot>& scheduled) {
    ++stats_.reportsReceived;
    auto slot = slotFor(report.trackerId_);
    const std::string trackerId = report.trackerId_;

    ++pending_;
    bool droppedOldest = false;
    bool droppedNewest = false;
    {
        std::lock_guard<std::mutex> lock(slot->queueMutex);
        if (slot->queue.size() >= settings_.tracker.queueCapacity) {
            if (settings_.tracker.overflowPolicy == config::OverflowPolicy::DropNewest) {
                droppedNewest = true;
            } else {
                slot->queue.pop_front();
                droppedOldest = true;
            }
        }

        if (!droppedNewest) {
            slot->queue.push_back(std::move(report));
            if (!slot->scheduled) {
                slot->scheduled = true;
                scheduled = slot;
            }
        }
    }

    if (droppedOldest || droppedNewest) {
        stats_.count(ErrorKind::QueueOverflow);
        reportError({ErrorKind::QueueOverflow, trackerId,
                     droppedOldest ? "dropped oldest queued report" : "dropped incoming report"});
        finishReport();
    }
    return !droppedNewest;
}

// Слот попадает в runQueue_ до того, как shutdown() увидит submitting_ == 0
void Navigator::leaveSubmit(std::shared_ptr<TrackerSlot> scheduled) {
    const bool wake = scheduled != nullptr;
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        if (scheduled)
            runQueue_.push_back(std::move(scheduled));
        if (--submitting_ == 0 && stopping_)
            idleCv_.notify_all();
    }
    if (wake)
        runCv_.notify_one();
}

// --- process ---
UpdateOutcome Navigator::process(const TrackerReport& report) {
    ++stats_.reportsReceived;
    auto slot = slotFor(report.trackerId_);
    return processOnSlot(*slot, report);
}

UpdateOutcome Navigator::processOnSlot(TrackerSlot& slot, const TrackerReport& report) {
    UpdateOutcome outcome;
    std::optional<TrackerView> published;

    try {
        auto registry = registry_->snapshot();
        std::lock_guard<std::mutex> lock(slot.stateMutex);
        int64_t now = clock_();
        outcome = slot.machine.apply(report, *registry, estimator_, resolver_, now);
        if (outcome.result != UpdateResult::OutOfOrder) {
            published = TrackerView{slot.machine.state(), slot.machine.status(now)};
        }
    } catch (const std::exception& e) {
        outcome.result = UpdateResult::Failed;
        outcome.fix.reset();
        outcome.errors.push_back({ErrorKind::ProcessingFailure, report.trackerId_, e.what()});
    }

    ++stats_.reportsProcessed;
    if (outcome.result == UpdateResult::Updated || outcome.result == UpdateResult::Initialized)
        ++stats_.fixes;

    for (const auto& error : outcome.errors) {
        stats_.count(error.kind);
        reportError(error);
    }

    if (published)
        publish(*published);

    return outcome;
}

void Navigator::runSlot(const std::shared_ptr<TrackerSlot>& slot) {
    TrackerReport report;
    {
        std::lock_guard<std::mutex> lock(slot->queueMutex);
        if (slot->queue.empty()) {
            slot->scheduled = false;
            return;
        }
        report = std::move(slot->queue.front());
        slot->queue.pop_front();
    }

    processOnSlot(*slot, report);

    // По одному отчету за раз, чтобы активный трекер не занимал поток целиком
    bool more;
    {
        std::lock_guard<std::mutex> lock(slot->queueMutex);
        more = !slot->queue.empty();
        if (!more)
            slot->scheduled = false;
    }
    if (more) {
        {
            std::lock_guard<std::mutex> lock(runMutex_);
            runQueue_.push_back(slot);
        }
        runCv_.notify_one();
    }

    finishReport();
}

void Navigator::finishReport() {
    if (--pending_ == 0) {
        std::lock_guard<std::mutex> lock(runMutex_);
        idleCv_.notify_all();
    }
}

void Navigator::workerLoop() {
    while (true) {
        std::shared_ptr<TrackerSlot> slot;
        {
            std::unique_lock<std::mutex> lock(runMutex_);
            runCv_.wait(lock, [this] { return stopping_ || !runQueue_.empty(); });
            if (runQueue_.empty())
                return;
            slot = std::move(runQueue_.front());
            runQueue_.pop_front();
        }
        runSlot(slot);
    }
}

void Navigator::waitIdle() {
    std::unique_lock<std::mutex> lock(runMutex_);
    idleCv_.wait(lock, [this] { return pending_ == 0; });
}

void Navigator::shutdown() {
    accepting_ = false;
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        stopping_ = true;
    }
    runCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();

    // submit(), вошедший до stopping_, дописывает runQueue_ уже без потоков
    {
        std::unique_lock<std::mutex> lock(runMutex_);
        idleCv_.wait(lock, [this] { return submitting_ == 0; });
    }
    while (true) {
        std::shared_ptr<TrackerSlot> slot;
        {
            std::lock_guard<std::mutex> lock(runMutex_);
            if (runQueue_.empty())
                break;
            slot = std::move(runQueue_.front());
            runQueue_.pop_front();
        }
        runSlot(slot);
    }
}

std::optional<TrackerView> Navigator::trackerState(const std::string& trackerId) const {
    auto slot = findSlot(trackerId);
    if (!slot)
        return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->stateMutex);
    return TrackerView{slot->machine.state(), slot->machine.status(clock_())};
}

std::vector<TrackerView> Navigator::snapshot() const {
    std::vector<std::shared_ptr<TrackerSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::vector<TrackerView> views;
    views.reserve(slots.size());
    const int64_t now = clock_();
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->stateMutex);
        views.push_back({slot->machine.state(), slot->machine.status(now)});
    }

    std::sort(views.begin(), views.end(), [](const TrackerView& l, const TrackerView& r) {
        return l.state.trackerId < r.state.trackerId;
    });
    return views;
}

void Navigator::setTrackerListener(TrackerListener listener) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    listener_ = std::move(listener);
}

void Navigator::setErrorHandler(ErrorCallback handler) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    errorHandler_ = std::move(handler);
}

void Navigator::reloadBeacons(const config::SiteConfig& site) {
    registry_->reload(site);
}

void Navigator::reportError(const ErrorEvent& event) {
    ErrorCallback handler;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        handler = errorHandler_;
    }
    if (!handler)
        return;

    try {
        handler(event);
    } catch (const std::exception& e) {
        std::cerr << "Error handler failed: " << e.what() << std::endl;
    }
}

void Navigator::publish(const TrackerView& view) {
    TrackerListener listener;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        listener = listener_;
    }
    if (!listener)
        return;

    try {
        listener(view);
    } catch (const std::exception& e) {
        stats_.count(ErrorKind::ProcessingFailure);
        reportError({ErrorKind::ProcessingFailure, view.state.trackerId,
                     std::string("tracker listener failed: ") + e.what()});
    }
}

}  // namespace navigator
