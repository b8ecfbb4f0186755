// ProgressBroadcaster.cpp — поток рассылки прогресса одной передачи

#include "filett/Session/ProgressBroadcaster.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace FileTT {

// Состояние живёт, пока его держит объект или поток
struct ProgressBroadcaster::State {
    std::shared_ptr<TransferSession> session;
    SubscriberProvider provider;
    DropHandler onDrop;
    std::chrono::milliseconds interval;

    std::mutex mutex;
    std::condition_variable cv;
    bool stopRequested = false;
    std::atomic<bool> running{false};
    std::atomic<uint64_t> rounds{0};

    // Под threadMutex: start() во время рассылки требует ещё одного прохода
    std::mutex threadMutex;
    std::thread thread;
    bool restartRequested = false;
};

// ═══════════════════════════════════════════════════════════
// Рассылка
// ═══════════════════════════════════════════════════════════

bool ProgressBroadcaster::deliver(State& state) {
    TransferSnapshot snapshot = state.session->snapshot();
    std::string message = snapshot.toJson();

    std::vector<SubscriberPtr> subscribers =
        state.provider ? state.provider() : std::vector<SubscriberPtr>{};
    std::vector<SubscriberPtr> failed;

    for (const auto& subscriber : subscribers) {
        bool sent = false;
        try {
            sent = subscriber->send(message);
        } catch (const std::exception& e) {
            spdlog::warn("ProgressBroadcaster: send to {} threw: {}", subscriber->id(), e.what());
        }
        if (!sent) {
            spdlog::warn("ProgressBroadcaster: dropping subscriber {} of {}",
                         subscriber->id(), snapshot.transferId);
            failed.push_back(subscriber);
        }
    }

    for (const auto& subscriber : failed) {
        if (state.onDrop) {
            state.onDrop(subscriber);
        }
    }

    state.rounds++;
    return snapshot.isTerminal();
}

void ProgressBroadcaster::runLoop(std::shared_ptr<State> state) {
    spdlog::debug("ProgressBroadcaster: started for {}", state->session->transferId());

    while (true) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stopRequested) break;
        }
        {
            std::lock_guard<std::mutex> threadLock(state->threadMutex);
            state->restartRequested = false;
        }

        if (deliver(*state)) {
            // Подписчик, пришедший во время рассылки, тоже должен увидеть terminal snapshot
            std::lock_guard<std::mutex> threadLock(state->threadMutex);
            if (!state->restartRequested) {
                spdlog::debug("ProgressBroadcaster: {} reached terminal state",
                              state->session->transferId());
                state->running = false;
                return;
            }
            continue;
        }

        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait_for(lock, state->interval, [&state] { return state->stopRequested; });
    }

    std::lock_guard<std::mutex> threadLock(state->threadMutex);
    state->running = false;
}

// ═══════════════════════════════════════════════════════════
// ProgressBroadcaster
// ═══════════════════════════════════════════════════════════

ProgressBroadcaster::ProgressBroadcaster(
    std::shared_ptr<TransferSession> session,
    SubscriberProvider provider,
    DropHandler onDrop,
    std::chrono::milliseconds interval
) : m_state(std::make_shared<State>()) {
    if (!session) {
        throw std::invalid_argument("ProgressBroadcaster requires a session");
    }
    m_state->session = std::move(session);
    m_state->provider = std::move(provider);
    m_state->onDrop = std::move(onDrop);
    m_state->interval = interval;
}

ProgressBroadcaster::~ProgressBroadcaster() {
    stop();
}

void ProgressBroadcaster::start() {
    std::lock_guard<std::mutex> threadLock(m_state->threadMutex);

    if (m_state->running) {
        m_state->restartRequested = true;
        return;
    }

    // Предыдущий поток уже завершился (terminal snapshot)
    if (m_state->thread.joinable()) {
        if (m_state->thread.get_id() == std::this_thread::get_id()) {
            m_state->thread.detach();
        } else {
            m_state->thread.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopRequested = false;
    }
    m_state->running = true;
    m_state->thread = std::thread(&ProgressBroadcaster::runLoop, m_state);
}

void ProgressBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopRequested = true;
    }
    m_state->cv.notify_all();

    // join без threadMutex: поток берёт его при выходе
    std::thread thread;
    {
        std::lock_guard<std::mutex> threadLock(m_state->threadMutex);
        thread = std::move(m_state->thread);
    }
    if (!thread.joinable()) {
        return;
    }

    // Не join из собственного потока
    if (thread.get_id() != std::this_thread::get_id()) {
        thread.join();
    } else {
        thread.detach();
    }
}

bool ProgressBroadcaster::isRunning() const {
    return m_state->running;
}

bool ProgressBroadcaster::broadcastOnce() {
    return deliver(*m_state);
}

uint64_t ProgressBroadcaster::rounds() const {
    return m_state->rounds;
}

} // namespace FileTT
