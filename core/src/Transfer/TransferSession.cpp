// TransferSession.cpp — машина состояний передачи

#include "filett/Transfer/TransferSession.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// TransferSnapshot
// ═══════════════════════════════════════════════════════════

std::string TransferSnapshot::toJson() const {
    json j = {
        {"transfer_id", transferId},
        {"progress", progress},
        {"message", message},
        {"completed", completed},
        {"canceled", canceled},
        {"state", transferStateToString(state)}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j.dump();
}

std::optional<TransferSnapshot> TransferSnapshot::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        TransferSnapshot s;
        s.transferId = j.value("transfer_id", "");
        s.progress = j.value("progress", 0.0);
        s.message = j.value("message", "");
        s.completed = j.value("completed", false);
        s.canceled = j.value("canceled", false);
        s.state = transferStateFromString(j.value("state", "pending"));
        s.error = j.value("error", "");
        return s;
    } catch (const json::exception& e) {
        spdlog::debug("TransferSnapshot: invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// TransferSession
// ═══════════════════════════════════════════════════════════

TransferSession::TransferSession(std::string transferId)
    : m_transferId(std::move(transferId))
    , m_createdAt(std::chrono::system_clock::now()) {}

TransferSession::~TransferSession() = default;

std::string TransferSession::verbLocked() const {
    return m_direction == TransferDirection::Upload ? "Upload" : "Download";
}

bool TransferSession::cancelRequestedLocked() const {
    return m_signal && m_signal->isCanceled();
}

bool TransferSession::applyCancelLocked(const std::string& message) {
    if (FileTT::isTerminal(m_state)) {
        return false;
    }
    m_state = TransferState::Canceled;
    m_message = message.empty() ? verbLocked() + " canceled" : message;
    spdlog::info("TransferSession: {} canceled at {:.1f}%", m_transferId, m_progress);
    return true;
}

/// Снимает блокировку и уведомляет о переходе в terminal, если он произошёл
bool TransferSession::settle(std::unique_lock<std::mutex>& lock, TransferState before, bool result) {
    if (FileTT::isTerminal(before) || !FileTT::isTerminal(m_state) || !m_terminalHandler) {
        return result;
    }
    TerminalHandler handler = m_terminalHandler;
    TransferState state = m_state;
    lock.unlock();
    handler(m_transferId, state);
    return result;
}

void TransferSession::setTerminalHandler(TerminalHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_terminalHandler = std::move(handler);
}

bool TransferSession::begin(TransferDirection direction, uint64_t expectedBytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (FileTT::isTerminal(m_state)) {
        return false;
    }
    m_direction = direction;
    m_expectedBytes = expectedBytes;
    return true;
}

bool TransferSession::recordChunk(uint64_t bytes) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;

    if (FileTT::isTerminal(m_state)) {
        return false;
    }
    if (cancelRequestedLocked()) {
        applyCancelLocked("");
        return settle(lock, before, false);
    }

    m_state = TransferState::InProgress;
    m_processedBytes += bytes;

    std::string verb = m_direction == TransferDirection::Upload ? "Uploaded " : "Downloaded ";
    if (m_expectedBytes > 0) {
        double percent = std::min(100.0, static_cast<double>(m_processedBytes) * 100.0 /
                                         static_cast<double>(m_expectedBytes));
        m_progress = std::max(m_progress, percent);
        m_message = verb + std::to_string(m_processedBytes) + " of " +
                    std::to_string(m_expectedBytes) + " bytes";

        if (m_processedBytes >= m_expectedBytes) {
            m_state = TransferState::Completed;
            m_progress = 100.0;
            m_message = verbLocked() + " complete";
            spdlog::info("TransferSession: {} completed ({} bytes)", m_transferId, m_processedBytes);
        }
    } else {
        m_message = verb + std::to_string(m_processedBytes) + " bytes";
    }
    return settle(lock, before, true);
}

bool TransferSession::reportProgress(double percent, const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;

    if (FileTT::isTerminal(m_state)) {
        return false;
    }
    if (cancelRequestedLocked()) {
        applyCancelLocked("");
        return settle(lock, before, false);
    }
    if (std::isnan(percent)) {
        percent = 0.0;
    }

    m_state = TransferState::InProgress;
    m_progress = std::max(m_progress, std::clamp(percent, 0.0, 100.0));

    if (m_progress >= 100.0) {
        m_state = TransferState::Completed;
        m_message = message.empty() ? verbLocked() + " complete" : message;
        spdlog::info("TransferSession: {} completed", m_transferId);
    } else {
        std::string verb = m_direction == TransferDirection::Upload ? "Uploaded " : "Downloaded ";
        m_message = message.empty()
            ? verb + std::to_string(static_cast<int>(m_progress)) + "%"
            : message;
    }
    return settle(lock, before, true);
}

bool TransferSession::markCompleted(const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;

    if (FileTT::isTerminal(m_state)) {
        return false;
    }
    if (cancelRequestedLocked()) {
        applyCancelLocked("");
        return settle(lock, before, false);
    }

    m_state = TransferState::Completed;
    m_progress = 100.0;
    m_message = message.empty() ? verbLocked() + " complete" : message;
    spdlog::info("TransferSession: {} completed", m_transferId);
    return settle(lock, before, true);
}

bool TransferSession::markCanceled(const std::string& message) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;
    return settle(lock, before, applyCancelLocked(message));
}

bool TransferSession::markFailed(const std::string& error) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;

    if (FileTT::isTerminal(m_state)) {
        return false;
    }

    m_state = TransferState::Failed;
    m_error = error.empty() ? std::string("Unknown error") : error;
    m_message = m_error;
    spdlog::error("TransferSession: {} failed: {}", m_transferId, m_error);
    return settle(lock, before, true);
}

TransferState TransferSession::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool TransferSession::isTerminal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return FileTT::isTerminal(m_state);
}

double TransferSession::progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

std::string TransferSession::message() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_message;
}

uint64_t TransferSession::processedBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_processedBytes;
}

uint64_t TransferSession::expectedBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expectedBytes;
}

TransferDirection TransferSession::direction() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_direction;
}

TransferSnapshot TransferSession::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    TransferSnapshot s;
    s.transferId = m_transferId;
    s.progress = m_progress;
    s.message = m_message;
    s.state = m_state;
    s.completed = (m_state == TransferState::Completed || m_state == TransferState::Failed);
    s.canceled = (m_state == TransferState::Canceled);
    s.error = m_error;
    return s;
}

// ═══════════════════════════════════════════════════════════
// Отмена
// ═══════════════════════════════════════════════════════════

std::shared_ptr<CancellationSignal> TransferSession::cancellationSignal() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_signal) {
        m_signal = std::make_shared<CancellationSignal>();
    }
    return m_signal;
}

bool TransferSession::isCancelRequested() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return cancelRequestedLocked();
}

bool TransferSession::observeCancellation() {
    std::unique_lock<std::mutex> lock(m_mutex);
    const TransferState before = m_state;
    if (m_state == TransferState::Canceled) {
        return true;
    }
    if (cancelRequestedLocked()) {
        return settle(lock, before, applyCancelLocked(""));
    }
    return false;
}

// ═══════════════════════════════════════════════════════════
// Ключ
// ═══════════════════════════════════════════════════════════

bool TransferSession::attachKey(KeyMaterial material) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_key) {
        spdlog::warn("TransferSession: {} already has a key", m_transferId);
        return false;
    }
    if (FileTT::isTerminal(m_state)) {
        return false;
    }

    m_key = std::make_shared<const KeyMaterial>(std::move(material));
    spdlog::debug("TransferSession: key attached to {}", m_transferId);
    return true;
}

std::shared_ptr<const KeyMaterial> TransferSession::keyMaterial() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_key;
}

bool TransferSession::hasKey() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_key != nullptr;
}

} // namespace FileTT
