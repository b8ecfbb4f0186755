#include "filett/Transfer/CancellationSignal.h"

namespace FileTT {

bool CancellationSignal::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_canceled.load()) {
            return false;
        }
        m_canceled = true;
    }
    m_cv.notify_all();
    return true;
}

bool CancellationSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_canceled.load(); });
}

} // namespace FileTT
