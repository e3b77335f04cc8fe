#pragma once
#include "core/CorrectionOrchestrator.hpp"

#include <atomic>
#include <mutex>

namespace qecloop {

/**
 * @brief Routes an asynchronous stop request (e.g. a signal handler thread) to
 * whichever orchestrator is currently running.
 *
 * An orchestrator is reachable only while its Attachment is alive; detaching
 * waits for an in-flight interrupt() so the orchestrator can be destroyed
 * right after, including during stack unwinding.
 */
class RunInterrupter {
public:
    class Attachment {
    public:
        Attachment(RunInterrupter& owner, CorrectionOrchestrator& o) : owner_(&owner) {
            std::lock_guard<std::mutex> lk(owner_->m_);
            owner_->active_ = &o;
            if (owner_->interrupted_.load()) o.request_stop();
        }
        ~Attachment() {
            std::lock_guard<std::mutex> lk(owner_->m_);
            owner_->active_ = nullptr;
        }
        Attachment(const Attachment&) = delete;
        Attachment& operator=(const Attachment&) = delete;

    private:
        RunInterrupter* owner_;
    };

    /** @brief Stop the attached run between cycles; later attachments stop immediately. */
    void interrupt() {
        interrupted_.store(true);
        std::lock_guard<std::mutex> lk(m_);
        if (active_) active_->request_stop();
    }

    bool interrupted() const { return interrupted_.load(); }
    bool attached() const {
        std::lock_guard<std::mutex> lk(m_);
        return active_ != nullptr;
    }

private:
    mutable std::mutex m_;
    CorrectionOrchestrator* active_ = nullptr;
    std::atomic<bool> interrupted_{false};
};

} // namespace qecloop
