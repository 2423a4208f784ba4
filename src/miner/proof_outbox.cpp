// ZEUS - Proof Outbox Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/miner/proof_outbox.h"
#include "zeus/util/logging.h"

namespace zeus {
namespace miner {

ProofOutbox::ProofOutbox(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

ProofOutbox::~ProofOutbox() {
    Stop();
}

void ProofOutbox::Start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    sender_ = std::thread(&ProofOutbox::SenderLoop, this);
}

void ProofOutbox::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (sender_.joinable()) {
        sender_.join();
    }
}

bool ProofOutbox::Enqueue(std::string challengeId, std::string line, SendFunction send) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.load() && !stopping_ && queue_.size() < capacity_) {
            queue_.push_back(Item{std::move(challengeId), std::move(line), std::move(send)});
            cv_.notify_one();
            return true;
        }
    }
    dropped_++;
    LOG_WARN(util::LogCategory::RESPONDER) << "Outbox full or stopped, dropping reply for "
                                           << challengeId;
    return false;
}

void ProofOutbox::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this] { return (queue_.empty() && !sending_) || !running_.load(); });
}

size_t ProofOutbox::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ProofOutbox::SenderLoop() {
    for (;;) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            sending_ = true;
        }
        
        bool ok = false;
        try {
            ok = item.send && item.send(item.line);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::RESPONDER) << "Send for " << item.challengeId
                                                   << " threw: " << e.what();
        }
        if (ok) {
            sent_++;
            LOG_DEBUG(util::LogCategory::RESPONDER) << "Reply sent for " << item.challengeId;
        } else {
            failed_++;
            LOG_WARN(util::LogCategory::RESPONDER) << "Reply for " << item.challengeId
                                                   << " could not be delivered, dropped";
        }
        
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sending_ = false;
        }
        idleCv_.notify_all();
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sending_ = false;
    }
    idleCv_.notify_all();
}

} // namespace miner
} // namespace zeus
