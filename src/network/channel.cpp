#include "tessera/network/channel.hpp"
#include <boost/log/trivial.hpp>

namespace tessera {
namespace network {

bool Channel::produce(Message message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            BOOST_LOG_TRIVIAL(debug) << "Channel: Dropping " << to_string(message.type) << " on closed channel";
            return false;
        }
        queue_.push(std::move(message));
        BOOST_LOG_TRIVIAL(trace) << "Channel: Added message. Channel size: " << queue_.size();
    }
    cv_.notify_one();
    return true;
}

bool Channel::consume(Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    message = std::move(queue_.front());
    queue_.pop();
    BOOST_LOG_TRIVIAL(trace) << "Channel: Retrieved message. Channel size: " << queue_.size();
    return true;
}

bool Channel::wait_consume(Message& message, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return false;
    }
    message = std::move(queue_.front());
    queue_.pop();
    return true;
}

void Channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Channel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t Channel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Channel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace network
} // namespace tessera
