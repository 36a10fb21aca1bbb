#include <ipc/ipc_event_stream.h>

namespace devmon::ipc {

using Feedback = core::Feedback;

void IpcEventStream::PostOperation(Operation&& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.emplace_back(std::move(operation));
}

void IpcEventStream::PostOperation(const Operation& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.emplace_back(operation);
}

void IpcEventStream::PostFeedback(Feedback&& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    feedbacks_.emplace_back(std::move(feedback));
}

void IpcEventStream::PostFeedback(const Feedback& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    feedbacks_.emplace_back(feedback);
}

std::optional<Operation> IpcEventStream::PollOperation() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (operations_.empty()) {
        return std::nullopt;
    }
    Operation op = std::move(operations_.front());
    operations_.pop_front();
    return op;
}

std::optional<Feedback> IpcEventStream::PollFeedback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (feedbacks_.empty()) {
        return std::nullopt;
    }
    Feedback feedback = std::move(feedbacks_.front());
    feedbacks_.pop_front();
    return feedback;
}

} // namespace devmon::ipc
