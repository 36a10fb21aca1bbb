#pragma once

#include <core/model/feedback.h>
#include <deque>
#include <ipc/model.h>
#include <mutex>
#include <optional>

namespace devmon::ipc {

// Thread-safe queues between the front-end bridge, the scheduler and the backend:
// operations flow in, feedback flows out, each in posting order
class IpcEventStream {
    using Feedback = core::Feedback;

public:
    void PostOperation(Operation&& operation);
    void PostOperation(const Operation& operation);
    void PostFeedback(Feedback&& feedback);
    void PostFeedback(const Feedback& feedback);

    std::optional<Operation> PollOperation();
    std::optional<Feedback> PollFeedback();

private:
    std::mutex mutex_;
    std::deque<Operation> operations_;
    std::deque<Feedback> feedbacks_;
};

} // namespace devmon::ipc
