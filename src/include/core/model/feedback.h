#pragma once

#include "feedback/backend_started.h"
#include "feedback/device_enabled_changed.h"
#include "feedback/device_list.h"
#include "feedback/device_name.h"
#include "feedback/feedback_type.h"
#include <nlohmann/json.hpp>

namespace devmon::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

} // namespace devmon::core
