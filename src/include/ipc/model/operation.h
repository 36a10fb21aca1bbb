#pragma once

#include "operation_type.h"
#include <core/exception.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace devmon::ipc {

struct Operation {
    OperationType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Operation, type, data);

    template<typename T>
    std::optional<T> getData() const {
        try {
            return data.get<T>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Operation data rejected: {}", e.what());
            return std::nullopt;
        } catch (const core::ValidationError& e) {
            spdlog::debug("Operation data rejected: {}", e.what());
            return std::nullopt;
        }
    }
};

} // namespace devmon::ipc
