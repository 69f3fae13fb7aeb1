//===== state_manager.hpp =====
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"

namespace margin_ledger {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    ALLOCATION_MANAGER,
    PORTFOLIO_MANAGER,
    RISK_MANAGER,
    STATE_STORE,
    SYNC_MANAGER,
    EVENT_BUS
};

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component lifecycle states
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /**
     * @brief Check whether every registered component is INITIALIZED or RUNNING
     * @return false if nothing is registered or any component is unhealthy
     */
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::unique_lock<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
        inst.cv_.notify_all();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
    std::condition_variable_any cv_;
};
}  // namespace margin_ledger
