// include/margin_ledger/storage/state_store.hpp
#pragma once

#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/portfolio/types.hpp"

namespace margin_ledger {

/**
 * @brief Durable, lockable persistence of the shared portfolio state
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    /**
     * @brief Persist a state, stamping its last_updated field
     * @param state State to write; last_updated is set to the write time
     * @return Result indicating success or failure
     */
    virtual Result<void> save(PortfolioState& state) = 0;

    /**
     * @brief Read the persisted state
     * @return The state, FILE_NOT_FOUND if nothing was saved yet, or STATE_CORRUPTED
     */
    virtual Result<PortfolioState> load() = 0;

    /**
     * @brief Take the cross-process lock without waiting
     * @return PORTFOLIO_LOCKED if another holder has it
     */
    virtual Result<void> lock() = 0;

    virtual Result<void> unlock() = 0;

    // True while this store holds the lock
    virtual bool is_locked() const = 0;

    // Where the state lives, used to place sibling files such as heartbeats
    virtual std::string location() const = 0;
};

}  // namespace margin_ledger
