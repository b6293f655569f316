/**
 * Hardware-Accelerated Validation
 *
 * ValidationPort implementation that builds a ValidationContext from the
 * engine and hands every request to the injected ConsensusDomain. The engine
 * already walks down past backends whose kernels cannot be built; if even
 * its Generic path fails, the context gets the library's own Generic path
 * for that operation. Validation always runs.
 */

#pragma once

#include "../engine/engine.hpp"
#include "validation_port.hpp"

#include <memory>
#include <mutex>

namespace conhal {

class HardwareAcceleratedValidation : public ValidationPort {
public:
    HardwareAcceleratedValidation(const ExecutionEngine& engine, ConsensusDomain& domain);

    ValidationOutcome submit_transaction(const TransactionCheck& tx) override;
    ValidationOutcome submit_block(const BlockCheck& block) override;
    ValidationOutcome connect_block(const BlockCheck& block) override;

    /**
     * Rebuild the context from the engine, e.g. after tune_for_workload().
     * Requests already in flight finish on the context they started with.
     */
    void refresh_context();

    std::shared_ptr<const ValidationContext> context() const;

private:
    static std::shared_ptr<const ValidationContext> build_context(const ExecutionEngine& engine);

    const ExecutionEngine& engine_;
    ConsensusDomain& domain_;

    mutable std::mutex context_mutex_;
    std::shared_ptr<const ValidationContext> context_;
};

}  // namespace conhal
