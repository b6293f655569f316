/**
 * Hardware-Accelerated Validation implementation
 */

#include "accelerated_validation.hpp"

#include "../core/logger.hpp"

#include <stdexcept>

namespace conhal {

namespace {

// Only reached when the engine could not build a path at any rung
PathHandle path_or_generic(const ExecutionEngine& engine, Operation op) {
    try {
        return engine.create_optimized_path(op);
    } catch (const std::runtime_error& e) {
        Logger::instance().log_degradation(to_string(op), "optimized", to_string(Backend::Generic),
                                           std::string("path construction failed: ") + e.what());
        return make_path(op, Backend::Generic);
    }
}

}  // namespace

HardwareAcceleratedValidation::HardwareAcceleratedValidation(const ExecutionEngine& engine,
                                                             ConsensusDomain& domain)
    : engine_(engine), domain_(domain), context_(build_context(engine)) {}

std::shared_ptr<const ValidationContext> HardwareAcceleratedValidation::build_context(const ExecutionEngine& engine) {
    auto ctx = std::make_shared<ValidationContext>();
    ctx->signature = path_or_generic(engine, Operation::SignatureVerification);
    ctx->script = path_or_generic(engine, Operation::ScriptExecution);
    ctx->hash = path_or_generic(engine, Operation::DoubleSha256);
    ctx->merkle = path_or_generic(engine, Operation::MerkleRoot);
    ctx->batch = path_or_generic(engine, Operation::BatchVerification);
    LOG_INFO("ADAPTER: Context " + ctx->backend_summary());
    return ctx;
}

void HardwareAcceleratedValidation::refresh_context() {
    auto next = build_context(engine_);
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_ = std::move(next);
}

std::shared_ptr<const ValidationContext> HardwareAcceleratedValidation::context() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

ValidationOutcome HardwareAcceleratedValidation::submit_transaction(const TransactionCheck& tx) {
    auto ctx = context();
    return domain_.validate_transaction(tx, *ctx);
}

ValidationOutcome HardwareAcceleratedValidation::submit_block(const BlockCheck& block) {
    auto ctx = context();
    return domain_.validate_block(block, *ctx);
}

ValidationOutcome HardwareAcceleratedValidation::connect_block(const BlockCheck& block) {
    auto ctx = context();
    ValidationOutcome outcome = domain_.apply_block(block, *ctx);
    if (!outcome.accepted) {
        LOG_INFO("ADAPTER: Block " + std::to_string(block.height) + " rejected: " + outcome.reason);
    }
    return outcome;
}

}  // namespace conhal
