// Chainswap - Swap Execution State Machine Implementation

#include <chainswap/swap_execution.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace chainswap {

bool SwapExecution::is_terminal() const noexcept {
    return stage_ == SwapStage::Confirmed || stage_ == SwapStage::Reverted ||
           stage_ == SwapStage::TimedOut;
}

void SwapExecution::transition(SwapStage from, SwapStage to) {
    if (stage_ != from) {
        throw std::logic_error(std::string("Swap ") + label_ + ": illegal transition " +
                               to_string(stage_) + " -> " + to_string(to));
    }
    spdlog::info("Swap {}: {} -> {}", label_, to_string(stage_), to_string(to));
    stage_ = to;
}

void SwapExecution::approved(std::string approval_tx_hash) {
    transition(SwapStage::NotApproved, SwapStage::Approved);
    approval_tx_hash_ = std::move(approval_tx_hash);
}

void SwapExecution::submitted(std::string swap_tx_hash) {
    transition(SwapStage::Approved, SwapStage::Submitted);
    swap_tx_hash_ = std::move(swap_tx_hash);
}

void SwapExecution::confirmed() {
    transition(SwapStage::Submitted, SwapStage::Confirmed);
}

void SwapExecution::reverted() {
    transition(SwapStage::Submitted, SwapStage::Reverted);
}

void SwapExecution::timed_out() {
    transition(SwapStage::Submitted, SwapStage::TimedOut);
}

SwapResult SwapExecution::finish(SwapResult result) const {
    result.stage = stage_;
    result.approval_tx_hash = approval_tx_hash_;
    if (!result.tx_hash) result.tx_hash = swap_tx_hash_;
    return result;
}

}  // namespace chainswap
