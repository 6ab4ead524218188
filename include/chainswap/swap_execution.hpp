// Chainswap - Swap Execution State Machine
// Tracks an approve-then-swap attempt through its lifecycle

#pragma once

#include <chainswap/types.hpp>
#include <optional>
#include <string>

namespace chainswap {

// NotApproved -> Approved -> Submitted -> {Confirmed, Reverted, TimedOut}
// Illegal transitions throw std::logic_error.
class SwapExecution {
public:
    explicit SwapExecution(std::string label) : label_(std::move(label)) {}

    [[nodiscard]] SwapStage stage() const noexcept { return stage_; }
    [[nodiscard]] bool is_terminal() const noexcept;

    [[nodiscard]] const std::optional<std::string>& approval_tx_hash() const noexcept {
        return approval_tx_hash_;
    }
    [[nodiscard]] const std::optional<std::string>& swap_tx_hash() const noexcept {
        return swap_tx_hash_;
    }

    void approved(std::string approval_tx_hash);
    void submitted(std::string swap_tx_hash);
    void confirmed();
    void reverted();
    void timed_out();

    // Stamps the stage and hashes onto a result built by the venue
    SwapResult finish(SwapResult result) const;

private:
    void transition(SwapStage from, SwapStage to);

    std::string label_;
    SwapStage stage_ = SwapStage::NotApproved;
    std::optional<std::string> approval_tx_hash_;
    std::optional<std::string> swap_tx_hash_;
};

}  // namespace chainswap
