// Chainswap - Uniswap Deployments
// Compiled-in factory and router addresses per chain

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chainswap::uniswap_deployments {

struct V2Deployment {
    std::string factory;
    std::string router;
};

enum class RouterKind : uint8_t {
    SwapRouter,    // exactInputSingle with deadline in the params struct
    SwapRouter02,  // exactInputSingle without deadline, wrapped in multicall(deadline, data)
};

struct V3Deployment {
    std::string factory;
    std::string router;
    RouterKind router_kind = RouterKind::SwapRouter;
};

std::optional<V2Deployment> v2(std::string_view chain);
std::optional<V3Deployment> v3(std::string_view chain);

}  // namespace chainswap::uniswap_deployments
