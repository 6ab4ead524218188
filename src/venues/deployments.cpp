// Chainswap - Uniswap Deployments

#include <chainswap/venues/deployments.hpp>
#include <map>

namespace chainswap::uniswap_deployments {

namespace {

const std::map<std::string, V2Deployment, std::less<>>& v2_table() {
    static const std::map<std::string, V2Deployment, std::less<>> table = {
        {"ethereum",
         {"0x5C69bEe701ef814a2B6a3EDD4B1652CB9cc5aA6f",
          "0x7a250d5630B4cF539739dF2C5dAcb4c659F2488D"}},
        {"ethereum_sepolia",
         {"0xF62c03E08ada871A0bEb309762E260a7a6a880E6",
          "0xeE567Fe1712Faf6149d80dA1E6934E354124CfE3"}},
        {"base",
         {"0x8909Dc15e40173Ff4699343b6eB8132c65e18eC6",
          "0x4752ba5DBc23f44D87826276BF6Fd6b1C372aD24"}},
        {"base_sepolia",
         {"0x7Ae58f10f7849cA6F5fB71b7f45CB416c9204b1e",
          "0x1689E7B1F10000AE47eBfE339a4f69dECd19F602"}},
    };
    return table;
}

const std::map<std::string, V3Deployment, std::less<>>& v3_table() {
    static const std::map<std::string, V3Deployment, std::less<>> table = {
        {"ethereum",
         {"0x1F98431c8aD98523631AE4a59f267346ea31F984",
          "0xE592427A0AEce92De3Edee1F18E0157C05861564", RouterKind::SwapRouter}},
        {"ethereum_sepolia",
         {"0x0227628f3F023bb0B980b67D528571c95c6DaC1c",
          "0x3bFA4769FB09eefC5a80d6E87c3B9C650f7Ae48E", RouterKind::SwapRouter02}},
        {"base",
         {"0x33128a8fC17869897dcE68Ed026d694621f6FDfD",
          "0x2626664c2603336E57B271c5C0b26F421741e481", RouterKind::SwapRouter02}},
        {"base_sepolia",
         {"0x4752ba5DBc23f44D87826276BF6Fd6b1C372aD24",
          "0x94cC0AaC535CCDB3C01d6787D6413C739ae12bc4", RouterKind::SwapRouter02}},
    };
    return table;
}

}  // namespace

std::optional<V2Deployment> v2(std::string_view chain) {
    auto it = v2_table().find(chain);
    if (it == v2_table().end()) return std::nullopt;
    return it->second;
}

std::optional<V3Deployment> v3(std::string_view chain) {
    auto it = v3_table().find(chain);
    if (it == v3_table().end()) return std::nullopt;
    return it->second;
}

}  // namespace chainswap::uniswap_deployments
