#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/PreflightErrors.h"
#include "xdr/Stellar-contract-config-setting.h"
#include <cstdint>
#include <vector>

namespace preflight
{
class SorobanNetworkConfig;

// Raised by charge() when a limit is passed. Hosts normally turn this into a
// failed invocation; if it escapes the host it is reported as is.
class BudgetExceeded : public PreflightError
{
  public:
    explicit BudgetExceeded(std::string const& msg) : PreflightError(msg)
    {
    }
};

// Metered CPU instruction and memory limits for one invocation. Limits and
// cost models are fixed at construction; only the consumption counters move.
class Budget
{
  public:
    // Linear cost model: constTerm + ((linearTerm * input) >> 7).
    struct CostModel
    {
        int64_t mConstTerm{0};
        int64_t mLinearTerm{0};

        uint64_t evaluate(uint64_t input) const;
    };

    // Every ContractCostType must have an entry in both parameter sets;
    // otherwise IntegrationError.
    Budget(uint64_t cpuInsnsLimit, uint64_t memBytesLimit,
           ContractCostParams const& cpuParams,
           ContractCostParams const& memParams);

    static Budget fromNetworkConfig(SorobanNetworkConfig const& config);

    // Throws BudgetExceeded once either limit is passed. The consumption is
    // recorded before throwing.
    void charge(ContractCostType type, uint64_t input);

    uint64_t getCpuInsnsConsumed() const;
    uint64_t getMemBytesConsumed() const;
    uint64_t getCpuInsnsLimit() const;
    uint64_t getMemBytesLimit() const;

  private:
    uint64_t const mCpuInsnsLimit;
    uint64_t const mMemBytesLimit;
    std::vector<CostModel> const mCpuModels;
    std::vector<CostModel> const mMemModels;

    uint64_t mCpuInsnsConsumed{0};
    uint64_t mMemBytesConsumed{0};
};
}
