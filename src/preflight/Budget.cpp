// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/Budget.h"
#include "ledger/NetworkConfig.h"
#include "util/Logging.h"
#include "util/numeric.h"
#include <Tracy.hpp>
#include <fmt/format.h>
#include <xdrpp/types.h>

namespace preflight
{
namespace
{
size_t const NUM_COST_TYPES = static_cast<size_t>(ChaCha20DrawBytes) + 1;

std::vector<Budget::CostModel>
buildCostModels(ContractCostParams const& params, char const* name)
{
    if (params.size() < NUM_COST_TYPES)
    {
        throw IntegrationError(fmt::format(
            FMT_STRING("{} cover {} cost types, expected {}"), name,
            params.size(), NUM_COST_TYPES));
    }
    std::vector<Budget::CostModel> models;
    models.reserve(params.size());
    for (size_t i = 0; i < params.size(); ++i)
    {
        auto const& p = params[i];
        if (p.constTerm < 0 || p.linearTerm < 0)
        {
            throw IntegrationError(fmt::format(
                FMT_STRING("{} has a negative term for cost type {}"), name,
                i));
        }
        models.push_back(Budget::CostModel{p.constTerm, p.linearTerm});
    }
    return models;
}
}

uint64_t
Budget::CostModel::evaluate(uint64_t input) const
{
    uint64_t linear = saturatingMultiply(static_cast<uint64_t>(mLinearTerm),
                                         input) >>
                      7;
    return saturatingAdd(static_cast<uint64_t>(mConstTerm), linear);
}

Budget::Budget(uint64_t cpuInsnsLimit, uint64_t memBytesLimit,
               ContractCostParams const& cpuParams,
               ContractCostParams const& memParams)
    : mCpuInsnsLimit(cpuInsnsLimit)
    , mMemBytesLimit(memBytesLimit)
    , mCpuModels(buildCostModels(cpuParams, "cpu cost params"))
    , mMemModels(buildCostModels(memParams, "memory cost params"))
{
}

Budget
Budget::fromNetworkConfig(SorobanNetworkConfig const& config)
{
    ZoneScoped;
    return Budget(static_cast<uint64_t>(config.txMaxInstructions()),
                  config.txMemoryLimit(), config.cpuCostParams(),
                  config.memCostParams());
}

void
Budget::charge(ContractCostType type, uint64_t input)
{
    auto idx = static_cast<size_t>(type);
    if (idx >= mCpuModels.size() || idx >= mMemModels.size())
    {
        throw IntegrationError(
            fmt::format(FMT_STRING("no cost model for cost type {}"), idx));
    }
    mCpuInsnsConsumed =
        saturatingAdd(mCpuInsnsConsumed, mCpuModels[idx].evaluate(input));
    mMemBytesConsumed =
        saturatingAdd(mMemBytesConsumed, mMemModels[idx].evaluate(input));

    if (mCpuInsnsConsumed > mCpuInsnsLimit)
    {
        PLOG_DEBUG(Preflight, "CPU budget exceeded: {} > {}",
                   mCpuInsnsConsumed, mCpuInsnsLimit);
        throw BudgetExceeded(fmt::format(
            FMT_STRING("cpu instruction budget exceeded ({} > {})"),
            mCpuInsnsConsumed, mCpuInsnsLimit));
    }
    if (mMemBytesConsumed > mMemBytesLimit)
    {
        PLOG_DEBUG(Preflight, "Memory budget exceeded: {} > {}",
                   mMemBytesConsumed, mMemBytesLimit);
        throw BudgetExceeded(
            fmt::format(FMT_STRING("memory budget exceeded ({} > {})"),
                        mMemBytesConsumed, mMemBytesLimit));
    }
}

uint64_t
Budget::getCpuInsnsConsumed() const
{
    return mCpuInsnsConsumed;
}

uint64_t
Budget::getMemBytesConsumed() const
{
    return mMemBytesConsumed;
}

uint64_t
Budget::getCpuInsnsLimit() const
{
    return mCpuInsnsLimit;
}

uint64_t
Budget::getMemBytesLimit() const
{
    return mMemBytesLimit;
}
}
