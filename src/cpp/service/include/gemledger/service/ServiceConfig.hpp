/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

#include <chrono>

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------

struct CurrencyConfig
{
    std::string code{kCurrencyCode};
    uint32_t decimals{2};
};

struct HoldsConfig
{
    std::chrono::seconds defaultTtl{900};
    std::chrono::seconds minTtl{60};
    std::chrono::seconds maxTtl{3600};
    size_t sweepBatchSize{500};
};

struct StoreConfig
{
    std::chrono::milliseconds lockTimeout{5000};
    fs::path checkpointFile{"gemledger.checkpoint.json"};
};

struct AuditConfig
{
    fs::path file{"gemledger.audit.csv"};
};

//-------------------------------------------------------------------------

class ServiceConfig
{
public:
    ServiceConfig() noexcept = default;
    ServiceConfig(CurrencyConfig currency, HoldsConfig holds, StoreConfig store, AuditConfig audit);

    [[nodiscard]] auto&& currency(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_currency);
    }

    [[nodiscard]] auto&& holds(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_holds);
    }

    [[nodiscard]] auto&& store(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_store);
    }

    [[nodiscard]] auto&& audit(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_audit);
    }

    [[nodiscard]] static ServiceConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static ServiceConfig fromFile(const fs::path& path);

private:
    CurrencyConfig m_currency;
    HoldsConfig m_holds;
    StoreConfig m_store;
    AuditConfig m_audit;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
