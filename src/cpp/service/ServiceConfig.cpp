/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/service/ServiceConfig.hpp"

#include "gemledger/money/MoneyCodec.hpp"

#include <charconv>

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------

namespace
{

int64_t integerAttribute(
    pugi::xml_node node, const char* name, int64_t fallback, std::source_location sl)
{
    const pugi::xml_attribute attr = node.attribute(name);
    if (attr.empty()) {
        return fallback;
    }
    const std::string_view text = attr.value();
    int64_t value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument{fmt::format(
            "{}: attribute '{}' of <{}> should be an integer, was '{}'",
            sl.function_name(), name, node.name(), text)};
    }
    return value;
}

int64_t positiveAttribute(
    pugi::xml_node node, const char* name, int64_t fallback, std::source_location sl)
{
    const auto value = integerAttribute(node, name, fallback, sl);
    if (value <= 0) {
        throw std::invalid_argument{fmt::format(
            "{}: attribute '{}' of <{}> should be positive, was {}",
            sl.function_name(), name, node.name(), value)};
    }
    return value;
}

}  // namespace

//-------------------------------------------------------------------------

ServiceConfig::ServiceConfig(
    CurrencyConfig currency, HoldsConfig holds, StoreConfig store, AuditConfig audit)
    : m_currency{std::move(currency)},
      m_holds{holds},
      m_store{std::move(store)},
      m_audit{std::move(audit)}
{}

//-------------------------------------------------------------------------

ServiceConfig ServiceConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    const CurrencyConfig defaultCurrency;
    const HoldsConfig defaultHolds;
    const StoreConfig defaultStore;
    const AuditConfig defaultAudit;

    const auto currency = [&] {
        pugi::xml_node currencyNode = node.child("Currency");
        const std::string code = currencyNode.attribute("code").as_string(defaultCurrency.code.c_str());
        if (code != kCurrencyCode) {
            throw std::invalid_argument{fmt::format(
                "{}: unsupported currency '{}', only '{}' is available",
                sl.function_name(), code, kCurrencyCode)};
        }
        const auto decimals = positiveAttribute(currencyNode, "decimals", defaultCurrency.decimals, sl);
        if (decimals > money::kMaxDecimals) {
            throw std::invalid_argument{fmt::format(
                "{}: attribute 'decimals' of <Currency> should be at most {}, was {}",
                sl.function_name(), money::kMaxDecimals, decimals)};
        }
        return CurrencyConfig{.code = code, .decimals = static_cast<uint32_t>(decimals)};
    }();

    const auto holds = [&] {
        pugi::xml_node holdsNode = node.child("Holds");
        const std::chrono::seconds minTtl{
            positiveAttribute(holdsNode, "minTtlSeconds", defaultHolds.minTtl.count(), sl)};
        const std::chrono::seconds defaultTtl{
            positiveAttribute(holdsNode, "defaultTtlSeconds", defaultHolds.defaultTtl.count(), sl)};
        const std::chrono::seconds maxTtl{
            positiveAttribute(holdsNode, "maxTtlSeconds", defaultHolds.maxTtl.count(), sl)};
        if (!(minTtl <= defaultTtl && defaultTtl <= maxTtl)) {
            throw std::invalid_argument{fmt::format(
                "{}: <Holds> requires minTtlSeconds <= defaultTtlSeconds <= maxTtlSeconds, got {} / {} / {}",
                sl.function_name(), minTtl.count(), defaultTtl.count(), maxTtl.count())};
        }
        return HoldsConfig{
            .defaultTtl = defaultTtl,
            .minTtl = minTtl,
            .maxTtl = maxTtl,
            .sweepBatchSize = static_cast<size_t>(positiveAttribute(
                holdsNode, "sweepBatchSize", static_cast<int64_t>(defaultHolds.sweepBatchSize), sl))
        };
    }();

    pugi::xml_node storeNode = node.child("Store");
    StoreConfig store{
        .lockTimeout = std::chrono::milliseconds{
            positiveAttribute(storeNode, "lockTimeoutMs", defaultStore.lockTimeout.count(), sl)},
        .checkpointFile = storeNode.attribute("checkpointFile").as_string(
            defaultStore.checkpointFile.c_str())
    };

    AuditConfig audit{
        .file = node.child("Audit").attribute("file").as_string(defaultAudit.file.c_str())
    };

    return ServiceConfig{currency, holds, std::move(store), std::move(audit)};
}

//-------------------------------------------------------------------------

ServiceConfig ServiceConfig::fromFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: could not parse '{}': {}", ctx, path.c_str(), result.description())};
    }
    pugi::xml_node node = doc.child("Ledger");
    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no <Ledger> root element", ctx, path.c_str())};
    }
    return fromXML(node);
}

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
