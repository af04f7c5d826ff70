#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/Money.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wallet::application {

/**
 * @brief Итог сверки журнала с балансами
 */
struct AuditReport {
    int64_t totalInflow = 0;        ///< Сумма TOPUP
    int64_t totalOutflow = 0;       ///< Сумма списаний наружу (BUDGET_SPEND, SUBSCRIPTION_CHARGE), положительная
    int64_t fundsInSystem = 0;      ///< Сумма балансов всех счетов, кроме LOAN
    int64_t escrowHeld = 0;         ///< Сумма балансов ESCROW
    int64_t loansOutstanding = 0;   ///< Сумма балансов LOAN
    std::size_t accountsChecked = 0;
    std::size_t entriesChecked = 0;
    std::vector<std::string> mismatches;

    bool balanced() const { return mismatches.empty(); }
};

/**
 * @brief Проверка сохранения денег по закоммиченному состоянию
 *
 * - баланс каждого счёта равен сумме его записей журнала
 * - ни один баланс не отрицателен
 * - записи INTERNAL-операции по счетам с деньгами дают в сумме ноль
 * - сумма балансов (без LOAN) = приход − расход
 *
 * Чтения идут без блокировок, поэтому сверку запускают в тишине
 * (тесты, обслуживание), а не под нагрузкой.
 */
class LedgerAuditor {
public:
    explicit LedgerAuditor(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {}

    AuditReport check() {
        AuditReport report;

        auto accounts = store_->allAccounts();
        auto entries = store_->allEntries();
        report.accountsChecked = accounts.size();
        report.entriesChecked = entries.size();

        std::map<domain::AccountId, domain::Account> byId;
        for (const auto& account : accounts) {
            byId.emplace(account.id, account);
        }

        std::map<domain::AccountId, int64_t> replayed;
        std::map<std::string, int64_t> operationNet;
        std::map<std::string, domain::EntryReason> operationReason;

        for (const auto& entry : entries) {
            replayed[entry.accountId] += entry.delta;

            auto it = byId.find(entry.accountId);
            if (it == byId.end()) {
                report.mismatches.push_back("Entry " + std::to_string(entry.entryId) +
                    " references unknown account " + std::to_string(entry.accountId));
                continue;
            }
            if (!it->second.holdsFunds()) {
                continue;
            }

            switch (domain::flowOf(entry.reason)) {
                case domain::FlowDirection::INFLOW:
                    report.totalInflow += entry.delta;
                    break;
                case domain::FlowDirection::OUTFLOW:
                    report.totalOutflow -= entry.delta;
                    break;
                case domain::FlowDirection::INTERNAL:
                    operationNet[entry.operationId] += entry.delta;
                    operationReason[entry.operationId] = entry.reason;
                    break;
            }
        }

        for (const auto& account : accounts) {
            int64_t expected = replayed.count(account.id) ? replayed[account.id] : 0;
            if (account.balance != expected) {
                report.mismatches.push_back("Account " + std::to_string(account.id) + " balance " +
                    domain::Money::format(account.balance) + " but journal gives " +
                    domain::Money::format(expected));
            }
            if (account.balance < 0) {
                report.mismatches.push_back("Account " + std::to_string(account.id) +
                    " is negative: " + domain::Money::format(account.balance));
            }

            switch (account.kind) {
                case domain::AccountKind::LOAN:
                    report.loansOutstanding += account.balance;
                    break;
                case domain::AccountKind::ESCROW:
                    report.escrowHeld += account.balance;
                    report.fundsInSystem += account.balance;
                    break;
                default:
                    report.fundsInSystem += account.balance;
                    break;
            }
        }

        for (const auto& [operationId, net] : operationNet) {
            if (net != 0) {
                report.mismatches.push_back("Operation " + operationId + " (" +
                    domain::toString(operationReason[operationId]) + ") nets to " +
                    domain::Money::format(net));
            }
        }

        int64_t expectedFunds = report.totalInflow - report.totalOutflow;
        if (report.fundsInSystem != expectedFunds) {
            report.mismatches.push_back("Funds in system " + domain::Money::format(report.fundsInSystem) +
                " but inflow minus outflow is " + domain::Money::format(expectedFunds));
        }

        if (report.balanced()) {
            std::cout << "[LedgerAuditor] OK: " << report.accountsChecked << " accounts, "
                      << report.entriesChecked << " entries, funds "
                      << domain::Money::format(report.fundsInSystem) << std::endl;
        } else {
            for (const auto& mismatch : report.mismatches) {
                std::cerr << "[LedgerAuditor] " << mismatch << std::endl;
            }
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
};

} // namespace wallet::application
