#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <unordered_map>
#include <vector>
#include <mutex>
#include <stdexcept>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief In-memory реализация хранилища кошельков и журнала
 *
 * Один мьютекс на всё хранилище: проверка версии, проверка уникальности
 * externalId, вставка записи и обновление кошелька выполняются под ним
 * как одна операция. Мьютекс держится только внутри вызова.
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    InMemoryLedgerRepository() {
        std::cout << "[InMemoryLedgerRepository] Created" << std::endl;
    }

    std::optional<domain::LedgerEntry> findEntryByExternalId(const std::string& externalId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entryByExternalId_.find(externalId);
        if (it == entryByExternalId_.end()) return std::nullopt;
        return entries_[it->second];
    }

    std::optional<domain::Wallet> findWalletById(const std::string& walletId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = wallets_.find(walletId);
        if (it == wallets_.end()) return std::nullopt;
        return it->second;
    }

    ports::output::CommitResult insertEntryAndUpdateWalletAtomic(
        const domain::LedgerEntry& entry,
        const domain::Wallet& wallet,
        int64_t expectedVersion) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Порядок как у уникального индекса в БД: сначала вставка записи
        if (entryByExternalId_.count(entry.externalId) > 0) {
            return ports::output::CommitResult::DUPLICATE_EXTERNAL_ID;
        }

        auto it = wallets_.find(wallet.id);
        if (it == wallets_.end() || it->second.version != expectedVersion) {
            return ports::output::CommitResult::VERSION_CONFLICT;
        }

        it->second.balance = wallet.balance;
        it->second.version = expectedVersion + 1;
        it->second.updatedAt = wallet.updatedAt;
        appendEntry(entry);

        return ports::output::CommitResult::COMMITTED;
    }

    domain::Money sumAppliedAmountsForWallet(const std::string& walletId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Money sum = domain::Money::fromMinor(0);
        auto it = entriesByWallet_.find(walletId);
        if (it != entriesByWallet_.end()) {
            for (size_t index : it->second) {
                sum = sum + entries_[index].appliedAmount;
            }
        }
        return domain::Money::fromMinor(sum.minor);
    }

    void insertWallet(const domain::Wallet& wallet,
                      const std::optional<domain::LedgerEntry>& openingEntry = std::nullopt) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (wallets_.count(wallet.id) > 0) {
            throw std::runtime_error("Wallet already exists: " + wallet.id);
        }
        if (openingEntry && entryByExternalId_.count(openingEntry->externalId) > 0) {
            throw std::runtime_error("Duplicate externalId: " + openingEntry->externalId);
        }

        wallets_[wallet.id] = wallet;
        if (openingEntry) {
            appendEntry(*openingEntry);
        }
    }

    std::vector<domain::LedgerEntry> findEntriesByWalletId(const std::string& walletId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        auto it = entriesByWallet_.find(walletId);
        if (it == entriesByWallet_.end()) return result;

        result.reserve(it->second.size());
        for (auto idx = it->second.rbegin(); idx != it->second.rend(); ++idx) {
            result.push_back(entries_[*idx]);
        }
        return result;
    }

    size_t entryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t walletCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return wallets_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        wallets_.clear();
        entries_.clear();
        entryByExternalId_.clear();
        entriesByWallet_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Wallet> wallets_;
    std::vector<domain::LedgerEntry> entries_;                           ///< В порядке вставки
    std::unordered_map<std::string, size_t> entryByExternalId_;
    std::unordered_map<std::string, std::vector<size_t>> entriesByWallet_;

    void appendEntry(const domain::LedgerEntry& entry) {
        entries_.push_back(entry);
        const size_t index = entries_.size() - 1;
        entryByExternalId_[entry.externalId] = index;
        entriesByWallet_[entry.walletId].push_back(index);
    }
};

} // namespace wallet::adapters::secondary
