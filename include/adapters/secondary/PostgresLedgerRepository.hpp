// include/adapters/secondary/PostgresLedgerRepository.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища кошельков и журнала
 *
 * Таблица: wallets
 * - id VARCHAR(64) PRIMARY KEY
 * - balance BIGINT NOT NULL CHECK (balance >= 0)   (в минимальных единицах)
 * - currency VARCHAR(8) NOT NULL
 * - version BIGINT NOT NULL                        (оптимистичная блокировка)
 * - created_at / updated_at TIMESTAMPTZ
 *
 * Таблица: ledger_entries (только INSERT)
 * - id VARCHAR(64) PRIMARY KEY
 * - external_id VARCHAR(255) UNIQUE                (ключ идемпотентности)
 * - wallet_id VARCHAR(64) REFERENCES wallets(id)
 * - kind, amount NUMERIC(28,8), currency       (исходная сумма клиента, без округления)
 * - applied_amount, reference_amount, reference_currency (в опорной валюте)
 * - metadata JSONB, created_at
 *
 * CAS-коммит в одной транзакции:
 *   INSERT ledger_entries          → unique_violation = DUPLICATE_EXTERNAL_ID
 *   UPDATE wallets ... WHERE id = $1 AND version = $2
 *                                  → 0 строк = VERSION_CONFLICT (откат)
 *   COMMIT
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::LedgerEntry> findEntryByExternalId(const std::string& externalId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(kSelectEntry) + " WHERE external_id = $1",
                externalId
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToEntry(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] findEntryByExternalId error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Wallet> findWalletById(const std::string& walletId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, balance, currency, version, "
                "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms, "
                "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms "
                "FROM wallets WHERE id = $1",
                walletId
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToWallet(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] findWalletById error: " << e.what() << std::endl;
            throw;
        }
    }

    ports::output::CommitResult insertEntryAndUpdateWalletAtomic(
        const domain::LedgerEntry& entry,
        const domain::Wallet& wallet,
        int64_t expectedVersion) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            try {
                insertEntry(txn, entry);
            } catch (const pqxx::unique_violation&) {
                std::cout << "[PostgresLedgerRepository] Duplicate external_id " << entry.externalId << std::endl;
                return ports::output::CommitResult::DUPLICATE_EXTERNAL_ID;
            }

            auto updated = txn.exec_params(
                "UPDATE wallets "
                "SET balance = $3, "
                "    version = version + 1, "
                "    updated_at = to_timestamp($4::BIGINT / 1000.0) "
                "WHERE id = $1 AND version = $2",
                wallet.id,
                expectedVersion,
                wallet.balance.minor,
                wallet.updatedAt.toMillis()
            );

            if (updated.affected_rows() == 0) {
                txn.abort();
                return ports::output::CommitResult::VERSION_CONFLICT;
            }

            txn.commit();
            return ports::output::CommitResult::COMMITTED;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] insertEntryAndUpdateWalletAtomic error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Money sumAppliedAmountsForWallet(const std::string& walletId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(SUM(applied_amount), 0)::BIGINT AS total "
                "FROM ledger_entries WHERE wallet_id = $1",
                walletId
            );

            return domain::Money::fromMinor(result[0]["total"].as<int64_t>());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] sumAppliedAmountsForWallet error: " << e.what() << std::endl;
            throw;
        }
    }

    void insertWallet(const domain::Wallet& wallet,
                      const std::optional<domain::LedgerEntry>& openingEntry = std::nullopt) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO wallets (id, balance, currency, version, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, to_timestamp($5::BIGINT / 1000.0), to_timestamp($6::BIGINT / 1000.0))",
                wallet.id,
                wallet.balance.minor,
                wallet.currency,
                wallet.version,
                wallet.createdAt.toMillis(),
                wallet.updatedAt.toMillis()
            );

            if (openingEntry) {
                insertEntry(txn, *openingEntry);
            }

            txn.commit();
            std::cout << "[PostgresLedgerRepository] Saved wallet " << wallet.id << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] insertWallet error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> findEntriesByWalletId(const std::string& walletId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(kSelectEntry) + " WHERE wallet_id = $1 ORDER BY created_at DESC, seq DESC",
                walletId
            );

            std::vector<domain::LedgerEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
            return entries;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] findEntriesByWalletId error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static constexpr const char* kSelectEntry =
        "SELECT id, external_id, wallet_id, kind, amount::TEXT AS amount, currency, applied_amount, "
        "reference_amount, reference_currency, metadata::TEXT AS metadata, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms "
        "FROM ledger_entries";

    void insertEntry(pqxx::work& txn, const domain::LedgerEntry& entry) {
        std::optional<std::string> metadata;
        if (!entry.metadata.is_null()) {
            metadata = entry.metadata.dump();
        }

        txn.exec_params(
            "INSERT INTO ledger_entries "
            "(id, external_id, wallet_id, kind, amount, currency, applied_amount, reference_amount, "
            " reference_currency, metadata, created_at) "
            "VALUES ($1, $2, $3, $4, $5::NUMERIC, $6, $7, $8, $9, $10::JSONB, to_timestamp($11::BIGINT / 1000.0))",
            entry.id,
            entry.externalId,
            entry.walletId,
            domain::toString(entry.kind),
            entry.amount.toString(),
            entry.amount.currency,
            entry.appliedAmount.minor,
            entry.referenceAmount.minor,
            entry.appliedAmount.currency,
            metadata,
            entry.createdAt.toMillis()
        );
    }

    domain::Wallet rowToWallet(const pqxx::row& row) const {
        domain::Wallet wallet;
        wallet.id = row["id"].as<std::string>();
        wallet.currency = row["currency"].as<std::string>();
        wallet.balance = domain::Money(row["balance"].as<int64_t>(), wallet.currency);
        wallet.version = row["version"].as<int64_t>();
        wallet.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        wallet.updatedAt = domain::Timestamp::fromMillis(row["updated_at_ms"].as<int64_t>());
        return wallet;
    }

    domain::LedgerEntry rowToEntry(const pqxx::row& row) const {
        domain::LedgerEntry entry;
        entry.id = row["id"].as<std::string>();
        entry.externalId = row["external_id"].as<std::string>();
        entry.walletId = row["wallet_id"].as<std::string>();
        entry.kind = domain::parseTransactionKind(row["kind"].as<std::string>())
                         .value_or(domain::TransactionKind::DEPOSIT);

        const std::string referenceCurrency = row["reference_currency"].as<std::string>();
        entry.amount = domain::DecimalAmount::fromString(row["amount"].as<std::string>(),
                                                         row["currency"].as<std::string>());
        entry.appliedAmount = domain::Money(row["applied_amount"].as<int64_t>(), referenceCurrency);
        entry.referenceAmount = domain::Money(row["reference_amount"].as<int64_t>(), referenceCurrency);

        entry.metadata = row["metadata"].is_null()
            ? nlohmann::json()
            : nlohmann::json::parse(row["metadata"].as<std::string>());
        entry.createdAt = domain::Timestamp::fromMillis(row["created_at_ms"].as<int64_t>());
        return entry;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS wallets (
                    id VARCHAR(64) PRIMARY KEY,
                    balance BIGINT NOT NULL DEFAULT 0 CHECK (balance >= 0),
                    currency VARCHAR(8) NOT NULL DEFAULT 'EGP',
                    version BIGINT NOT NULL DEFAULT 0,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_entries (
                    seq BIGSERIAL,
                    id VARCHAR(64) PRIMARY KEY,
                    external_id VARCHAR(255) NOT NULL UNIQUE,
                    wallet_id VARCHAR(64) NOT NULL REFERENCES wallets(id),
                    kind VARCHAR(16) NOT NULL,
                    amount NUMERIC(28, 8) NOT NULL,
                    currency VARCHAR(8) NOT NULL,
                    applied_amount BIGINT NOT NULL,
                    reference_amount BIGINT NOT NULL,
                    reference_currency VARCHAR(8) NOT NULL,
                    metadata JSONB,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_ledger_entries_wallet "
                "ON ledger_entries (wallet_id, created_at)");

            txn.commit();
            std::cout << "[PostgresLedgerRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace wallet::adapters::secondary
