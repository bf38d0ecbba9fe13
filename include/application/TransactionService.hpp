#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/CurrencyService.hpp"
#include "domain/TransactionRequest.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Wallet.hpp"
#include "domain/exceptions/WalletNotFoundException.hpp"
#include "domain/exceptions/InsufficientFundsException.hpp"
#include "domain/exceptions/ConcurrencyExhaustedException.hpp"
#include "domain/exceptions/InvalidRequestException.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <stdexcept>
#include <iostream>

namespace wallet::application {

/**
 * @brief Политика повторов при конфликте версий
 *
 * Задержка перед попыткой n+1: baseDelay × 2^(n-1) → 100ms, 200ms, ...
 * Показатель степени ограничен kMaxBackoffExponent.
 */
struct RetryPolicy {
    static constexpr int kMaxBackoffExponent = 10;

    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{100};

    std::chrono::milliseconds delayAfter(int attempt) const {
        const int exponent = std::clamp(attempt - 1, 0, kMaxBackoffExponent);
        return baseDelay * (int64_t{1} << exponent);
    }
};

/**
 * @brief Движок проведения транзакций
 *
 * Алгоритм applyTransaction:
 * 1. Идемпотентность: запись с таким externalId уже есть → вернуть её как есть
 * 2. Цикл попыток (не более maxAttempts), каждая атомарна:
 *    - загрузить кошелёк (WalletNotFound)
 *    - нормализовать сумму в опорную валюту
 *    - applied = ±normalized, prospective = balance + applied
 *    - prospective < 0 → InsufficientFunds (без повтора)
 *    - CAS-коммит: запись + кошелёк с version + 1
 * 3. VERSION_CONFLICT → пауза и новая попытка со свежим кошельком
 *    DUPLICATE_EXTERNAL_ID → конкурент уже провёл этот externalId, вернуть его запись
 * 4. Попытки кончились → ConcurrencyExhausted
 *
 * Блокировки не держатся: единственный сигнал взаимного исключения: версия кошелька.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    using DelayFunction = std::function<void(std::chrono::milliseconds)>;

    TransactionService(
        std::shared_ptr<ports::output::ILedgerRepository> ledger,
        std::shared_ptr<CurrencyService> currency,
        RetryPolicy retryPolicy = {},
        DelayFunction delay = sleepFor
    ) : ledger_(std::move(ledger))
      , currency_(std::move(currency))
      , retryPolicy_(retryPolicy)
      , delay_(std::move(delay))
    {
        if (retryPolicy_.maxAttempts < 1) {
            throw std::invalid_argument("RetryPolicy.maxAttempts must be >= 1");
        }
        std::cout << "[TransactionService] Created (maxAttempts=" << retryPolicy_.maxAttempts
                  << ", baseDelay=" << retryPolicy_.baseDelay.count() << "ms)" << std::endl;
    }

    domain::LedgerEntry applyTransaction(const domain::TransactionRequest& request) override {
        validate(request);

        if (auto existing = ledger_->findEntryByExternalId(request.externalId)) {
            if (existing->walletId != request.walletId) {
                std::cerr << "[TransactionService] Transaction " << request.externalId
                          << " already belongs to wallet " << existing->walletId << std::endl;
            }
            std::cout << "[TransactionService] Transaction " << request.externalId
                      << " already exists (idempotent)" << std::endl;
            return *existing;
        }

        for (int attempt = 1; attempt <= retryPolicy_.maxAttempts; ++attempt) {
            if (auto entry = tryApply(request)) {
                return *entry;
            }

            std::cout << "[TransactionService] Optimistic lock conflict on wallet " << request.walletId
                      << ", attempt " << attempt << "/" << retryPolicy_.maxAttempts << std::endl;

            if (attempt < retryPolicy_.maxAttempts) {
                delay_(retryPolicy_.delayAfter(attempt));
            }
        }

        std::cerr << "[TransactionService] Transaction " << request.externalId
                  << " failed after " << retryPolicy_.maxAttempts << " attempts" << std::endl;
        throw domain::ConcurrencyExhaustedException(
            request.walletId, request.externalId, retryPolicy_.maxAttempts);
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> ledger_;
    std::shared_ptr<CurrencyService> currency_;
    RetryPolicy retryPolicy_;
    DelayFunction delay_;

    static void sleepFor(std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
    }

    static void validate(const domain::TransactionRequest& request) {
        if (request.externalId.empty()) {
            throw domain::InvalidRequestException("transactionId is required");
        }
        if (request.walletId.empty()) {
            throw domain::InvalidRequestException("walletId is required");
        }
        if (!request.amount.isAtLeastOneMinorUnit()) {
            throw domain::InvalidRequestException("amount must be at least 0.01");
        }
    }

    /**
     * @brief Одна атомарная попытка
     * @return запись при успехе, std::nullopt при конфликте версий
     */
    std::optional<domain::LedgerEntry> tryApply(const domain::TransactionRequest& request) {
        auto wallet = ledger_->findWalletById(request.walletId);
        if (!wallet) {
            throw domain::WalletNotFoundException(request.walletId);
        }

        const domain::Money normalized = currency_->normalize(request.amount);
        const domain::Money applied =
            request.kind == domain::TransactionKind::DEPOSIT ? normalized : -normalized;
        int64_t prospectiveMinor = 0;
        if (__builtin_add_overflow(wallet->balance.minor, applied.minor, &prospectiveMinor)) {
            throw domain::InvalidRequestException("amount is too large");
        }
        const domain::Money prospective(prospectiveMinor, wallet->balance.currency);

        if (prospective.isNegative()) {
            std::cout << "[TransactionService] Insufficient funds: wallet " << wallet->id
                      << ", balance " << wallet->balance.toString()
                      << ", requested " << normalized.toString() << std::endl;
            throw domain::InsufficientFundsException(wallet->balance, normalized);
        }

        const auto now = domain::Timestamp::now();

        domain::LedgerEntry entry;
        entry.id = utils::UuidGenerator::generate();
        entry.externalId = request.externalId;
        entry.walletId = wallet->id;
        entry.kind = request.kind;
        entry.amount = domain::DecimalAmount(
            request.amount.units,
            request.amount.currency.empty() ? currency_->referenceCurrency()
                                            : CurrencyService::toUpper(request.amount.currency));
        entry.appliedAmount = applied;
        entry.referenceAmount = normalized;
        entry.metadata = request.metadata;
        entry.createdAt = now;

        domain::Wallet updated = *wallet;
        updated.balance = prospective;
        updated.version = wallet->version + 1;
        updated.updatedAt = now;

        const auto result = ledger_->insertEntryAndUpdateWalletAtomic(entry, updated, wallet->version);
        if (result != ports::output::CommitResult::COMMITTED) {
            std::cout << "[TransactionService] Commit of " << entry.externalId << " on version "
                      << wallet->version << ": " << ports::output::toString(result) << std::endl;
        }

        switch (result) {
            case ports::output::CommitResult::COMMITTED:
                std::cout << "[TransactionService] Transaction " << entry.externalId << " completed: "
                          << domain::toString(entry.kind) << " " << entry.amount.toString() << " "
                          << entry.amount.currency << " (" << normalized.toString() << " "
                          << normalized.currency << "), new balance: " << prospective.toString()
                          << std::endl;
                return entry;

            case ports::output::CommitResult::DUPLICATE_EXTERNAL_ID:
                return resolveDuplicate(request);

            case ports::output::CommitResult::VERSION_CONFLICT:
                return std::nullopt;
        }
        return std::nullopt;
    }

    /**
     * @brief Проиграли гонку за externalId: вернуть запись победителя
     *
     * Если победитель не читается, попытка считается конфликтом.
     */
    std::optional<domain::LedgerEntry> resolveDuplicate(const domain::TransactionRequest& request) {
        auto winner = ledger_->findEntryByExternalId(request.externalId);
        if (!winner) {
            std::cerr << "[TransactionService] Duplicate " << request.externalId
                      << " reported but not readable, retrying" << std::endl;
            return std::nullopt;
        }
        if (winner->walletId != request.walletId) {
            std::cerr << "[TransactionService] Transaction " << request.externalId
                      << " already belongs to wallet " << winner->walletId << std::endl;
        }
        std::cout << "[TransactionService] Transaction " << request.externalId
                  << " committed concurrently, returning existing entry" << std::endl;
        return winner;
    }
};

} // namespace wallet::application
