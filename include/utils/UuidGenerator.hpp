#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace wallet::utils {

/**
 * @brief Генератор UUID v4 для кошельков и записей журнала
 *
 * @note Thread-safe: у каждого потока свой генератор
 */
class UuidGenerator {
public:
    /**
     * @brief Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y ∈ [8, 9, a, b]
     */
    static std::string generate() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        const uint64_t high = dist(gen);
        const uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << (high >> 32) << '-'
           << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
           << std::setw(4) << ((high & 0x0FFF) | 0x4000) << '-'
           << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << '-'
           << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }
};

} // namespace wallet::utils
