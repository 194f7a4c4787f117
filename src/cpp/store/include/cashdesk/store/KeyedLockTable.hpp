/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <compare>
#include <mutex>

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

// Declaration order is the global acquisition order.
enum class LockDomain : uint8_t
{
    ORDER,
    EMPLOYEE,
    SHIFT
};

struct LockKey
{
    LockDomain domain;
    uint32_t id;

    auto operator<=>(const LockKey&) const = default;

    [[nodiscard]] static LockKey order(OrderId id) noexcept { return {LockDomain::ORDER, id}; }
    [[nodiscard]] static LockKey employee(EmployeeId id) noexcept { return {LockDomain::EMPLOYEE, id}; }
    [[nodiscard]] static LockKey shift(ShiftId id) noexcept { return {LockDomain::SHIFT, id}; }
};

//-------------------------------------------------------------------------

/**
 * Row-level locks keyed by entity. Entries exist only while some thread
 * holds or waits for them.
 */
class KeyedLockTable
{
public:
    KeyedLockTable() noexcept = default;
    KeyedLockTable(const KeyedLockTable&) = delete;
    KeyedLockTable& operator=(const KeyedLockTable&) = delete;

    void lock(LockKey key);
    void unlock(LockKey key);

    [[nodiscard]] size_t size() const;

private:
    struct Entry
    {
        std::mutex mtx;
        uint32_t refs{};
    };

    mutable std::mutex m_mtx;
    std::map<LockKey, std::unique_ptr<Entry>> m_entries;
};

//-------------------------------------------------------------------------

class ScopedKeyLock
{
public:
    ScopedKeyLock(KeyedLockTable& table, LockKey key) : m_table{table}, m_key{key}
    {
        m_table.lock(m_key);
    }

    ~ScopedKeyLock() { m_table.unlock(m_key); }

    ScopedKeyLock(const ScopedKeyLock&) = delete;
    ScopedKeyLock& operator=(const ScopedKeyLock&) = delete;

private:
    KeyedLockTable& m_table;
    LockKey m_key;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<cashdesk::store::LockKey>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cashdesk::store::LockKey& key, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}#{}", magic_enum::enum_name(key.domain), key.id);
    }
};

//-------------------------------------------------------------------------
