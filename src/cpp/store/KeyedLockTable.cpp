/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/store/KeyedLockTable.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

void KeyedLockTable::lock(LockKey key)
{
    Entry* entry = [&] {
        std::lock_guard lock{m_mtx};
        auto& slot = m_entries[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        ++slot->refs;
        return slot.get();
    }();
    entry->mtx.lock();
}

//-------------------------------------------------------------------------

void KeyedLockTable::unlock(LockKey key)
{
    std::lock_guard lock{m_mtx};
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        throw std::logic_error{fmt::format(
            "{}: Unlocking {} which is not locked",
            std::source_location::current().function_name(), key)};
    }
    it->second->mtx.unlock();
    if (--it->second->refs == 0) {
        m_entries.erase(it);
    }
}

//-------------------------------------------------------------------------

size_t KeyedLockTable::size() const
{
    std::lock_guard lock{m_mtx};
    return m_entries.size();
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------
