/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/report/ShiftReport.hpp"
#include "cashdesk/service/LedgerContext.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

class StatisticsEngine
{
public:
    explicit StatisticsEngine(const LedgerContext& ctx) noexcept;

    /**
     * X-report of the committed state of the shift. Pure read.
     *
     * @throws ledger::LedgerError with SHIFT_NOT_FOUND.
     */
    [[nodiscard]] report::ShiftReport compute(ShiftId shiftId) const;

    [[nodiscard]] static report::ShiftReport compute(const store::ShiftSnapshot& snapshot);

private:
    const LedgerContext& m_ctx;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
