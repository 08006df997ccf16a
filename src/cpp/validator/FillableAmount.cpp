/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/validator/FillableAmount.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

FillResult computeFillableAmount(
    const quote::Quote& quote, const std::optional<EffectiveBalance>& balance)
{
    if (!balance.has_value()) {
        return {.amount = quote.takerAssetAmount(), .status = FillStatus::UNKNOWN_MAKER};
    }

    return std::visit(
        [&quote](const auto& bal) -> FillResult {
            using T = std::remove_cvref_t<decltype(bal)>;
            if constexpr (std::same_as<T, Unconstrained>) {
                return {.amount = quote.takerAssetAmount(), .status = FillStatus::FULLY_FILLABLE};
            } else {
                if (bal >= quote.makerAssetAmount()) {
                    return {
                        .amount = quote.takerAssetAmount(),
                        .status = FillStatus::FULLY_FILLABLE
                    };
                }
                if (quote.makerAssetAmount() <= 0) {
                    return {.amount = 0_dec, .status = FillStatus::DEGENERATE_ORDER};
                }
                const decimal_t exact = bal * quote.takerAssetAmount() / quote.makerAssetAmount();
                decimal_t partial = util::trunc(exact);
                if (partial < 0 || partial > quote.takerAssetAmount()) {
                    return {.amount = 0_dec, .status = FillStatus::ARITHMETIC_INCONSISTENCY};
                }
                return {.amount = std::move(partial), .status = FillStatus::PARTIALLY_FILLABLE};
            }
        },
        *balance);
}

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
