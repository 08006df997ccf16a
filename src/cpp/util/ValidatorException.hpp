/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace firmquote
{

// Misconfiguration or invalid wiring detected before any quote is validated.
class ValidatorException : public std::runtime_error
{
public:
    explicit ValidatorException(const std::string& message) : std::runtime_error{message} {}
};

}  // namespace firmquote

//-------------------------------------------------------------------------
