/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace gemledger
{

//-------------------------------------------------------------------------

enum class ErrorKind
{
    VALIDATION,
    NOT_FOUND,
    CONFLICT,
    TRANSIENT_STORE
};

//-------------------------------------------------------------------------

class LedgerException : public std::runtime_error
{
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, m_kind{kind}
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

//-------------------------------------------------------------------------
// Rejected before touching the store; never worth retrying.

class ValidationError : public LedgerException
{
public:
    explicit ValidationError(const std::string& message)
        : LedgerException{ErrorKind::VALIDATION, message}
    {}
};

//-------------------------------------------------------------------------

class NotFoundError : public LedgerException
{
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException{ErrorKind::NOT_FOUND, message}
    {}
};

class WalletNotFound : public NotFoundError
{
public:
    using NotFoundError::NotFoundError;
};

class HoldNotFound : public NotFoundError
{
public:
    using NotFoundError::NotFoundError;
};

class IdentityNotFound : public NotFoundError
{
public:
    using NotFoundError::NotFoundError;
};

//-------------------------------------------------------------------------

class ConflictError : public LedgerException
{
public:
    explicit ConflictError(const std::string& message)
        : LedgerException{ErrorKind::CONFLICT, message}
    {}
};

class HoldNotActive : public ConflictError
{
public:
    using ConflictError::ConflictError;
};

class WalletFrozen : public ConflictError
{
public:
    using ConflictError::ConflictError;
};

class InsufficientFunds : public ConflictError
{
public:
    using ConflictError::ConflictError;
};

//-------------------------------------------------------------------------
// Lock wait timeout and the like. The whole call may be retried.

class TransientStoreError : public LedgerException
{
public:
    explicit TransientStoreError(const std::string& message)
        : LedgerException{ErrorKind::TRANSIENT_STORE, message}
    {}
};

//-------------------------------------------------------------------------

}  // namespace gemledger

//-------------------------------------------------------------------------
