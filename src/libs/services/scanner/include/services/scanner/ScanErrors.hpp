/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of Gamus.
 *
 * Gamus is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Gamus is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Gamus.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace gamus::scanner
{
    // Forward declarations of all error types
    struct ScanError;
    struct IOScanError;
    struct UnreadableFileError;
    struct UnsupportedFormatError;
    struct CorruptStreamError;
    struct PersistenceError;

    // Visitor interface
    struct ScanErrorVisitor
    {
        virtual ~ScanErrorVisitor() = default;

        virtual void visit(const ScanError&) = 0;
        virtual void visit(const IOScanError&) = 0;
        virtual void visit(const UnreadableFileError&) = 0;
        virtual void visit(const UnsupportedFormatError&) = 0;
        virtual void visit(const CorruptStreamError&) = 0;
        virtual void visit(const PersistenceError&) = 0;
    };

    struct ScanError
    {
        ScanError(const std::filesystem::path& p)
            : path{ p } {}
        virtual ~ScanError() = default;
        virtual void accept(ScanErrorVisitor&) const = 0;

        // Human readable description, used as the import error payload
        std::string getMessage() const;

        std::filesystem::path path; // Error that occurs on this path
    };

    // Directory that cannot be explored
    struct IOScanError : public ScanError
    {
        IOScanError(const std::filesystem::path& p, std::error_code e)
            : ScanError{ p }
            , err{ e } {}

        void accept(ScanErrorVisitor& visitor) const override
        {
            visitor.visit(*this);
        }

        std::error_code err;
    };

    struct UnreadableFileError : public IOScanError
    {
        using IOScanError::IOScanError;

        void accept(ScanErrorVisitor& visitor) const override
        {
            visitor.visit(*this);
        }
    };

    struct UnsupportedFormatError : public ScanError
    {
        UnsupportedFormatError(const std::filesystem::path& p, std::string_view d)
            : ScanError{ p }
            , details{ d } {}

        void accept(ScanErrorVisitor& visitor) const override
        {
            visitor.visit(*this);
        }

        std::string details;
    };

    struct CorruptStreamError : public ScanError
    {
        CorruptStreamError(const std::filesystem::path& p, std::string_view d)
            : ScanError{ p }
            , details{ d } {}

        void accept(ScanErrorVisitor& visitor) const override
        {
            visitor.visit(*this);
        }

        std::string details;
    };

    // Transaction failure for one file, rolled back
    struct PersistenceError : public ScanError
    {
        PersistenceError(const std::filesystem::path& p, std::string_view d)
            : ScanError{ p }
            , details{ d } {}

        void accept(ScanErrorVisitor& visitor) const override
        {
            visitor.visit(*this);
        }

        std::string details;
    };
} // namespace gamus::scanner
