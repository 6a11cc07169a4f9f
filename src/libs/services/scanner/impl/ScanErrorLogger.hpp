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

#include "services/scanner/ScanErrors.hpp"

namespace gamus::scanner
{
    class ScanErrorLogger : public ScanErrorVisitor
    {
    private:
        void visit(const ScanError&) override;
        void visit(const IOScanError& error) override;
        void visit(const UnreadableFileError& error) override;
        void visit(const UnsupportedFormatError& error) override;
        void visit(const CorruptStreamError& error) override;
        void visit(const PersistenceError& error) override;
    };
} // namespace gamus::scanner
