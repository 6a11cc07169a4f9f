/*
 * Copyright (C) 2025 Emeric Poupon
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

#include "services/scanner/ScanErrors.hpp"

namespace gamus::scanner
{
    namespace
    {
        class MessageBuilder : public ScanErrorVisitor
        {
        public:
            std::string message;

        private:
            void visit(const ScanError&) override
            {
                message = "unknown error";
            }

            void visit(const IOScanError& error) override
            {
                message = "cannot explore directory: " + error.err.message();
            }

            void visit(const UnreadableFileError& error) override
            {
                message = "unreadable file: " + error.err.message();
            }

            void visit(const UnsupportedFormatError& error) override
            {
                message = "unsupported format: " + error.details;
            }

            void visit(const CorruptStreamError& error) override
            {
                message = "corrupt stream: " + error.details;
            }

            void visit(const PersistenceError& error) override
            {
                message = "cannot save to catalog: " + error.details;
            }
        };
    } // namespace

    std::string ScanError::getMessage() const
    {
        MessageBuilder builder;
        accept(builder);
        return builder.message;
    }
} // namespace gamus::scanner
