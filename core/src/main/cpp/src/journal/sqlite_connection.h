/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Burrow project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace burrow {
    namespace journal {

        class Connection;

        /**
         * Prepared statement. Errors throw JournalError, or
         * ConcurrencyViolationError when the database is locked by another
         * connection.
         */
        class Statement {
        public:
            ~Statement();

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            // Parameter indices are 1-based
            void bind(int idx, int64_t v);
            void bind(int idx, const std::string& v);
            void bind_blob(int idx, const std::vector<uint8_t>& v);

            // true while a row is available
            bool step();

            // step() until done; for statements returning no rows
            void execute();

            // Rewinds and clears bindings for the next execution
            void reset();

            int64_t column_int64(int col) const;
            std::string column_text(int col) const;
            std::vector<uint8_t> column_blob(int col) const;

        private:
            friend class Connection;
            Statement(sqlite3* db, const std::string& sql);

            sqlite3* db_;
            sqlite3_stmt* stmt_;
            std::string sql_;
        };

        /**
         * One SQLite database connection with JDBC-like transaction control:
         * with auto-commit off every statement joins one open transaction
         * until commit() or rollback(), and turning auto-commit back on
         * commits whatever is still open.
         */
        class Connection {
        public:
            Connection(const std::string& path, int busy_timeout_ms);
            ~Connection();

            Connection(const Connection&) = delete;
            Connection& operator=(const Connection&) = delete;

            void exec(const std::string& sql);
            std::unique_ptr<Statement> prepare(const std::string& sql);

            bool auto_commit() const { return auto_commit_; }
            void set_auto_commit(bool on);
            void commit();
            void rollback();

            // Case-insensitive lookup in sqlite_master
            bool table_exists(const std::string& name);

            const std::string& path() const { return path_; }

        private:
            bool in_transaction() const;

            sqlite3* db_ = nullptr;
            std::string path_;
            bool auto_commit_ = true;
        };

        // Throws the journal error matching rc
        [[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, const std::string& what);

    }
}
