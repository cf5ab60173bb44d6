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
#include <memory>
#include <string>
#include <vector>
#include "journal.h"
#include "journal_config.h"
#include "sqlite_connection.h"

namespace burrow {
    namespace journal {

        /**
         * Journal kept in two tables of a relational database:
         *
         *   <prefix>JOURNAL(REVISION_ID, JOURNAL_ID, PRODUCER_ID, REVISION_DATA)
         *   <prefix>GLOBAL_REVISION(revision_id)     single row
         *
         * Locking increments the global revision inside a transaction and
         * reads it back; the pending write keeps every other member out
         * until the transaction ends. Missing tables are created on init
         * from a DDL script.
         */
        class DatabaseJournal : public Journal {
        public:
            static constexpr const char* kSchemaObjectPrefixVariable = "${schemaObjectPrefix}";
            static constexpr const char* kDefaultDdlName = "default.ddl";

            explicit DatabaseJournal(const JournalConfig& config);
            ~DatabaseJournal() override;

            // Throws JournalError when the configuration is unusable or the database unreachable
            void init() override;
            void close() override;

            std::unique_ptr<RecordIterator> get_records(int64_t start) override;

            // Current value of the global revision counter
            int64_t global_revision();

            const std::string& schema() const { return schema_; }
            const std::string& schema_object_prefix() const { return prefix_; }

            // Built-in DDL used when no script is found under ddl_path
            static const char* default_ddl();

        protected:
            int64_t do_lock() override;
            void do_append(const Record& record) override;
            void do_unlock(bool successful) override;

        private:
            void check_schema();
            std::vector<std::string> load_ddl();
            void prepare_statements();
            void rollback_quietly();
            void restore_auto_commit();

            JournalConfig config_;
            std::string schema_;
            std::string prefix_;
            std::unique_ptr<Connection> con_;
            std::unique_ptr<Statement> update_global_stmt_;
            std::unique_ptr<Statement> select_global_stmt_;
            std::unique_ptr<Statement> insert_revision_stmt_;
        };

        /**
         * Cursor over the rows of one get_records() query. Holds its own
         * statement, so it stays valid while the journal appends.
         */
        class DatabaseRecordIterator : public RecordIterator {
        public:
            explicit DatabaseRecordIterator(std::unique_ptr<Statement> stmt);

            bool has_next() override;
            Record next() override;

        private:
            std::unique_ptr<Statement> stmt_;
            bool fetched_ = false;
            bool done_ = false;
        };

    }
}
