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

#include "log.h"
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace burrow {

    /**
     * Routes the Logger output into <logdir>/burrow.log. rotate() renames the
     * current file to a timestamped name and reopens the original path.
     */
    class LogManager {
    public:
        static constexpr const char* kLogFileName = "burrow.log";

        explicit LogManager(const string& logdir, bool append = true)
            : _path((boost::filesystem::path(logdir) / kLogFileName).string()),
              _append(append), _file(nullptr) {
            boost::system::error_code ec;
            boost::filesystem::create_directories(logdir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());
            }
            if (boost::filesystem::is_directory(_path)) {
                throw std::runtime_error("logpath [" + _path + "] should be a file name not a directory");
            }
            open();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        /**
         * Renames the open log file to <path>.<timestamp> and starts a fresh one.
         * Returns the name the old file was moved to.
         */
        string rotate() {
            stringstream ss;
            ss << _path << "." << terseCurrentTime();
            string rotated = ss.str();

            boost::system::error_code ec;
            boost::filesystem::rename(_path, rotated, ec);
            if (ec) {
                throw std::runtime_error("can't rotate log file [" + _path + "]: " + ec.message());
            }
            open();
            return rotated;
        }

    private:
        static string terseCurrentTime() {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return buf;
        }

        void open() {
            bool exists = boost::filesystem::exists(_path);
            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if (!tmp) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }
            if (_append && exists) {
                const string msg = "\n\n***** LOG REOPENED *****\n\n";
                if (fwrite(msg.data(), 1, msg.size(), tmp) != msg.size()) {
                    cerr << "can't write to log file " << _path << ": " << errnoWithDescription() << endl;
                }
            }

            // after this point no thread will be using the old file
            Logger::setLogFile(tmp);
            if (_file) {
                fclose(_file);
            }
            _file = tmp;
        }

        string _path;
        bool _append;
        FILE* _file;
    };
}
