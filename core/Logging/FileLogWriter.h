/* GemRB - Infinity Engine Emulator
 * Copyright (C) 2003 The GemRB Project
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301, USA.
 *
 *
 */

/**
 * @file FileLogWriter.h
 * @author The GemRB Project
 * @note adapted for lvtiles
 */

#pragma once

#include "Logger.h"
#include <filesystem>
#include <fstream>

namespace LvTiles {

class FileLogWriter : public LogWriter {
private:
    std::ofstream logFile;
    std::mutex fileMutex;

public:
    explicit FileLogWriter(const std::filesystem::path& path, LogLevel level = DEBUG);
    ~FileLogWriter() override;

    bool isOpen() const { return logFile.is_open(); }

    void WriteLogMessage(const LogMessage& msg) override;
    void Flush() override;

private:
    std::string getCurrentTimestamp() const;
};

} // namespace LvTiles
