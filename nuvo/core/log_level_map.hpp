// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <nuvo/core/config.hpp>

#include <quill/LogLevel.h>

#include <map>
#include <string>

NUVO_NAMESPACE_BEGIN

// Names accepted by --log_level. "info" reports every settled operation,
// "debug" adds skipped batch entries and rolled-back operations.
inline std::map<std::string, quill::LogLevel> const log_level_map = {
    {"debug", quill::LogLevel::Debug},
    {"verbose", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warning", quill::LogLevel::Warning},
    {"warn", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"quiet", quill::LogLevel::Error},
    {"none", quill::LogLevel::None}};

NUVO_NAMESPACE_END
