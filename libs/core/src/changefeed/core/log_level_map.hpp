#pragma once

#include <changefeed/config.hpp>

#include <quill/LogLevel.h>

#include <map>
#include <string>

CHANGEFEED_NAMESPACE_BEGIN

inline std::map<std::string, quill::LogLevel> const log_level_map = {
    {"tracel3", quill::LogLevel::TraceL3},
    {"tracel2", quill::LogLevel::TraceL2},
    {"tracel1", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"critical", quill::LogLevel::Critical},
    {"backtrace", quill::LogLevel::Backtrace},
    {"none", quill::LogLevel::None},
    {"dynamic", quill::LogLevel::Dynamic}};

CHANGEFEED_NAMESPACE_END
