// snapframe/system/src/log.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/system/log.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <thread>

using namespace std;
using namespace std::chrono;

namespace snapframe {

namespace {

enum {
    ErrorMaskE = 1,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "snapframe::log";
    }
    std::string message(int _ev) const override;
};

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case ErrorMaskE:
        oss << "Invalid logger name pattern";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

const ErrorCategory category;

//-----------------------------------------------------------------------------
//  Engine
//-----------------------------------------------------------------------------

class Engine {
    struct Rule {
        std::optional<std::regex> name_rgx_; // empty matches every logger
        LogMaskToggle             toggle_;
    };

    using RuleVectorT   = std::vector<Rule>;
    using LoggerVectorT = std::vector<Logger*>;

    mutex           mtx_;
    RuleVectorT     rule_vec_;
    LoggerVectorT   logger_vec_;
    LogRecorderPtrT recorder_ptr_;

public:
    static Engine& the()
    {
        static Engine e;
        return e;
    }

    void attach(Logger& _rlgr);
    void detach(Logger& _rlgr);

    void record(std::string_view _line);

    ErrorConditionT configure(LogRecorderPtrT&& _recorder_ptr, const std::vector<std::string>& _rmodule_mask_vec);

    void stop();

private:
    LogMaskT doMask(const std::string& _name) const;
};

void Engine::attach(Logger& _rlgr)
{
    lock_guard<mutex> lock(mtx_);
    logger_vec_.push_back(&_rlgr);
    _rlgr.remask(doMask(_rlgr.name()));
}

void Engine::detach(Logger& _rlgr)
{
    lock_guard<mutex> lock(mtx_);
    logger_vec_.erase(std::remove(logger_vec_.begin(), logger_vec_.end(), &_rlgr), logger_vec_.end());
}

void Engine::record(std::string_view _line)
{
    lock_guard<mutex> lock(mtx_);
    if (recorder_ptr_) {
        recorder_ptr_->recordLine(_line);
    }
}

ErrorConditionT Engine::configure(LogRecorderPtrT&& _recorder_ptr, const std::vector<std::string>& _rmodule_mask_vec)
{
    RuleVectorT rule_vec;
    rule_vec.reserve(_rmodule_mask_vec.size());

    for (const auto& msk_str : _rmodule_mask_vec) {
        Rule         rule;
        const size_t off = msk_str.rfind(':');
        if (off == std::string::npos) {
            rule.toggle_ = LogMaskToggle::parse(msk_str);
        } else {
            try {
                rule.name_rgx_.emplace(msk_str.substr(0, off));
            } catch (const std::regex_error&) {
                return error_log_mask;
            }
            rule.toggle_ = LogMaskToggle::parse(std::string_view(msk_str).substr(off + 1));
        }
        rule_vec.push_back(std::move(rule));
    }

    lock_guard<mutex> lock(mtx_);
    rule_vec_     = std::move(rule_vec);
    recorder_ptr_ = std::move(_recorder_ptr);
    for (auto* plgr : logger_vec_) {
        plgr->remask(doMask(plgr->name()));
    }
    return ErrorConditionT();
}

void Engine::stop()
{
    lock_guard<mutex> lock(mtx_);
    rule_vec_.clear();
    recorder_ptr_.reset();
    for (auto* plgr : logger_vec_) {
        plgr->remask(0);
    }
}

LogMaskT Engine::doMask(const std::string& _name) const
{
    LogMaskToggle toggle;
    for (const auto& rule : rule_vec_) {
        if (!rule.name_rgx_ || regex_match(_name, *rule.name_rgx_)) {
            toggle += rule.toggle_;
        }
    }
    return toggle.mask();
}

const char* src_file_name(const char* _fname)
{
    const char* pslash = strrchr(_fname, '/');
#ifdef SNAPFRAME_ON_WINDOWS
    const char* pbackslash = strrchr(_fname, '\\');
    if (pbackslash != nullptr && (pslash == nullptr || pbackslash > pslash)) {
        pslash = pbackslash;
    }
#endif
    return pslash != nullptr ? pslash + 1 : _fname;
}

} // namespace

/*extern*/ const ErrorConditionT error_log_mask(ErrorMaskE, category);

char log_flag_letter(const LogFlags _flag)
{
    switch (_flag) {
    case LogFlags::Verbose:
        return 'V';
    case LogFlags::Info:
        return 'I';
    case LogFlags::Warning:
        return 'W';
    case LogFlags::Error:
        return 'E';
    case LogFlags::Exception:
        return 'X';
    case LogFlags::LastFlag:
        break;
    }
    return '?';
}

/*static*/ LogMaskToggle LogMaskToggle::parse(std::string_view _txt)
{
    LogMaskToggle toggle;
    for (const char c : _txt) {
        for (uint8_t i = 0; i < static_cast<uint8_t>(LogFlags::LastFlag); ++i) {
            const LogFlags flag   = static_cast<LogFlags>(i);
            const char     letter = log_flag_letter(flag);
            if (c == letter) {
                toggle.enable |= log_flag_bit(flag);
            } else if (c == letter - 'A' + 'a') {
                toggle.disable |= log_flag_bit(flag);
            }
        }
    }
    return toggle;
}

//-----------------------------------------------------------------------------
//  Logger
//-----------------------------------------------------------------------------

Logger::Logger(std::string _name)
    : name_(std::move(_name))
    , mask_(0)
{
    Engine::the().attach(*this);
}

Logger::~Logger()
{
    Engine::the().detach(*this);
}

std::ostream& Logger::begin(std::ostream& _ros, const LogFlags _flag, const char* _file, const char* _fnc, const int _line) const
{
    const auto now   = system_clock::now();
    time_t     t_now = system_clock::to_time_t(now);
    tm         loctm;
#ifdef SNAPFRAME_ON_WINDOWS
    localtime_s(&loctm, &t_now);
#else
    localtime_r(&t_now, &loctm);
#endif
    char buf[64];
    snprintf(
        buf, sizeof(buf),
        "%c[%04d-%02d-%02d %02d:%02d:%02d.%03u]",
        log_flag_letter(_flag),
        loctm.tm_year + 1900,
        loctm.tm_mon + 1,
        loctm.tm_mday,
        loctm.tm_hour,
        loctm.tm_min,
        loctm.tm_sec,
        static_cast<unsigned>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000));

    return _ros << buf << '[' << name_ << "][" << src_file_name(_file) << ':' << _line << ' ' << _fnc << "][" << std::this_thread::get_id() << "] ";
}

void Logger::commit(std::string_view _line) const
{
    Engine::the().record(_line);
}

//-----------------------------------------------------------------------------
//  Recorders
//-----------------------------------------------------------------------------

LogRecorder::~LogRecorder() {}

void LogStreamRecorder::recordLine(std::string_view _line)
{
    ros_.write(_line.data(), static_cast<std::streamsize>(_line.size()));
}

//-----------------------------------------------------------------------------
//  log_start / log_stop
//-----------------------------------------------------------------------------

ErrorConditionT log_start(LogRecorderPtrT&& _rec_ptr, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::move(_rec_ptr), _rmodule_mask_vec);
}

ErrorConditionT log_start(std::ostream& _ros, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::make_shared<LogStreamRecorder>(_ros), _rmodule_mask_vec);
}

void log_stop()
{
    Engine::the().stop();
}

} // namespace snapframe
