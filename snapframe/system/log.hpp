// snapframe/system/log.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/system/common.hpp"
#include "snapframe/system/error.hpp"
#include <atomic>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

namespace snapframe {

enum struct LogFlags : uint8_t {
    Verbose,
    Info,
    Warning,
    Error,
    Exception,
    LastFlag
};

using LogMaskT = uint32_t;

constexpr LogMaskT log_flag_bit(const LogFlags _flag)
{
    return LogMaskT(1) << static_cast<unsigned>(_flag);
}

char log_flag_letter(LogFlags _flag);

//! Flags enabled and disabled by a mask text like "VIEW" or "ve"
/*!
    An upper case letter enables its flag, a lower case one disables it.
    Letters: V(erbose), I(nfo), W(arning), E(rror), (e)X(ception).
*/
struct LogMaskToggle {
    LogMaskT enable  = 0;
    LogMaskT disable = 0;

    static LogMaskToggle parse(std::string_view _txt);

    LogMaskToggle& operator+=(const LogMaskToggle& _other)
    {
        enable |= _other.enable;
        disable |= _other.disable;
        return *this;
    }

    LogMaskT mask() const
    {
        return enable & ~disable;
    }
};

//! One log line built in place, spilling to the heap past Capacity
template <size_t Capacity>
class LogLineStream : public std::ostream {
    class Buffer : public std::streambuf {
        char        fixed_[Capacity];
        std::string spill_;

    public:
        Buffer()
        {
            setp(fixed_, fixed_ + Capacity);
        }

        std::string_view view()
        {
            if (spill_.empty()) {
                return std::string_view(pbase(), static_cast<size_t>(pptr() - pbase()));
            }
            doSpill();
            return spill_;
        }

    protected:
        int_type overflow(const int_type _c) override
        {
            doSpill();
            if (!traits_type::eq_int_type(_c, traits_type::eof())) {
                spill_ += traits_type::to_char_type(_c);
            }
            return traits_type::not_eof(_c);
        }

    private:
        void doSpill()
        {
            spill_.append(pbase(), pptr());
            setp(fixed_, fixed_ + Capacity);
        }
    } buf_;

public:
    LogLineStream()
        : std::ostream(nullptr)
    {
        rdbuf(&buf_);
    }

    std::string_view view()
    {
        return buf_.view();
    }
};

//! Named log source, masked by log_start
class Logger : NonCopyable {
    const std::string             name_;
    mutable std::atomic<LogMaskT> mask_;

public:
    explicit Logger(std::string _name);
    ~Logger();

    const std::string& name() const
    {
        return name_;
    }

    LogMaskT mask() const
    {
        return mask_.load(std::memory_order_relaxed);
    }

    void remask(const LogMaskT _mask) const
    {
        mask_.store(_mask, std::memory_order_relaxed);
    }

    bool shouldLog(const LogFlags _flag) const
    {
        return (mask() & log_flag_bit(_flag)) != 0;
    }

    //! Writes the line prefix: flag, time, logger name, source location, thread
    std::ostream& begin(std::ostream& _ros, LogFlags _flag, const char* _file, const char* _fnc, int _line) const;

    void commit(std::string_view _line) const;
};

using LoggerT = Logger;

struct LogRecorder : NonCopyable {
    virtual ~LogRecorder();

    //! Called under the engine lock with one complete line
    virtual void recordLine(std::string_view _line) = 0;
};

class LogStreamRecorder : public LogRecorder {
    std::ostream& ros_;

public:
    explicit LogStreamRecorder(std::ostream& _ros)
        : ros_(_ros)
    {
    }

    void recordLine(std::string_view _line) override;
};

using LogRecorderPtrT = std::shared_ptr<LogRecorder>;

//! Route lines to _rec_ptr; each mask is "<logger name regex>:<flags>" or "<flags>"
/*!
    Returns error_log_mask, and leaves the current configuration in place,
    when a logger name pattern is not a valid regular expression.
*/
ErrorConditionT log_start(
    LogRecorderPtrT&&               _rec_ptr,
    const std::vector<std::string>& _rmodule_mask_vec);

ErrorConditionT log_start(
    std::ostream&                   _ros,
    const std::vector<std::string>& _rmodule_mask_vec);

//! Drop the recorder and mask every logger out
void log_stop();

extern const ErrorConditionT error_log_mask;

} // namespace snapframe

#ifndef SNAPFRAME_LOG_LINE_CAPACITY
#define SNAPFRAME_LOG_LINE_CAPACITY 512
#endif

#define snapframe_log(Lgr, Flg, Txt)                                                                                              \
    if (Lgr.shouldLog(snapframe::LogFlags::Flg)) {                                                                                \
        snapframe::LogLineStream<SNAPFRAME_LOG_LINE_CAPACITY> snapframe_log_line;                                                 \
        Lgr.begin(snapframe_log_line, snapframe::LogFlags::Flg, __FILE__, static_cast<const char*>(SNAPFRAME_FUNCTION_NAME), __LINE__) \
            << Txt << '\n';                                                                                                       \
        Lgr.commit(snapframe_log_line.view());                                                                                    \
    }
