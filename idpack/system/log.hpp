// idpack/system/log.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/system/common.hpp"
#include "idpack/system/error.hpp"
#include <atomic>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace idpack {

using LogAtomicFlagsBackT = unsigned long;
using LogAtomicFlagsT     = std::atomic<LogAtomicFlagsBackT>;

enum struct LogFlags : LogAtomicFlagsBackT {
    Verbose,
    Info,
    Warning,
    Error,
    Exception,
    Statistic,
    Raw,
    LastFlag
};

struct LogCategoryBase {
    virtual ~LogCategoryBase();

    virtual void parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const = 0;
};

struct LogCategory : public LogCategoryBase {
    static const LogCategory& the();

    //! One letter per level, the same letters select levels in log_start masks
    const char* flagName(const LogFlags _flag) const
    {
        static const char* const names[] = {"V", "I", "W", "E", "X", "S", "R"};
        return _flag < LogFlags::LastFlag ? names[static_cast<size_t>(_flag)] : "?";
    }

private:
    void parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const override;
};

struct LogLineBase {
    virtual ~LogLineBase();
    virtual std::ostream& writeTo(std::ostream&) const = 0;
};

namespace impl {

class LogLineStream : public std::ostringstream, public LogLineBase {
public:
    std::ostream& writeTo(std::ostream& _ros) const override
    {
        return _ros << str();
    }
};

} //namespace impl

std::ostream& operator<<(std::ostream& _ros, const LogLineBase& _line);

class LoggerBase : NonCopyable {
    const std::string name_;
    LogAtomicFlagsT   flags_;
    const size_t      idx_;

protected:
    LoggerBase(const std::string& _name, const LogCategoryBase& _rlc);
    ~LoggerBase();

    std::ostream& doLog(std::ostream& _ros, const char* _flag_name, const char* _file, const char* _fnc, int _line) const;
    void          doDone(const LogLineBase& _log_ros) const;

public:
    const std::string& name() const
    {
        return name_;
    }
    void remask(const LogAtomicFlagsBackT _msk)
    {
        flags_.store(_msk);
    }
    LogAtomicFlagsBackT flags() const
    {
        return flags_.load(std::memory_order_relaxed);
    }
};

template <class Flgs = LogFlags, class LogCat = LogCategory>
class Logger : protected LoggerBase {
    const LogCat& rcat_;

public:
    using FlagT = Flgs;

    Logger(const std::string& _name)
        : LoggerBase(_name, LogCat::the())
        , rcat_(LogCat::the())
    {
    }

    using LoggerBase::name;

    bool shouldLog(const FlagT _flag) const
    {
        return (flags() & (1UL << static_cast<size_t>(_flag))) != 0;
    }

    std::ostream& log(std::ostream& _ros, const FlagT _flag, const char* _file, const char* _fnc, int _line) const
    {
        return this->doLog(_ros, rcat_.flagName(_flag), _file, _fnc, _line);
    }
    void done(const LogLineBase& _log_ros) const
    {
        doDone(_log_ros);
    }
};

using LoggerT = Logger<>;

extern const LoggerT generic_logger;

void log_stop();

struct LogRecorder : NonCopyable {
    virtual ~LogRecorder();

    virtual void recordLine(const LogLineBase& /*_rlog_line*/);
};

struct LogStreamRecorder : LogRecorder {
    std::ostream& ros_;
    LogStreamRecorder(std::ostream& _ros)
        : ros_(_ros)
    {
    }

    void recordLine(const LogLineBase& _rlog_line) override;
};

using LogRecorderPtrT = std::shared_ptr<LogRecorder>;

ErrorConditionT log_start(
    LogRecorderPtrT&&               _rec_ptr,
    const std::vector<std::string>& _rmodule_mask_vec);

ErrorConditionT log_start(
    std::ostream&                   _ros,
    const std::vector<std::string>& _rmodule_mask_vec);

} //namespace idpack

#ifdef IDPACK_HAS_DEBUG

#define idpack_dbg(Lgr, Flg, Txt)                                                                                                         \
    if (Lgr.shouldLog(std::decay_t<decltype(Lgr)>::FlagT::Flg)) {                                                                         \
        idpack::impl::LogLineStream os;                                                                                                   \
        Lgr.log(os, std::decay_t<decltype(Lgr)>::FlagT::Flg, __FILE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)), __LINE__) << Txt << std::endl; \
        Lgr.done(os);                                                                                                                     \
    }

#else

#define idpack_dbg(...)

#endif

#define idpack_log(Lgr, Flg, Txt)                                                                                                         \
    if (Lgr.shouldLog(std::decay_t<decltype(Lgr)>::FlagT::Flg)) {                                                                         \
        idpack::impl::LogLineStream os;                                                                                                   \
        Lgr.log(os, std::decay_t<decltype(Lgr)>::FlagT::Flg, __FILE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)), __LINE__) << Txt << std::endl; \
        Lgr.done(os);                                                                                                                     \
    }
