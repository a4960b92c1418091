// idpack/system/src/log.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/system/log.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <regex>
#include <thread>

using namespace std;
using namespace std::chrono;

namespace idpack {

std::ostream& operator<<(std::ostream& _ros, const LogLineBase& _line)
{
    return _line.writeTo(_ros);
}

LogLineBase::~LogLineBase() {}

LogRecorder::~LogRecorder() {}

void LogRecorder::recordLine(const LogLineBase& /*_rlog_line*/) {}

void LogStreamRecorder::recordLine(const LogLineBase& _rlog_line)
{
    _rlog_line.writeTo(ros_);
}

namespace {

#ifdef IDPACK_ON_WINDOWS
constexpr const char path_separator = '\\';
#else
constexpr const char path_separator = '/';
#endif

constexpr LogAtomicFlagsBackT flag_bit(const LogFlags _flag)
{
    return 1UL << static_cast<LogAtomicFlagsBackT>(_flag);
}

//! A "<module regex>:<FLAGS>" entry, compiled once per log_start
struct ModuleMask {
    bool                any_module_ = true;
    regex               module_rgx_;
    LogAtomicFlagsBackT or_mask_  = 0;
    LogAtomicFlagsBackT and_mask_ = 0;

    bool matches(const string& _name) const
    {
        return any_module_ || regex_match(_name, module_rgx_);
    }
};

//-----------------------------------------------------------------------------
//  Engine
//-----------------------------------------------------------------------------

class Engine {
    using LoggerVectorT     = std::vector<std::pair<LoggerBase*, const LogCategoryBase*>>;
    using ModuleMaskVectorT = std::vector<ModuleMask>;

    mutex             mtx_;
    LoggerVectorT     logger_vec_;
    vector<string>    mask_txt_vec_;
    LogRecorderPtrT   recorder_ptr_;

public:
    static Engine& the()
    {
        static Engine e;
        return e;
    }

    Engine()
        : recorder_ptr_(std::make_shared<LogRecorder>())
    {
    }

    ~Engine()
    {
        close();
    }

    size_t registerLogger(LoggerBase& _rlg, const LogCategoryBase& _rlc)
    {
        lock_guard<mutex> lock(mtx_);
        logger_vec_.emplace_back(&_rlg, &_rlc);
        remask(logger_vec_.back(), compile(mask_txt_vec_, _rlc));
        return logger_vec_.size() - 1;
    }

    void unregisterLogger(const size_t _idx)
    {
        lock_guard<mutex> lock(mtx_);
        logger_vec_[_idx] = LoggerVectorT::value_type(nullptr, nullptr);
    }

    void log(const LogLineBase& _log_ros)
    {
        lock_guard<mutex> lock(mtx_);
        recorder_ptr_->recordLine(_log_ros);
    }

    ErrorConditionT configure(LogRecorderPtrT&& _recorder_ptr, const std::vector<std::string>& _rmodule_mask_vec)
    {
        lock_guard<mutex> lock(mtx_);
        mask_txt_vec_ = _rmodule_mask_vec;
        for (auto& entry : logger_vec_) {
            if (entry.first != nullptr) {
                remask(entry, compile(mask_txt_vec_, *entry.second));
            }
        }
        recorder_ptr_ = std::move(_recorder_ptr);
        return ErrorConditionT();
    }

    void close()
    {
        lock_guard<mutex> lock(mtx_);
        mask_txt_vec_.clear();
        for (auto& entry : logger_vec_) {
            if (entry.first != nullptr) {
                entry.first->remask(0);
            }
        }
        recorder_ptr_ = std::make_shared<LogRecorder>();
    }

private:
    static ModuleMaskVectorT compile(const vector<string>& _rmask_txt_vec, const LogCategoryBase& _rlc)
    {
        ModuleMaskVectorT mask_vec;
        mask_vec.reserve(_rmask_txt_vec.size());

        for (const auto& txt : _rmask_txt_vec) {
            ModuleMask   mask;
            const size_t off = txt.rfind(':');
            if (off != string::npos && off != 0) {
                mask.any_module_ = false;
                mask.module_rgx_ = regex(txt.substr(0, off));
            }
            _rlc.parse(mask.or_mask_, mask.and_mask_, off == string::npos ? txt : txt.substr(off + 1));
            mask_vec.emplace_back(std::move(mask));
        }
        return mask_vec;
    }

    static void remask(LoggerVectorT::value_type& _rentry, const ModuleMaskVectorT& _rmask_vec)
    {
        LogAtomicFlagsBackT or_mask  = 0;
        LogAtomicFlagsBackT and_mask = 0;

        for (const auto& mask : _rmask_vec) {
            if (mask.matches(_rentry.first->name())) {
                or_mask |= mask.or_mask_;
                and_mask |= mask.and_mask_;
            }
        }
        _rentry.first->remask(or_mask & ~and_mask);
    }
};

const char* src_file_name(char const* _fname)
{
    const char* file_name = strrchr(_fname, path_separator);
    return file_name != nullptr ? file_name + 1 : _fname;
}

//! Local time as "YYYY-MM-DD hh:mm:ss.mmm"
void write_time(std::ostream& _ros, const system_clock::time_point& _now)
{
    const time_t t_now = system_clock::to_time_t(_now);
    tm           loctm;
#ifdef IDPACK_ON_WINDOWS
    localtime_s(&loctm, &t_now);
#else
    localtime_r(&t_now, &loctm);
#endif
    char buf[32];
    snprintf(
        buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03u",
        loctm.tm_year + 1900, loctm.tm_mon + 1, loctm.tm_mday,
        loctm.tm_hour, loctm.tm_min, loctm.tm_sec,
        static_cast<unsigned>(time_point_cast<milliseconds>(_now).time_since_epoch().count() % 1000));
    _ros << buf;
}

struct FlagLetter {
    char     letter_;
    LogFlags flag_;
};

constexpr FlagLetter flag_letters[] = {
    {'V', LogFlags::Verbose},
    {'I', LogFlags::Info},
    {'W', LogFlags::Warning},
    {'E', LogFlags::Error},
    {'X', LogFlags::Exception},
    {'S', LogFlags::Statistic},
    {'R', LogFlags::Raw},
};

} // namespace

//-----------------------------------------------------------------------------
//  LogCategory
//-----------------------------------------------------------------------------

/*virtual*/ LogCategoryBase::~LogCategoryBase() {}

/*static*/ const LogCategory& LogCategory::the()
{
    static const LogCategory lc;
    return lc;
}

// upper case letters enable a level, lower case ones disable it
void LogCategory::parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const
{
    for (const char c : _txt) {
        const char upper = static_cast<char>(toupper(static_cast<unsigned char>(c)));
        for (const auto& fl : flag_letters) {
            if (fl.letter_ == upper) {
                (upper == c ? _ror_flags : _rand_flags) |= flag_bit(fl.flag_);
                break;
            }
        }
    }
}

LoggerBase::LoggerBase(const std::string& _name, const LogCategoryBase& _rlc)
    : name_(_name)
    , flags_(0)
    , idx_(Engine::the().registerLogger(*this, _rlc))
{
}

LoggerBase::~LoggerBase()
{
    flags_ = 0;
    Engine::the().unregisterLogger(idx_);
}

std::ostream& LoggerBase::doLog(std::ostream& _ros, const char* _flag_name, const char* _file, const char* _fnc, int _line) const
{
    _ros << _flag_name << '[';
    write_time(_ros, system_clock::now());
    _ros << "][" << name_ << "][" << src_file_name(_file) << ':' << _line << ' ' << _fnc << ']';
    return _ros << "[0x" << std::hex << std::this_thread::get_id() << std::dec << "] ";
}

void LoggerBase::doDone(const LogLineBase& _log_ros) const
{
    Engine::the().log(_log_ros);
}

//-----------------------------------------------------------------------------
//  log_start
//-----------------------------------------------------------------------------
const LoggerT generic_logger{"*"};

void log_stop()
{
    Engine::the().close();
}

ErrorConditionT log_start(LogRecorderPtrT&& _rec_ptr, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::move(_rec_ptr), _rmodule_mask_vec);
}

ErrorConditionT log_start(std::ostream& _ros, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::make_shared<LogStreamRecorder>(_ros), _rmodule_mask_vec);
}

} // namespace idpack
