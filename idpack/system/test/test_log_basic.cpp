#include "idpack/system/exception.hpp"
#include "idpack/system/log.hpp"
#include <iostream>
#include <memory>
#include <sstream>

using namespace std;

namespace {
idpack::LoggerT logger{"test"};
idpack::LoggerT other_logger{"other::module"};

struct CountingRecorder : idpack::LogRecorder {
    size_t count_ = 0;

    void recordLine(const idpack::LogLineBase& /*_rlog_line*/) override
    {
        ++count_;
    }
};
} // namespace

int test_log_basic(int argc, char* argv[])
{
    {
        ostringstream oss;

        idpack::log_start(oss, {".*:VIEW"});

        idpack_log(idpack::generic_logger, Info, "First line of log: " << argc << " " << argv[0]);
        idpack_log(logger, Verbose, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        idpack_check(!s.empty(), "no log");
        idpack_check(s.find("Second line of log") != string::npos, "missing verbose line");
        idpack_check(s.find("[test]") != string::npos, "missing module name");
        cout.write(s.data(), s.size());
    }

    {
        ostringstream oss;

        idpack::log_start(oss, {".*:VI"});

        idpack_log(idpack::generic_logger, Error, "First line of log: " << argc << " " << argv[0]);
        idpack_log(logger, Warning, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        idpack_check(s.empty(), "some log");
    }

    {
        ostringstream oss;

        idpack::log_start(oss, {".*:VIEW", "test:v"});

        idpack_log(idpack::generic_logger, Info, "First line of log: " << argc << " " << argv[0]);
        idpack_log(logger, Verbose, "HIDDEN - Second line of log: " << argc << ' ' << argv[0]);
        idpack_log(logger, Info, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        idpack_check(!s.empty(), "no log");
        idpack_check(s.find("HIDDEN") == string::npos, "found HIDDEN");
        cout.write(s.data(), s.size());
    }

    {
        ostringstream oss;

        idpack::log_start(oss, {"other::.*:E"});

        idpack_log(logger, Error, "HIDDEN - not matching module");
        idpack_log(other_logger, Error, "matching module");

        string s{oss.str()};
        idpack_check(s.find("HIDDEN") == string::npos, "found HIDDEN");
        idpack_check(s.find("matching module") != string::npos, "no log");
        idpack_check(s.compare(0, 2, "E[") == 0, "bad line prefix: " << s);
    }

    {
        auto recorder_ptr = std::make_shared<CountingRecorder>();

        idpack::log_start(idpack::LogRecorderPtrT(recorder_ptr), {"test:W"});

        idpack_log(logger, Warning, "counted");
        idpack_log(logger, Error, "HIDDEN - not counted");
        idpack_log(other_logger, Warning, "HIDDEN - not counted");
        idpack_check(recorder_ptr->count_ == 1, "counted " << recorder_ptr->count_);
    }

    {
        ostringstream oss;

        idpack::log_start(oss, {".*:VIEWX"});
        idpack::log_stop();

        idpack_log(logger, Error, "HIDDEN - after stop");
        idpack_check(oss.str().empty(), "log after stop");
    }
    return 0;
}
