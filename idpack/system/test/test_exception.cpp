#include "idpack/system/cassert.hpp"
#include "idpack/system/exception.hpp"
#include <iostream>
#include <sstream>

using namespace std;
namespace {

class ErrorCategory : public idpack::ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "test";
    }
    std::string message(int _ev) const override;
};

const ErrorCategory category;

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case 1:
        oss << "Test";
        break;
    default:
        oss << "Unknown";
    };
    return oss.str();
}

const idpack::ErrorConditionT error_test{1, category};

bool contains(const std::string& _txt, const std::string& _what)
{
    return _txt.find(_what) != std::string::npos;
}

} //namespace

int test_exception(int argc, char* argv[])
{
    bool is_ok = false;

    try {
        idpack_check(argc == 0, "some error: " << argc);
    } catch (idpack::RuntimeError& _rerr) {
        is_ok = true;
        cout << _rerr.what() << endl;
        if (!contains(_rerr.what(), "(argc == 0) check failed: some error: ")) {
            cout << "unexpected message" << endl;
            return 1;
        }
        if (_rerr.error() != idpack::error_check) {
            return 1;
        }
    }
    if (!is_ok) {
        return 1;
    }

    is_ok = false;
    try {
        idpack_check_error(argc == 0, error_test);
    } catch (idpack::RuntimeError& _rerr) {
        is_ok = true;
        cout << _rerr.what() << endl;
        if (!contains(_rerr.what(), "error_test:" + error_test.message())) {
            return 1;
        }
        if (_rerr.error() != error_test) {
            return 1;
        }
    }
    if (!is_ok) {
        return 1;
    }

    is_ok = false;
    try {
        idpack_throw_error(error_test, "value " << 42 << " rejected");
    } catch (std::runtime_error& _rerr) {
        is_ok = true;
        cout << _rerr.what() << endl;
        if (!contains(_rerr.what(), error_test.message() + ": value 42 rejected")) {
            return 1;
        }
    }
    if (!is_ok) {
        return 1;
    }

    idpack_check(argc >= 0);
    idpack_assert(argc >= 0);
    return 0;
}
