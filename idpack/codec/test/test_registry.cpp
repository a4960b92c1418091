#include "idpack/codec/converters.hpp"
#include "idpack/codec/error.hpp"
#include "idpack/codec/registry.hpp"
#include "idpack/system/exception.hpp"
#include "idpack/system/log.hpp"
#include <cctype>
#include <iostream>
#include <thread>
#include <vector>

using namespace std;
using namespace idpack;
using namespace idpack::codec;

namespace {

//! Uppercase text in the str layout, usable as the str converter itself
class ShoutConverter : public Converter {
public:
    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override
    {
        const auto* ps = _rvalue.get<string>();
        idpack_check(ps != nullptr, "expected a string, got " << _rvalue);
        string up(*ps);
        for (auto& c : up) {
            c = static_cast<char>(toupper(static_cast<uchar>(c)));
        }
        return StringConverter(registry(), type()).toStr(Value(up));
    }

    LoadT fromStr(const string& _rtxt) const override
    {
        return StringConverter(registry(), type()).fromStr(_rtxt);
    }
};

bool fails_with(const ErrorConditionT& _err, const ConverterRegistry& _rreg, const TypeDescriptor& _type)
{
    try {
        _rreg.resolve(_type);
    } catch (RuntimeError& _rerr) {
        cout << _rerr.what() << endl;
        return _rerr.error() == _err;
    }
    return false;
}

} // namespace

int test_registry(int /*argc*/, char* /*argv*/[])
{
    idpack::log_start(std::cerr, {".*:EWX"});

    ConverterRegistry reg;
    register_builtin_converters(reg);

    idpack_check(reg.size() == 6, "got " << reg.size());
    idpack_check(reg.cacheCapacity() == ConverterRegistry::default_cache_capacity);

    {
        // union resolves through its leftmost alternative
        const string a = reg.resolve(union_of({type_int(), type_str()}))->toStr(Value(5)).get();
        idpack_check(a == reg.resolve(type_int())->toStr(Value(5)).get());

        const auto pstr_first = reg.resolve(union_of({type_str(), type_int()}));
        idpack_check(pstr_first->type() == type_str());

        idpack_check(reg.resolve(optional_of(type_float()))->type() == type_float());
    }

    {
        // subclass fallback binds the converter to the subclass
        const TypeDescriptor my_int = TypeDescriptor::makeClass("MyInt", {type_int()});
        const auto           pconv  = reg.resolve(my_int);
        idpack_check(pconv->type() == my_int);
        idpack_check(pconv->toStr(Value(7)).get() == reg.resolve(type_int())->toStr(Value(7)).get());

        // bool has its own exact converter even though it derives from int
        idpack_check(reg.resolve(type_bool())->toStr(Value(true)).get() == "t");

        // generics reduce to their origin
        const TypeDescriptor my_list = TypeDescriptor::makeGeneric(my_int, {type_str()});
        idpack_check(reg.resolve(my_list)->type() == my_int);
    }

    {
        const TypeDescriptor unknown = TypeDescriptor::makeClass("Unknown");
        idpack_check(fails_with(error_converter_not_found, reg, unknown));
        idpack_check(fails_with(error_converter_not_found, reg, type_none()));

        // registering after a failed resolve makes the type resolvable
        reg.registerConverter<ShoutConverter>(unknown);
        idpack_check(reg.contains(unknown));
        idpack_check(reg.cacheSize() == 0);
        idpack_check(reg.resolve(unknown)->toStr(Value("hey")).get() == "\x03HEY");

        // subclasses of a registration without subclass support are not found
        const TypeDescriptor derived = TypeDescriptor::makeClass("Derived", {unknown});
        idpack_check(fails_with(error_converter_not_found, reg, derived));
    }

    {
        // overwriting keeps the scan position, str still wins over the later custom base
        const TypeDescriptor text     = TypeDescriptor::makeClass("Text", {type_str()});
        const TypeDescriptor sub_text = TypeDescriptor::makeClass("SubText", {text});
        reg.registerConverter<StringConverter>(text, true);

        idpack_check(reg.resolve(sub_text)->type() == sub_text);
        idpack_check(reg.resolve(sub_text)->toStr(Value("ab")).get() == "\x02" "ab");

        const size_t size_before = reg.size();
        reg.registerConverter<ShoutConverter>(type_str(), true);
        idpack_check(reg.size() == size_before);
        idpack_check(reg.resolve(sub_text)->type() == sub_text);
        idpack_check(reg.resolve(sub_text)->toStr(Value("ab")).get() == "\x02" "AB");
        idpack_check(reg.resolve(type_str())->toStr(Value("ab")).get() == "\x02" "AB");
        // int delegates to the overridden str converter
        idpack_check(reg.resolve(type_int())->toStr(Value(5)).get() == string("\x01\x05", 2));
        reg.registerConverter<StringConverter>(type_str(), true);
        idpack_check(reg.resolve(type_str())->toStr(Value("ab")).get() == "\x02" "ab");
    }

    {
        // an int enum is picked up by the int converter and decodes to a member
        const TypeDescriptor level = TypeDescriptor::makeEnum("Level", {{"LOW", 1}, {"HIGH", 1000}}, {type_int(), type_enum()});
        const auto           pconv = reg.resolve(level);
        idpack_check(pconv->type() == level);

        const string s = pconv->toStr(Value(enum_value(level, "HIGH"))).get();
        idpack_check(s == reg.resolve(type_int())->toStr(Value(1000)).get());

        Converter::LoadT loaded = reg.resolve(level)->fromStr(s);
        const Value      v      = loaded.second.get();
        idpack_check(v == Value(enum_value(level, 1000)), "got " << v);
    }

    {
        ConverterRegistry small(2);
        register_builtin_converters(small);
        small.resolve(type_int());
        small.resolve(type_str());
        small.resolve(type_float());
        idpack_check(small.cacheSize() == 2, "got " << small.cacheSize());
        idpack_check(small.resolve(type_int())->type() == type_int());

        ConverterRegistry uncached(0);
        register_builtin_converters(uncached);
        idpack_check(uncached.resolve(type_bool())->type() == type_bool());
        idpack_check(uncached.cacheSize() == 0);
    }

    {
        // concurrent resolve and register
        vector<thread> thr_vec;
        for (int i = 0; i < 4; ++i) {
            thr_vec.emplace_back([&reg, i]() {
                for (int j = 0; j < 200; ++j) {
                    const TypeDescriptor t = TypeDescriptor::makeClass("T" + to_string(i), {type_int()});
                    idpack_check(reg.resolve(t)->toStr(Value(j)).get() == reg.resolve(type_int())->toStr(Value(j)).get());
                    if (j % 50 == 0) {
                        reg.registerConverter<FloatConverter>(type_float(), true);
                    }
                }
            });
        }
        for (auto& thr : thr_vec) {
            thr.join();
        }
    }

    idpack_check(&default_registry() == &default_registry());
    idpack_check(default_registry().contains(type_literal()));
    return 0;
}
