#include "idpack/codec/codec.hpp"
#include "idpack/codec/error.hpp"
#include "idpack/system/exception.hpp"
#include "idpack/system/log.hpp"
#include <iostream>

using namespace std;
using namespace idpack;
using namespace idpack::codec;

namespace {

enum struct ComponentKind {
    Button,
    Slider,
};

template <class F>
bool fails_with(const ErrorConditionT& _err, F _f)
{
    try {
        _f();
    } catch (RuntimeError& _rerr) {
        cout << _rerr.what() << endl;
        return _rerr.error() == _err;
    }
    return false;
}

} // namespace

int test_codec(int /*argc*/, char* /*argv*/[])
{
    idpack::log_start(std::cerr, {".*:EWX"});

    const TypeDescriptor shape = TypeDescriptor::makeEnum("Shape", {{"ROUND", 1}, {"SQUARE", 2}});

    const Schema button_schema{{"a", type_int()}, {"b", type_str()}};
    const Schema slider_schema{
        {"min", type_float()},
        {"max", optional_of(type_float())},
        {"enabled", type_bool()},
        {"shape", shape},
        {"mode", literal_of({"h", "v"})}};

    const CookieMapT<ComponentKind> cookie_map{
        {"k1", {ComponentKind::Button, button_schema}},
        {"s", {ComponentKind::Slider, slider_schema}}};

    const Codec codec;

    idpack_check(codec.configuration().max_size == Configuration::default_max_size);
    idpack_check(&codec.registry() == &default_registry());

    {
        const string id = codec.serialize("k1", button_schema, {{"a", Value(300)}, {"b", Value("hi")}});
        idpack_check(id == string("\x02k1\x02\x2c\x01\x02hi", 9), "got " << Value(id));

        const auto decoded = codec.deserialize(id, cookie_map);
        idpack_check(decoded.first == ComponentKind::Button);
        idpack_check(decoded.second.size() == 2);
        idpack_check(decoded.second.at("a") == Value(300));
        idpack_check(decoded.second.at("b") == Value("hi"));

        // trailing characters are ignored by deserialize and handed back by deserializeFields
        const auto tolerant = codec.deserialize(id + "junk", cookie_map);
        idpack_check(tolerant.second.at("b") == Value("hi"));

        const auto fields = codec.deserializeFields(id.substr(3) + "junk", button_schema);
        idpack_check(fields.second == "junk");
        idpack_check(fields.first.at("a") == Value(300));
    }

    {
        const ValueMapT values{
            {"min", Value(-1.5)},
            {"max", Value(1e300)},
            {"enabled", Value(true)},
            {"shape", Value(enum_value(shape, "SQUARE"))},
            {"mode", Value("v")}};
        const string id = codec.serialize("s", slider_schema, values);
        idpack_check(id.size() == 2 + 8 + 8 + 1 + 2 + 2, "got " << id.size());

        const auto decoded = codec.deserialize(id, cookie_map);
        idpack_check(decoded.first == ComponentKind::Slider);
        idpack_check(decoded.second == values);
    }

    {
        // the limit counts the cookie too
        const string fits = codec.serialize("k1", button_schema, {{"a", Value(1)}, {"b", Value(string(94, 'x'))}});
        idpack_check(fits.size() == 100, "got " << fits.size());

        idpack_check(fails_with(error_oversize, [&codec, &button_schema]() {
            codec.serialize("k1", button_schema, {{"a", Value(1)}, {"b", Value(string(95, 'x'))}});
        }));
        idpack_check(fails_with(error_oversize, [&codec, &button_schema]() {
            codec.serialize("k1", button_schema, {{"a", Value(1)}, {"b", Value(string(120, 'x'))}});
        }));

        const Codec roomy(default_registry(), Configuration(300));
        idpack_check(roomy.serialize("k1", button_schema, {{"a", Value(1)}, {"b", Value(string(120, 'x'))}}).size() == 126);
    }

    {
        idpack_check(fails_with(error_unknown_cookie, [&codec, &cookie_map, &button_schema]() {
            codec.deserialize(codec.serialize("zz", button_schema, {{"a", Value(1)}, {"b", Value("")}}), cookie_map);
        }));

        idpack_check(fails_with(error_value_type, [&codec, &button_schema]() {
            codec.serialize("k1", button_schema, {{"a", Value(1)}});
        }));

        const string bad_shape = codec.serialize("s", Schema{{"min", type_float()}, {"max", type_float()}, {"enabled", type_bool()}, {"shape", type_int()}, {"mode", type_str()}},
            {{"min", Value(0.0)}, {"max", Value(1.0)}, {"enabled", Value(false)}, {"shape", Value(9)}, {"mode", Value("h")}});
        idpack_check(fails_with(error_enum_value, [&codec, &cookie_map, &bad_shape]() {
            codec.deserialize(bad_shape, cookie_map);
        }));

        idpack_check(fails_with(error_short_input, [&codec, &cookie_map]() {
            codec.deserialize(string("\x02k1\x02\x2c", 5), cookie_map);
        }));

        idpack_check(fails_with(error_converter_not_found, [&codec]() {
            codec.serialize("k1", Schema{{"x", TypeDescriptor::makeClass("Opaque")}}, {{"x", Value(1)}});
        }));
    }

    {
        Schema schema;
        schema.add("x", type_int()).add("y", type_int());
        idpack_check(schema.size() == 2 && schema[1].name == "y");

        bool is_ok = false;
        try {
            schema.add("x", type_str());
        } catch (RuntimeError& _rerr) {
            cout << _rerr.what() << endl;
            is_ok = true;
        }
        idpack_check(is_ok, "duplicate field accepted");

        const string id = codec.serialize("k1", Schema(), {});
        idpack_check(id == "\x02k1");
        idpack_check(codec.deserializeFields("", Schema()).first.empty());
    }

    return 0;
}
