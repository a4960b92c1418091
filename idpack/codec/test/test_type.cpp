#include "idpack/codec/type.hpp"
#include "idpack/system/exception.hpp"
#include <iostream>
#include <unordered_set>

using namespace std;
using namespace idpack;
using namespace idpack::codec;

int test_type(int /*argc*/, char* /*argv*/[])
{
    const TypeDescriptor animal = TypeDescriptor::makeClass("Animal");
    const TypeDescriptor dog    = TypeDescriptor::makeClass("Dog", {animal});
    const TypeDescriptor puppy  = TypeDescriptor::makeClass("Puppy", {dog});

    idpack_check(!TypeDescriptor() && static_cast<bool>(animal));
    idpack_check(TypeDescriptor().empty() && TypeDescriptor().name() == "<empty>");
    idpack_check(puppy.isSubclassOf(animal));
    idpack_check(dog.isSubclassOf(animal));
    idpack_check(!animal.isSubclassOf(dog));
    idpack_check(!animal.isSubclassOf(animal), "subclass test must be strict");
    idpack_check(type_bool().isSubclassOf(type_int()));

    // nominal types with the same name stay distinct
    idpack_check(TypeDescriptor::makeClass("Animal") != animal);

    {
        const TypeDescriptor u1 = union_of({type_int(), type_str()});
        const TypeDescriptor u2 = union_of({type_int(), type_str()});
        const TypeDescriptor u3 = union_of({type_str(), type_int()});

        idpack_check(u1.isUnion());
        idpack_check(u1 == u2 && u1.hash() == u2.hash());
        idpack_check(u1 != u3, "alternative order must be significant");
        idpack_check(u1.arguments().front() == type_int());
        idpack_check(!u1.isSubclassOf(type_int()));

        const TypeDescriptor nested = union_of({u1, type_float(), type_int()});
        idpack_check(nested.arguments().size() == 3, "got " << nested.arguments().size());
        idpack_check(nested.arguments()[2] == type_float());

        idpack_check(union_of({type_int(), type_int()}) == type_int());

        const TypeDescriptor opt = optional_of(type_str());
        idpack_check(opt.arguments().size() == 2 && opt.arguments()[1] == type_none());

        unordered_set<TypeDescriptor> type_set{u1, u2, u3, type_int()};
        idpack_check(type_set.size() == 3);
    }

    {
        const TypeDescriptor list_int  = TypeDescriptor::makeGeneric(animal, {type_int()});
        const TypeDescriptor list_int2 = TypeDescriptor::makeGeneric(animal, {type_int()});
        idpack_check(list_int.isGeneric());
        idpack_check(list_int.origin() == animal);
        idpack_check(list_int == list_int2);
        idpack_check(list_int.name() == "Animal[int]", "got " << list_int.name());

        const TypeDescriptor lit = literal_of({"a", "b"});
        idpack_check(lit.origin() == type_literal());
        idpack_check(lit.literals().size() == 2);
        idpack_check(lit == literal_of({"a", "b"}));
        idpack_check(lit != literal_of({"b", "a"}));
    }

    {
        const TypeDescriptor color = TypeDescriptor::makeEnum("Color", {{"RED", 1}, {"GREEN", 2}});
        idpack_check(color.isEnum());
        idpack_check(string(kind_name(color.kind())) == "Enum");
        idpack_check(color.isSubclassOf(type_enum()));
        idpack_check(color.findMember(2) != nullptr && color.findMember(2)->name == "GREEN");
        idpack_check(color.findMember("RED") != nullptr && color.findMember("RED")->value == 1);
        idpack_check(color.findMember(3) == nullptr);

        bool is_ok = false;
        try {
            TypeDescriptor::makeEnum("Bad", {{"A", 1}, {"A", 2}});
        } catch (RuntimeError& _rerr) {
            cout << _rerr.what() << endl;
            is_ok = true;
        }
        idpack_check(is_ok, "duplicate enum member accepted");
    }

    cout << union_of({type_int(), type_str()}) << endl;
    return 0;
}
