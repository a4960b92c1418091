// idpack/codec/type.hpp
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
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace idpack {
namespace codec {

enum struct TypeKind : uint8_t {
    Primitive,
    Class,
    Enum,
    Literal,
    Union,
    Generic,
};

const char* kind_name(const TypeKind _kind);

struct EnumMember {
    std::string name;
    int64_t     value;
};

//! Handle to an immutable type node used as a type hint
/*!
 * Primitive, Class, Enum and the Literal marker are nominal: two handles are
 * equal only when they refer to the same node.
 * Union and Generic compare structurally, alternatives in order.
 */
class TypeDescriptor {
    struct Node;
    using NodePointerT = std::shared_ptr<const Node>;

    NodePointerT node_ptr_;

    explicit TypeDescriptor(NodePointerT&& _node_ptr);

public:
    using VectorT           = std::vector<TypeDescriptor>;
    using EnumMemberVectorT = std::vector<EnumMember>;
    using StringVectorT     = std::vector<std::string>;

    TypeDescriptor() = default;

    static TypeDescriptor makeClass(const std::string& _name, const VectorT& _bases = VectorT());

    //! An enum deriving from the Enum marker unless other bases are given
    /*!
     * Listing type_int() before type_enum() in _bases makes an "int enum"
     * that the integer converter picks up through subclass fallback.
     */
    static TypeDescriptor makeEnum(const std::string& _name, const EnumMemberVectorT& _members);
    static TypeDescriptor makeEnum(const std::string& _name, const EnumMemberVectorT& _members, const VectorT& _bases);

    //! Nested unions are flattened and duplicates dropped; a single alternative collapses to itself
    static TypeDescriptor makeUnion(const VectorT& _alternatives);
    static TypeDescriptor makeGeneric(const TypeDescriptor& _origin, const VectorT& _arguments);
    static TypeDescriptor makeLiteral(const StringVectorT& _values);

    bool empty() const
    {
        return !node_ptr_;
    }

    explicit operator bool() const
    {
        return !empty();
    }

    TypeKind           kind() const;
    const std::string& name() const;

    bool isUnion() const
    {
        return !empty() && kind() == TypeKind::Union;
    }
    bool isGeneric() const
    {
        return !empty() && kind() == TypeKind::Generic;
    }
    bool isEnum() const
    {
        return !empty() && kind() == TypeKind::Enum;
    }

    const VectorT& bases() const;
    //! Union alternatives or generic parameters
    const VectorT&           arguments() const;
    const TypeDescriptor&    origin() const;
    const EnumMemberVectorT& members() const;
    const StringVectorT&     literals() const;

    const EnumMember* findMember(const int64_t _value) const;
    const EnumMember* findMember(const std::string& _name) const;

    //! Strict subclass test through the bases graph
    bool isSubclassOf(const TypeDescriptor& _rbase) const;

    size_t hash() const;

    bool operator==(const TypeDescriptor& _rother) const;
    bool operator!=(const TypeDescriptor& _rother) const
    {
        return !(*this == _rother);
    }

private:
    friend const TypeDescriptor& type_none();
    friend const TypeDescriptor& type_int();
    friend const TypeDescriptor& type_float();
    friend const TypeDescriptor& type_str();
    friend const TypeDescriptor& type_bool();
    friend const TypeDescriptor& type_enum();
    friend const TypeDescriptor& type_literal();

    static TypeDescriptor makeNominal(const TypeKind _kind, const std::string& _name, const VectorT& _bases, const EnumMemberVectorT& _members = EnumMemberVectorT());
};

const TypeDescriptor& type_none();
const TypeDescriptor& type_int();
const TypeDescriptor& type_float();
const TypeDescriptor& type_str();
//! bool derives from int
const TypeDescriptor& type_bool();
//! Base marker for enums
const TypeDescriptor& type_enum();
//! Origin marker of literal types
const TypeDescriptor& type_literal();

inline TypeDescriptor union_of(std::initializer_list<TypeDescriptor> _alternatives)
{
    return TypeDescriptor::makeUnion(TypeDescriptor::VectorT(_alternatives));
}

inline TypeDescriptor optional_of(const TypeDescriptor& _type)
{
    return union_of({_type, type_none()});
}

inline TypeDescriptor literal_of(std::initializer_list<std::string> _values)
{
    return TypeDescriptor::makeLiteral(TypeDescriptor::StringVectorT(_values));
}

std::ostream& operator<<(std::ostream& _ros, const TypeDescriptor& _type);

} //namespace codec
} //namespace idpack

namespace std {
template <>
struct hash<idpack::codec::TypeDescriptor> {
    size_t operator()(const idpack::codec::TypeDescriptor& _type) const
    {
        return _type.hash();
    }
};
} //namespace std
