// idpack/codec/src/type.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/codec/type.hpp"
#include "idpack/system/exception.hpp"
#include <algorithm>
#include <deque>
#include <sstream>

namespace idpack {
namespace codec {

struct TypeDescriptor::Node {
    TypeKind          kind_;
    std::string       name_;
    VectorT           bases_;
    VectorT           arguments_;
    TypeDescriptor    origin_;
    EnumMemberVectorT members_;
    StringVectorT     literals_;
    size_t            hash_ = 0;

    Node(const TypeKind _kind, const std::string& _name)
        : kind_(_kind)
        , name_(_name)
    {
    }

    bool nominal() const
    {
        return kind_ != TypeKind::Union && kind_ != TypeKind::Generic;
    }
};

namespace {

inline void hash_combine(size_t& _rseed, const size_t _value)
{
    _rseed ^= _value + 0x9e3779b97f4a7c15ULL + (_rseed << 6) + (_rseed >> 2);
}

const TypeDescriptor::VectorT           empty_type_vec;
const TypeDescriptor::EnumMemberVectorT empty_member_vec;
const TypeDescriptor::StringVectorT     empty_string_vec;
const TypeDescriptor                    empty_type;

} // namespace

const char* kind_name(const TypeKind _kind)
{
    switch (_kind) {
    case TypeKind::Primitive:
        return "Primitive";
    case TypeKind::Class:
        return "Class";
    case TypeKind::Enum:
        return "Enum";
    case TypeKind::Literal:
        return "Literal";
    case TypeKind::Union:
        return "Union";
    case TypeKind::Generic:
        return "Generic";
    }
    return "Unknown";
}

TypeDescriptor::TypeDescriptor(NodePointerT&& _node_ptr)
    : node_ptr_(std::move(_node_ptr))
{
}

/*static*/ TypeDescriptor TypeDescriptor::makeNominal(const TypeKind _kind, const std::string& _name, const VectorT& _bases, const EnumMemberVectorT& _members)
{
    for (const auto& base : _bases) {
        idpack_check(!base.empty() && base.node_ptr_->nominal(), "invalid base for " << _name << ": " << base);
    }
    auto node_ptr      = std::make_shared<Node>(_kind, _name);
    node_ptr->bases_   = _bases;
    node_ptr->members_ = _members;
    node_ptr->hash_    = std::hash<const void*>()(node_ptr.get());
    return TypeDescriptor(std::move(node_ptr));
}

/*static*/ TypeDescriptor TypeDescriptor::makeClass(const std::string& _name, const VectorT& _bases)
{
    return makeNominal(TypeKind::Class, _name, _bases);
}

/*static*/ TypeDescriptor TypeDescriptor::makeEnum(const std::string& _name, const EnumMemberVectorT& _members)
{
    return makeEnum(_name, _members, VectorT{type_enum()});
}

/*static*/ TypeDescriptor TypeDescriptor::makeEnum(const std::string& _name, const EnumMemberVectorT& _members, const VectorT& _bases)
{
    for (auto it = _members.begin(); it != _members.end(); ++it) {
        const auto dup_it = std::find_if(
            _members.begin(), it,
            [it](const EnumMember& _rm) { return _rm.name == it->name; });
        idpack_check(dup_it == it, "duplicate member " << it->name << " in enum " << _name);
    }

    return makeNominal(TypeKind::Enum, _name, _bases, _members);
}

/*static*/ TypeDescriptor TypeDescriptor::makeUnion(const VectorT& _alternatives)
{
    VectorT flat;
    for (const auto& alt : _alternatives) {
        idpack_check(!alt.empty(), "empty union alternative");
        if (alt.isUnion()) {
            for (const auto& sub : alt.arguments()) {
                if (std::find(flat.begin(), flat.end(), sub) == flat.end()) {
                    flat.emplace_back(sub);
                }
            }
        } else if (std::find(flat.begin(), flat.end(), alt) == flat.end()) {
            flat.emplace_back(alt);
        }
    }
    idpack_check(!flat.empty(), "union without alternatives");

    if (flat.size() == 1) {
        return flat.front();
    }

    std::ostringstream oss;
    size_t             hash = static_cast<size_t>(TypeKind::Union);
    for (size_t i = 0; i < flat.size(); ++i) {
        if (i != 0) {
            oss << " | ";
        }
        oss << flat[i].name();
        hash_combine(hash, flat[i].hash());
    }

    auto node_ptr        = std::make_shared<Node>(TypeKind::Union, oss.str());
    node_ptr->arguments_ = std::move(flat);
    node_ptr->hash_      = hash;
    return TypeDescriptor(std::move(node_ptr));
}

/*static*/ TypeDescriptor TypeDescriptor::makeGeneric(const TypeDescriptor& _origin, const VectorT& _arguments)
{
    idpack_check(!_origin.empty() && _origin.node_ptr_->nominal(), "invalid generic origin: " << _origin);

    std::ostringstream oss;
    size_t             hash = static_cast<size_t>(TypeKind::Generic);
    hash_combine(hash, _origin.hash());

    oss << _origin.name() << '[';
    for (size_t i = 0; i < _arguments.size(); ++i) {
        idpack_check(!_arguments[i].empty(), "empty generic argument for " << _origin);
        if (i != 0) {
            oss << ", ";
        }
        oss << _arguments[i].name();
        hash_combine(hash, _arguments[i].hash());
    }
    oss << ']';

    auto node_ptr        = std::make_shared<Node>(TypeKind::Generic, oss.str());
    node_ptr->origin_    = _origin;
    node_ptr->arguments_ = _arguments;
    node_ptr->hash_      = hash;
    return TypeDescriptor(std::move(node_ptr));
}

/*static*/ TypeDescriptor TypeDescriptor::makeLiteral(const StringVectorT& _values)
{
    std::ostringstream oss;
    size_t             hash = static_cast<size_t>(TypeKind::Generic);
    hash_combine(hash, type_literal().hash());

    oss << type_literal().name() << '[';
    for (size_t i = 0; i < _values.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << '\'' << _values[i] << '\'';
        hash_combine(hash, std::hash<std::string>()(_values[i]));
    }
    oss << ']';

    auto node_ptr       = std::make_shared<Node>(TypeKind::Generic, oss.str());
    node_ptr->origin_   = type_literal();
    node_ptr->literals_ = _values;
    node_ptr->hash_     = hash;
    return TypeDescriptor(std::move(node_ptr));
}

TypeKind TypeDescriptor::kind() const
{
    idpack_check(!empty(), "empty type descriptor");
    return node_ptr_->kind_;
}

const std::string& TypeDescriptor::name() const
{
    static const std::string empty_name("<empty>");
    return empty() ? empty_name : node_ptr_->name_;
}

const TypeDescriptor::VectorT& TypeDescriptor::bases() const
{
    return empty() ? empty_type_vec : node_ptr_->bases_;
}

const TypeDescriptor::VectorT& TypeDescriptor::arguments() const
{
    return empty() ? empty_type_vec : node_ptr_->arguments_;
}

const TypeDescriptor& TypeDescriptor::origin() const
{
    return empty() ? empty_type : node_ptr_->origin_;
}

const TypeDescriptor::EnumMemberVectorT& TypeDescriptor::members() const
{
    return empty() ? empty_member_vec : node_ptr_->members_;
}

const TypeDescriptor::StringVectorT& TypeDescriptor::literals() const
{
    return empty() ? empty_string_vec : node_ptr_->literals_;
}

const EnumMember* TypeDescriptor::findMember(const int64_t _value) const
{
    for (const auto& member : members()) {
        if (member.value == _value) {
            return &member;
        }
    }
    return nullptr;
}

const EnumMember* TypeDescriptor::findMember(const std::string& _name) const
{
    for (const auto& member : members()) {
        if (member.name == _name) {
            return &member;
        }
    }
    return nullptr;
}

bool TypeDescriptor::isSubclassOf(const TypeDescriptor& _rbase) const
{
    if (empty() || _rbase.empty() || !node_ptr_->nominal() || !_rbase.node_ptr_->nominal()) {
        return false;
    }
    if (node_ptr_ == _rbase.node_ptr_) {
        return false;
    }

    std::deque<const Node*>  queue;
    std::vector<const Node*> visited;
    queue.push_back(node_ptr_.get());

    while (!queue.empty()) {
        const Node* pnode = queue.front();
        queue.pop_front();
        for (const auto& base : pnode->bases_) {
            const Node* pbase = base.node_ptr_.get();
            if (pbase == _rbase.node_ptr_.get()) {
                return true;
            }
            if (std::find(visited.begin(), visited.end(), pbase) == visited.end()) {
                visited.push_back(pbase);
                queue.push_back(pbase);
            }
        }
    }
    return false;
}

size_t TypeDescriptor::hash() const
{
    return empty() ? 0 : node_ptr_->hash_;
}

bool TypeDescriptor::operator==(const TypeDescriptor& _rother) const
{
    if (node_ptr_ == _rother.node_ptr_) {
        return true;
    }
    if (empty() || _rother.empty()) {
        return false;
    }
    const Node& rn = *node_ptr_;
    const Node& ro = *_rother.node_ptr_;
    if (rn.nominal() || ro.nominal() || rn.kind_ != ro.kind_ || rn.hash_ != ro.hash_) {
        return false;
    }
    return rn.origin_ == ro.origin_ && rn.arguments_ == ro.arguments_ && rn.literals_ == ro.literals_;
}

std::ostream& operator<<(std::ostream& _ros, const TypeDescriptor& _type)
{
    return _ros << _type.name();
}

//-----------------------------------------------------------------------------

const TypeDescriptor& type_none()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Primitive, "None", TypeDescriptor::VectorT());
    return type;
}

const TypeDescriptor& type_int()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Primitive, "int", TypeDescriptor::VectorT());
    return type;
}

const TypeDescriptor& type_float()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Primitive, "float", TypeDescriptor::VectorT());
    return type;
}

const TypeDescriptor& type_str()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Primitive, "str", TypeDescriptor::VectorT());
    return type;
}

const TypeDescriptor& type_bool()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Primitive, "bool", TypeDescriptor::VectorT{type_int()});
    return type;
}

const TypeDescriptor& type_enum()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Class, "Enum", TypeDescriptor::VectorT());
    return type;
}

const TypeDescriptor& type_literal()
{
    static const TypeDescriptor type = TypeDescriptor::makeNominal(TypeKind::Literal, "Literal", TypeDescriptor::VectorT());
    return type;
}

} // namespace codec
} // namespace idpack
