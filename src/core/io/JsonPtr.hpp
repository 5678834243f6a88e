#ifndef JSONPTR_HPP_
#define JSONPTR_HPP_

#include "math/Vec.hpp"

#include "Platform.hpp"
#include "IntTypes.hpp"

#include <rapidjson/document.h>
#include <tinyformat/tinyformat.hpp>
#include <string>

namespace Shrimpy {

class JsonDocument;

// Non-owning handle to a value inside a JsonDocument. A null handle stands in
// for absent fields and out-of-range elements. Type mismatches are reported
// through the owning document, which can point at the source location
class JsonPtr
{
    friend JsonDocument;

    const JsonDocument *_document;
    const rapidjson::Value *_value;

    JsonPtr(const JsonDocument *document, const rapidjson::Value *value)
    : _document(document),
      _value(value)
    {
    }

    JsonPtr child(const rapidjson::Value *value) const
    {
        return JsonPtr(value ? _document : nullptr, value);
    }

public:
    JsonPtr()
    : JsonPtr(nullptr, nullptr)
    {
    }

    void get(float &dst) const;
    void get(uint32 &dst) const;
    void get(std::string &dst) const;
    void get(const char *&dst) const;

    // Accepts an array of exactly Size numbers, or a single number that is
    // broadcast to every component
    template<typename ElementType, unsigned Size>
    void get(Vec<ElementType, Size> &dst) const
    {
        if (!isArray()) {
            dst = Vec<ElementType, Size>(cast<ElementType>());
            return;
        }
        if (size() != Size)
            parseError(tfm::format("Expecting an array of %d numbers here, received %d elements",
                    Size, size()));
        for (unsigned i = 0; i < Size; ++i)
            (*this)[i].get(dst[i]);
    }

    template<typename T>
    T cast() const
    {
        T t;
        get(t);
        return t;
    }

    template<typename T>
    T castField(const char *field) const
    {
        return getRequiredMember(field).cast<T>();
    }

    // Leaves dst untouched and returns false if the field is absent
    template<typename T>
    bool getField(const char *field, T &dst) const
    {
        JsonPtr member = (*this)[field];
        if (member)
            member.get(dst);
        return bool(member);
    }

    JsonPtr operator[](unsigned i) const
    {
        return child(i < size() ? &(*_value)[i] : nullptr);
    }

    JsonPtr operator[](const char *field) const
    {
        if (!isObject())
            return JsonPtr();
        auto member = _value->FindMember(field);
        return child(member == _value->MemberEnd() ? nullptr : &member->value);
    }

    JsonPtr getRequiredMember(const char *field) const;

    unsigned size() const
    {
        return isArray() ? _value->Size() : 0;
    }

    NORETURN void parseError(std::string description) const;

    explicit operator bool() const { return _value != nullptr; }

    bool isObject() const { return _value && _value->IsObject(); }
    bool isArray() const { return _value && _value->IsArray(); }
    bool isString() const { return _value && _value->IsString(); }
};

}

#endif /* JSONPTR_HPP_ */
