/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace peergen
{
    // any JSON value carried as params or result of a message
    using payload = google::protobuf::Value;

    inline payload make_null()
    {
        payload val;
        val.set_null_value(google::protobuf::NULL_VALUE);
        return val;
    }

    inline payload make_string(const std::string& text)
    {
        payload val;
        val.set_string_value(text);
        return val;
    }

    inline payload make_number(double number)
    {
        payload val;
        val.set_number_value(number);
        return val;
    }

    inline payload make_bool(bool flag)
    {
        payload val;
        val.set_bool_value(flag);
        return val;
    }

    inline payload make_list(const std::vector<payload>& items = {})
    {
        payload val;
        auto* list = val.mutable_list_value();
        for (const auto& item : items)
        {
            *list->add_values() = item;
        }
        return val;
    }

    inline payload make_object(const std::vector<std::pair<std::string, payload>>& fields = {})
    {
        payload val;
        auto* object = val.mutable_struct_value();
        for (const auto& [name, item] : fields)
        {
            (*object->mutable_fields())[name] = item;
        }
        return val;
    }

    inline bool is_null(const payload& val)
    {
        return val.kind_case() == payload::kNullValue || val.kind_case() == payload::KIND_NOT_SET;
    }

    // serialisation primatives
    std::string to_json(const payload& val);

    // returns an empty string on success, otherwise a description of why the text was rejected
    std::string from_json(const std::string& json, payload& val);
}
