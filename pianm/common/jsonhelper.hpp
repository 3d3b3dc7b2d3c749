//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Typed accessors over JsonCpp values.  Missing or mistyped members
// raise json::json_parse with the dotted path of the member.

#ifndef PIANM_COMMON_JSONHELPER_H
#define PIANM_COMMON_JSONHELPER_H

#include <string>
#include <memory>
#include <sstream>

#include <json/json.h>

#include <pianm/common/exception.hpp>
#include <pianm/common/file.hpp>

namespace pianm {

class json
{
  public:
    PIANM_EXCEPTION(json_parse);

    static Json::Value parse(const std::string &str, const std::string &title)
    {
        Json::Value root;
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string errs;
        if (!reader->parse(str.data(), str.data() + str.size(), &root, &errs))
            throw json_parse(title + " : " + errs);
        return root;
    }

    static Json::Value parse_from_file(const std::string &fn)
    {
        return parse(read_text_simple(fn), fn);
    }

    static void assert_dict(const Json::Value &obj, const std::string &title)
    {
        if (!obj.isObject())
            throw json_parse(title + " is not a JSON dictionary");
    }

    static bool exists(const Json::Value &root, const std::string &name)
    {
        return root.isObject() && root.isMember(name) && !root[name].isNull();
    }

    static std::string get_string(const Json::Value &root, const std::string &name, const std::string &title)
    {
        const Json::Value &value = root[name];
        if (value.isNull())
            throw json_parse("string " + fmt_name(name, title) + " is missing");
        if (!value.isString())
            throw json_parse("string " + fmt_name(name, title) + " is of incorrect type");
        return value.asString();
    }

    static std::string get_string_optional(const Json::Value &root,
                                           const std::string &name,
                                           const std::string &default_value,
                                           const std::string &title)
    {
        const Json::Value &value = root[name];
        if (value.isNull())
            return default_value;
        if (!value.isString())
            throw json_parse("string " + fmt_name(name, title) + " is of incorrect type");
        return value.asString();
    }

    static unsigned int get_uint_optional(const Json::Value &root,
                                          const std::string &name,
                                          const unsigned int default_value,
                                          const std::string &title)
    {
        const Json::Value &value = root[name];
        if (value.isNull())
            return default_value;
        if (!value.isUInt())
            throw json_parse("uint " + fmt_name(name, title) + " is of incorrect type");
        return value.asUInt();
    }

    static bool get_bool_optional(const Json::Value &root,
                                  const std::string &name,
                                  const bool default_value,
                                  const std::string &title)
    {
        const Json::Value &value = root[name];
        if (value.isNull())
            return default_value;
        if (!value.isBool())
            throw json_parse("bool " + fmt_name(name, title) + " is of incorrect type");
        return value.asBool();
    }

    static const Json::Value &get_array(const Json::Value &root, const std::string &name, const bool optional, const std::string &title)
    {
        const Json::Value &value = root[name];
        if (value.isNull())
        {
            if (optional)
                return value;
            throw json_parse("array " + fmt_name(name, title) + " is missing");
        }
        if (!value.isArray())
            throw json_parse("array " + fmt_name(name, title) + " is of incorrect type");
        return value;
    }

    static std::string format(const Json::Value &root)
    {
        return root.toStyledString();
    }

  private:
    static std::string fmt_name(const std::string &name, const std::string &title)
    {
        if (!title.empty())
            return title + '.' + name;
        else
            return name;
    }
};

} // namespace pianm

#endif
