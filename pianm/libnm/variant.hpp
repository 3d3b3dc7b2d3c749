//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Conversion between GVariant connection dictionaries (a{sa{sv}}) and
// SettingsMap.
//
// JSON loses the D-Bus type of a value, so the way back needs help.
// The D-Bus type of each key is taken, in order, from a template
// dictionary (the connection the settings were derived from), from a
// table of known keys, and finally inferred from the JSON value.

#ifndef PIANM_LIBNM_VARIANT_H
#define PIANM_LIBNM_VARIANT_H

#include <arpa/inet.h>

#include <memory>
#include <string>

#include <glib.h>

#include <pianm/common/exception.hpp>
#include <pianm/nm/settings.hpp>

namespace pianm {
namespace libnm {

struct VariantUnref
{
    void operator()(GVariant *v) const
    {
        g_variant_unref(v);
    }
};

typedef std::unique_ptr<GVariant, VariantUnref> VariantPtr;

// Own v, sinking a floating reference.
inline VariantPtr sink(GVariant *v)
{
    return VariantPtr(v ? g_variant_ref_sink(v) : nullptr);
}

class VariantConv
{
  public:
    PIANM_EXCEPTION(variant_error);

    static Json::Value to_json(GVariant *v)
    {
        switch (g_variant_classify(v))
        {
        case G_VARIANT_CLASS_BOOLEAN:
            return Json::Value(bool(g_variant_get_boolean(v)));
        case G_VARIANT_CLASS_BYTE:
            return Json::Value(Json::UInt(g_variant_get_byte(v)));
        case G_VARIANT_CLASS_INT16:
            return Json::Value(Json::Int(g_variant_get_int16(v)));
        case G_VARIANT_CLASS_UINT16:
            return Json::Value(Json::UInt(g_variant_get_uint16(v)));
        case G_VARIANT_CLASS_INT32:
            return Json::Value(Json::Int(g_variant_get_int32(v)));
        case G_VARIANT_CLASS_HANDLE:
            return Json::Value(Json::Int(g_variant_get_handle(v)));
        case G_VARIANT_CLASS_UINT32:
            return Json::Value(Json::UInt(g_variant_get_uint32(v)));
        case G_VARIANT_CLASS_INT64:
            return Json::Value(Json::Int64(g_variant_get_int64(v)));
        case G_VARIANT_CLASS_UINT64:
            return Json::Value(Json::UInt64(g_variant_get_uint64(v)));
        case G_VARIANT_CLASS_DOUBLE:
            return Json::Value(g_variant_get_double(v));
        case G_VARIANT_CLASS_STRING:
        case G_VARIANT_CLASS_OBJECT_PATH:
        case G_VARIANT_CLASS_SIGNATURE:
            return Json::Value(g_variant_get_string(v, nullptr));
        case G_VARIANT_CLASS_VARIANT:
            {
                VariantPtr inner(g_variant_get_variant(v));
                return to_json(inner.get());
            }
        case G_VARIANT_CLASS_MAYBE:
            {
                VariantPtr inner(g_variant_get_maybe(v));
                return inner ? to_json(inner.get()) : Json::Value();
            }
        case G_VARIANT_CLASS_ARRAY:
            if (is_string_dict(g_variant_get_type(v)))
            {
                Json::Value ret(Json::objectValue);
                const gsize n = g_variant_n_children(v);
                for (gsize i = 0; i < n; ++i)
                {
                    VariantPtr entry(g_variant_get_child_value(v, i));
                    VariantPtr key(g_variant_get_child_value(entry.get(), 0));
                    VariantPtr value(g_variant_get_child_value(entry.get(), 1));
                    ret[g_variant_get_string(key.get(), nullptr)] = to_json(value.get());
                }
                return ret;
            }
            [[fallthrough]];
        case G_VARIANT_CLASS_TUPLE:
        case G_VARIANT_CLASS_DICT_ENTRY:
            {
                Json::Value ret(Json::arrayValue);
                const gsize n = g_variant_n_children(v);
                for (gsize i = 0; i < n; ++i)
                {
                    VariantPtr child(g_variant_get_child_value(v, i));
                    ret.append(to_json(child.get()));
                }
                return ret;
            }
        }
        throw variant_error(std::string("unsupported GVariant type ") + g_variant_get_type_string(v));
    }

    /**
     * Builds a connection dictionary from settings.
     *
     * @param settings  object of sections
     * @param templ     a{sa{sv}} whose key types are reused, or null
     */
    static VariantPtr settings_to_variant(const SettingsMap &settings, GVariant *templ)
    {
        if (!settings.isObject())
            throw variant_error("settings are not an object");

        Builder outer(G_VARIANT_TYPE("a{sa{sv}}"));
        for (const auto &section : settings.getMemberNames())
        {
            const Json::Value &keys = settings[section];
            if (!keys.isObject())
                throw variant_error("settings section " + section + " is not an object");

            VariantPtr tsec;
            if (templ)
                tsec.reset(g_variant_lookup_value(templ, section.c_str(), G_VARIANT_TYPE("a{sv}")));

            Builder inner(G_VARIANT_TYPE("a{sv}"));
            for (const auto &key : keys.getMemberNames())
            {
                const Json::Value &value = keys[key];
                if (value.isNull())
                    continue;

                if (section == Setting::IPV4 && key == "dns-data" && !template_has(tsec.get(), "dns-data"))
                {
                    // services predating dns-data only know ipv4.dns as au
                    if (!keys.isMember("dns"))
                        inner.add_entry("dns", ipv4_dns(value));
                    continue;
                }

                std::string type;
                if (tsec)
                {
                    VariantPtr tv(g_variant_lookup_value(tsec.get(), key.c_str(), nullptr));
                    if (tv)
                        type = g_variant_get_type_string(tv.get());
                }
                if (type.empty())
                    type = type_for(key, value);
                inner.add_entry(key, build(value, G_VARIANT_TYPE(type.c_str()), key));
            }
            outer.add(g_variant_new_dict_entry(g_variant_new_string(section.c_str()),
                                               inner.end()));
        }
        return sink(outer.end());
    }

    static SettingsMap settings_from_variant(GVariant *v)
    {
        if (!g_variant_is_of_type(v, G_VARIANT_TYPE("a{sa{sv}}")))
            throw variant_error(std::string("not a connection dictionary: ") + g_variant_get_type_string(v));
        return to_json(v);
    }

  private:
    // GVariantBuilder that releases its children if never ended
    class Builder
    {
      public:
        explicit Builder(const GVariantType *type)
        {
            g_variant_builder_init(&builder_, type);
        }

        ~Builder()
        {
            if (!ended_)
                g_variant_builder_clear(&builder_);
        }

        Builder(const Builder &) = delete;
        Builder &operator=(const Builder &) = delete;

        void add(GVariant *v)
        {
            g_variant_builder_add_value(&builder_, v);
        }

        void add_entry(const std::string &key, GVariant *v)
        {
            add(g_variant_new_dict_entry(g_variant_new_string(key.c_str()), g_variant_new_variant(v)));
        }

        GVariant *end()
        {
            ended_ = true;
            return g_variant_builder_end(&builder_);
        }

      private:
        GVariantBuilder builder_;
        bool ended_ = false;
    };

    static bool is_string_dict(const GVariantType *type)
    {
        if (!g_variant_type_is_array(type))
            return false;
        const GVariantType *elem = g_variant_type_element(type);
        return g_variant_type_is_dict_entry(elem)
               && g_variant_type_equal(g_variant_type_key(elem), G_VARIANT_TYPE_STRING);
    }

    static bool template_has(GVariant *tsec, const char *key)
    {
        if (!tsec)
            return false;
        VariantPtr tv(g_variant_lookup_value(tsec, key, nullptr));
        return bool(tv);
    }

    // Types of keys used in WireGuard connections, peers and address
    // records, for when no template covers them.
    static const char *known_type(const std::string &key)
    {
        static const struct
        {
            const char *key;
            const char *type;
        } table[] = {
            {"autoconnect", "b"},
            {"permissions", "as"},
            {"fwmark", "u"},
            {"listen-port", "u"},
            {"mtu", "u"},
            {"peer-routes", "b"},
            {"private-key-flags", "u"},
            {"peers", "aa{sv}"},
            {"public-key", "s"},
            {"endpoint", "s"},
            {"preshared-key", "s"},
            {"preshared-key-flags", "u"},
            {"allowed-ips", "as"},
            {"persistent-keepalive", "u"},
            {"address-data", "aa{sv}"},
            {"route-data", "aa{sv}"},
            {"prefix", "u"},
            {"metric", "u"},
            {"route-metric", "x"},
            {"route-table", "u"},
            {"dns-priority", "i"},
            {"dns-search", "as"},
            {"dns-data", "as"},
            {"ignore-auto-dns", "b"},
            {"ignore-auto-routes", "b"},
            {"never-default", "b"},
            {"may-fail", "b"},
        };
        for (const auto &e : table)
            if (key == e.key)
                return e.type;
        return nullptr;
    }

    static std::string type_for(const std::string &key, const Json::Value &value)
    {
        const char *t = known_type(key);
        if (t)
            return t;
        return infer_type(value, key);
    }

    static std::string infer_type(const Json::Value &value, const std::string &key)
    {
        if (value.isBool())
            return "b";
        if (value.isInt())
            return "i";
        if (value.isUInt())
            return "u";
        if (value.isInt64())
            return "x";
        if (value.isUInt64())
            return "t";
        if (value.isDouble())
            return "d";
        if (value.isString())
            return "s";
        if (value.isObject())
            return "a{sv}";
        if (value.isArray())
        {
            if (value.empty())
                return "as";
            return "a" + infer_type(value[0], key);
        }
        throw variant_error("cannot infer D-Bus type of " + key);
    }

    // Returns a floating reference.
    static GVariant *build(const Json::Value &v, const GVariantType *type, const std::string &key)
    {
        if (g_variant_type_is_variant(type))
        {
            const std::string inner = type_for(key, v);
            return g_variant_new_variant(build(v, G_VARIANT_TYPE(inner.c_str()), key));
        }

        if (g_variant_type_is_array(type))
        {
            const GVariantType *elem = g_variant_type_element(type);
            Builder b(type);
            if (g_variant_type_is_dict_entry(elem))
            {
                if (!v.isObject())
                    throw variant_error(key + ": expected an object");
                for (const auto &name : v.getMemberNames())
                    b.add(g_variant_new_dict_entry(build(Json::Value(name), g_variant_type_key(elem), name),
                                                   build(v[name], g_variant_type_value(elem), name)));
            }
            else
            {
                if (!v.isArray())
                    throw variant_error(key + ": expected an array");
                for (Json::ArrayIndex i = 0; i < v.size(); ++i)
                    b.add(build(v[i], elem, key));
            }
            return b.end();
        }

        if (g_variant_type_is_tuple(type))
        {
            const gsize n = g_variant_type_n_items(type);
            if (!v.isArray() || v.size() != n)
                throw variant_error(key + ": expected an array of " + std::to_string(n));
            Builder b(type);
            const GVariantType *t = g_variant_type_first(type);
            for (Json::ArrayIndex i = 0; i < n; ++i, t = g_variant_type_next(t))
                b.add(build(v[i], t, key));
            return b.end();
        }

        const char tc = g_variant_type_peek_string(type)[0];
        switch (tc)
        {
        case 'b':
            if (v.isBool())
                return g_variant_new_boolean(v.asBool());
            break;
        case 'y':
            if (v.isUInt() && v.asUInt() <= 0xff)
                return g_variant_new_byte(guchar(v.asUInt()));
            break;
        case 'n':
            if (v.isInt())
                return g_variant_new_int16(gint16(v.asInt()));
            break;
        case 'q':
            if (v.isUInt())
                return g_variant_new_uint16(guint16(v.asUInt()));
            break;
        case 'i':
            if (v.isInt())
                return g_variant_new_int32(v.asInt());
            break;
        case 'u':
            if (v.isUInt())
                return g_variant_new_uint32(v.asUInt());
            break;
        case 'x':
            if (v.isInt64())
                return g_variant_new_int64(v.asInt64());
            break;
        case 't':
            if (v.isUInt64())
                return g_variant_new_uint64(v.asUInt64());
            break;
        case 'd':
            if (v.isNumeric())
                return g_variant_new_double(v.asDouble());
            break;
        case 's':
            if (v.isString())
                return g_variant_new_string(v.asCString());
            break;
        case 'o':
            if (v.isString() && g_variant_is_object_path(v.asCString()))
                return g_variant_new_object_path(v.asCString());
            break;
        case 'g':
            if (v.isString() && g_variant_is_signature(v.asCString()))
                return g_variant_new_signature(v.asCString());
            break;
        default:
            throw variant_error(key + ": unsupported D-Bus type " + std::string(1, tc));
        }
        throw variant_error(key + ": value does not fit D-Bus type " + std::string(1, tc));
    }

    // ipv4.dns: addresses as uint32 in network byte order
    static GVariant *ipv4_dns(const Json::Value &servers)
    {
        if (!servers.isArray())
            throw variant_error("dns-data: expected an array");
        Builder b(G_VARIANT_TYPE("au"));
        for (Json::ArrayIndex i = 0; i < servers.size(); ++i)
        {
            struct in_addr a;
            if (!servers[i].isString() || ::inet_pton(AF_INET, servers[i].asCString(), &a) != 1)
                throw variant_error("dns-data: not an IPv4 address");
            b.add(g_variant_new_uint32(a.s_addr));
        }
        return b.end();
    }
};

} // namespace libnm
} // namespace pianm

#endif
