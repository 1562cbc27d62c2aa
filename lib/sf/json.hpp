/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef SCRIPT_FORGE_JSON_HPP
#define SCRIPT_FORGE_JSON_HPP

#include <boost/json.hpp>
#include <sf/common/file.hpp>

namespace script_forge::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline std::string_view as_string(const json::value &v, const std::string_view name)
    {
        if (!v.is_string())
            throw error("json element {} must be a string but has kind {}!", name, static_cast<int>(v.kind()));
        return static_cast<std::string_view>(v.get_string());
    }

    inline const json::array &as_array(const json::value &v, const std::string_view name)
    {
        if (!v.is_array())
            throw error("json element {} must be an array but has kind {}!", name, static_cast<int>(v.kind()));
        return v.get_array();
    }
}

#endif // !SCRIPT_FORGE_JSON_HPP
