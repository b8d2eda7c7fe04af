#pragma once

#include "idreg/user_record.hpp"
#include <boost/json.hpp>
#include <format>
#include <string>

namespace idreg::json_utils
{

inline boost::json::object to_json(const UserRecord& rec)
{
    boost::json::object obj;
    obj["id"] = rec.id;
    if (rec.external_id)
    {
        obj["external_id"] = *rec.external_id;
    }
    else
    {
        obj["external_id"] = nullptr;
    }
    obj["display_name"] = rec.display_name;
    obj["created_at"] = std::format("{:%FT%TZ}", rec.created_at);
    return obj;
}

inline std::string serialize(const UserRecord& rec)
{
    return boost::json::serialize(to_json(rec));
}

} // namespace idreg::json_utils
