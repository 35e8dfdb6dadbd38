/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <google/protobuf/util/json_util.h>

#include <peergen/internal/errors.h>
#include <peergen/internal/payload.h>

namespace peergen
{
    std::string to_json(const payload& val)
    {
        std::string output;
        auto status = google::protobuf::util::MessageToJsonString(val, &output);
        if (!status.ok())
        {
            throw error("unable to serialise payload: " + status.ToString());
        }
        return output;
    }

    std::string from_json(const std::string& json, payload& val)
    {
        auto status = google::protobuf::util::JsonStringToMessage(json, &val);
        if (!status.ok())
        {
            return "payload is not valid JSON: " + status.ToString();
        }
        return "";
    }
}
