#pragma once

#include "reglink/Result.hpp"

#include <json/json.h>

#include <string>
#include <string_view>

namespace reglink
{
    /**
     * Drops '#' comments: a line starting with '#' (after blanks) disappears,
     * elsewhere everything from '#' to the end of the line is removed.
     */
    auto stripComments(std::string_view text) -> std::string;

    // comment-tolerant parse shared by snapshot and configuration files
    auto parseJson(std::string_view text) -> Result<Json::Value>;

    auto readJsonFile(const std::string& path) -> Result<Json::Value>;
} // namespace reglink
