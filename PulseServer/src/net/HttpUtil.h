#pragma once

#include "Request.h"
#include "Response.h"
#include <map>
#include <optional>
#include <string>
#include <string_view>

using QueryParams = std::map<std::string, std::string>;

std::string url_decode(std::string_view s);
std::string url_encode(std::string_view s);
// Path part of a request target, without the query string.
std::string target_path(std::string_view target);
// Decoded query parameters; a repeated name keeps the last value.
QueryParams parse_query(std::string_view target);

Response json_response(const Request& req, boost::beast::http::status st, std::string body);
std::optional<std::string> header_value(const Request& req, boost::beast::http::field f);
std::optional<std::string> header_value(const Request& req, std::string_view name);
