#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Content-Type: application/json is always sent; extra_headers are added as
// "Name: value" lines. Transport failures throw std::runtime_error.
HttpResponse http_post_json(const std::string& url,
                            const std::string& json_body,
                            long timeout_ms = 30000,
                            const std::vector<std::string>& extra_headers = {});
